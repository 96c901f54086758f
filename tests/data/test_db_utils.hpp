// test_db_utils.hpp
#pragma once

#include <arrow/api.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "riskdesk/data/price_store.hpp"

namespace riskdesk {
namespace testing {

// ================= Test Data Factories =================

/**
 * @brief Bars on consecutive calendar days starting at start
 * open/high/low derive from close, volume is constant
 */
std::vector<PriceBar> make_bars(const std::string& symbol, Timestamp start,
                                const std::vector<double>& closes);

/**
 * @brief Arrow table in the store's bar schema
 */
std::shared_ptr<arrow::Table> create_test_bar_table(const std::vector<PriceBar>& bars);

// ================= Mock Price Store =================

/**
 * @brief In-memory PriceStore backend
 *
 * Shares coverage and gap logic with the PostgreSQL store through the base
 * class. Reads and writes can be made to fail to exercise degradation.
 */
class MockPriceStore : public PriceStore {
public:
    Result<std::optional<analytics::AnalysisResult>> get_analysis(const std::string& key) override;
    Result<void> put_analysis(const analytics::AnalysisResult& result) override;
    Result<size_t> invalidate_symbol(const std::string& symbol) override;
    Result<size_t> invalidate_all() override;

    void set_fail_reads(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_reads_ = fail;
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    std::vector<CoverageSpan> spans(const std::string& symbol) const;
    std::vector<PriceBar> bars(const std::string& symbol) const;
    size_t analysis_count() const;
    size_t analysis_write_count() const;
    size_t write_count() const;

protected:
    Result<std::vector<PriceBar>> load_bars(const std::string& symbol,
                                            const DateRange& range) override;
    Result<std::vector<CoverageSpan>> load_spans(const std::string& symbol,
                                                 const DateRange& range) override;
    Result<size_t> write_fetch(const std::string& symbol, const std::vector<PriceBar>& bars,
                               const SpanUpdate& spans) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<Timestamp, PriceBar>> bars_;
    std::map<std::string, std::vector<CoverageSpan>> spans_;
    std::map<std::string, analytics::AnalysisResult> analyses_;
    bool fail_reads_{false};
    bool fail_writes_{false};
    size_t writes_{0};
    size_t analysis_writes_{0};
};

}  // namespace testing
}  // namespace riskdesk
