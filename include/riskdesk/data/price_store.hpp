// include/riskdesk/data/price_store.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "riskdesk/analytics/analysis_types.hpp"
#include "riskdesk/core/error.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {

/**
 * @brief Outcome of a store read over a requested range
 */
struct StoreRead {
    PriceSeries series;                // Stored bars inside the request
    std::vector<DateRange> gaps;       // Sub-ranges no coverage span holds
    std::vector<CoverageSpan> spans;   // Spans intersecting the request, ascending

    bool is_full_hit() const {
        return gaps.empty();
    }

    bool is_miss() const {
        return spans.empty();
    }
};

/**
 * @brief Change set applied by one write-back
 */
struct SpanUpdate {
    std::vector<CoverageSpan> superseded;  // Rows to remove
    std::vector<CoverageSpan> inserted;    // Rows to add, remainders included
};

/**
 * @brief Durable store of daily bars, coverage spans and analysis results
 *
 * Coverage and gap logic is shared by every backend and lives here;
 * backends only provide row-level primitives. Bars are never deleted:
 * invalidation removes coverage, which forces a refetch that overwrites.
 */
class PriceStore {
public:
    virtual ~PriceStore() = default;

    /**
     * @brief Read stored bars and coverage for a range
     * @param symbol Normalised symbol
     * @param range Inclusive day range
     */
    Result<StoreRead> get(const std::string& symbol, const DateRange& range);

    /**
     * @brief Persist a fetched series and record its coverage
     *
     * Identical bars are left untouched, differing bars are overwritten.
     * Older spans overlapping series.range are trimmed so spans never overlap.
     * @return Number of bars inserted or changed
     */
    Result<size_t> put(const PriceSeries& series, Timestamp fetched_at);

    /**
     * @brief Look up a stored analysis by fingerprint
     */
    virtual Result<std::optional<analytics::AnalysisResult>> get_analysis(
        const std::string& key) = 0;

    /**
     * @brief Insert or replace an analysis keyed by its fingerprint
     */
    virtual Result<void> put_analysis(const analytics::AnalysisResult& result) = 0;

    /**
     * @brief Drop coverage and analyses involving a symbol
     * @return Rows removed
     */
    virtual Result<size_t> invalidate_symbol(const std::string& symbol) = 0;

    /**
     * @brief Drop all coverage and analyses
     * @return Rows removed
     */
    virtual Result<size_t> invalidate_all() = 0;

    /**
     * @brief Uncovered sub-ranges of a request given ascending spans
     */
    static std::vector<DateRange> compute_gaps(const DateRange& range,
                                               const std::vector<CoverageSpan>& spans);

    /**
     * @brief Span rows to remove and insert when new coverage lands
     */
    static SpanUpdate plan_span_update(const std::vector<CoverageSpan>& existing,
                                       const CoverageSpan& incoming);

protected:
    /**
     * @brief Bars of a symbol inside a range, ascending by date
     */
    virtual Result<std::vector<PriceBar>> load_bars(const std::string& symbol,
                                                    const DateRange& range) = 0;

    /**
     * @brief Spans of a symbol intersecting a range, ascending by start
     */
    virtual Result<std::vector<CoverageSpan>> load_spans(const std::string& symbol,
                                                         const DateRange& range) = 0;

    /**
     * @brief Upsert bars and apply a span change set atomically
     * @return Number of bars inserted or changed
     */
    virtual Result<size_t> write_fetch(const std::string& symbol,
                                       const std::vector<PriceBar>& bars,
                                       const SpanUpdate& spans) = 0;
};

}  // namespace riskdesk
