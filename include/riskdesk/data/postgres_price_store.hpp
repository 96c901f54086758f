// include/riskdesk/data/postgres_price_store.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <pqxx/pqxx>
#include <string>
#include "riskdesk/core/config_base.hpp"
#include "riskdesk/data/connection_pool.hpp"
#include "riskdesk/data/price_store.hpp"

namespace riskdesk {

/**
 * @brief Connection settings of the PostgreSQL store, credentials excluded
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    int port{5432};
    std::string name{"riskdesk"};
    std::string schema{"riskdesk"};
    size_t pool_size{4};
    size_t max_pool_size{8};
    int acquire_timeout_ms{5000};

    /**
     * @brief libpq connection string with the given login
     */
    std::string connection_string(const std::string& username,
                                  const std::string& password) const {
        return "host=" + host + " port=" + std::to_string(port) + " dbname=" + name +
               " user=" + username + " password=" + password;
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["host"] = host;
        j["port"] = port;
        j["name"] = name;
        j["schema"] = schema;
        j["pool_size"] = pool_size;
        j["max_pool_size"] = max_pool_size;
        j["acquire_timeout_ms"] = acquire_timeout_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = j.at("port").get<int>();
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
        if (j.contains("schema"))
            schema = j.at("schema").get<std::string>();
        if (j.contains("pool_size"))
            pool_size = j.at("pool_size").get<size_t>();
        if (j.contains("max_pool_size"))
            max_pool_size = j.at("max_pool_size").get<size_t>();
        if (j.contains("acquire_timeout_ms"))
            acquire_timeout_ms = j.at("acquire_timeout_ms").get<int>();
    }
};

/**
 * @class PostgresPriceStore
 * @brief PriceStore backed by PostgreSQL
 *
 * Tables live in one schema: price_bars (symbol, date) keyed OHLCV rows,
 * coverage_spans (symbol, start_date) keyed fetch records, and
 * analysis_results keyed by fingerprint with a JSONB payload. Each operation
 * borrows a pooled connection and runs in its own transaction.
 */
class PostgresPriceStore : public PriceStore {
public:
    PostgresPriceStore(std::shared_ptr<ConnectionPool> pool, std::string schema = "riskdesk",
                       std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5));

    /**
     * @brief Create schema and tables if missing
     */
    Result<void> initialize_schema();

    Result<std::optional<analytics::AnalysisResult>> get_analysis(const std::string& key) override;

    Result<void> put_analysis(const analytics::AnalysisResult& result) override;

    Result<size_t> invalidate_symbol(const std::string& symbol) override;

    Result<size_t> invalidate_all() override;

    /**
     * @brief Convert bar rows (time, symbol, open, high, low, close, volume)
     *        into an Arrow table
     */
    static Result<std::shared_ptr<arrow::Table>> convert_to_arrow_table(
        const pqxx::result& result);

protected:
    Result<std::vector<PriceBar>> load_bars(const std::string& symbol,
                                            const DateRange& range) override;

    Result<std::vector<CoverageSpan>> load_spans(const std::string& symbol,
                                                 const DateRange& range) override;

    Result<size_t> write_fetch(const std::string& symbol, const std::vector<PriceBar>& bars,
                               const SpanUpdate& spans) override;

private:
    Result<void> validate_schema_name() const;

    std::string table(const std::string& name) const {
        return schema_ + "." + name;
    }

    std::shared_ptr<ConnectionPool> pool_;
    std::string schema_;
    std::chrono::milliseconds acquire_timeout_;
};

}  // namespace riskdesk
