// src/data/postgres_price_store.cpp

#include "riskdesk/data/postgres_price_store.hpp"
#include <regex>
#include <set>
#include "riskdesk/core/logger.hpp"
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/data/conversion_utils.hpp"

namespace riskdesk {

namespace {

const std::string COMPONENT = "PostgresPriceStore";

std::string format_timestamptz(Timestamp ts) {
    return core::format_timestamp(ts) + "+00";
}

std::string symbols_column(const analytics::AnalysisResult& result) {
    std::set<std::string> symbols(result.symbols.begin(), result.symbols.end());
    for (const auto& [symbol, fetched_at] : result.series_fetched_at) {
        symbols.insert(symbol);
    }
    std::string column = ",";
    for (const auto& symbol : symbols) {
        column += symbol + ",";
    }
    return column;
}

}  // namespace

PostgresPriceStore::PostgresPriceStore(std::shared_ptr<ConnectionPool> pool, std::string schema,
                                       std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), schema_(std::move(schema)), acquire_timeout_(acquire_timeout) {}

Result<void> PostgresPriceStore::validate_schema_name() const {
    static const std::regex schema_pattern(R"(^[a-z_][a-z0-9_]{0,62}$)");
    if (!std::regex_match(schema_, schema_pattern)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Invalid schema name: " + schema_,
                                COMPONENT);
    }
    return Result<void>();
}

Result<void> PostgresPriceStore::initialize_schema() {
    Logger::register_component(COMPONENT);

    auto schema_check = validate_schema_name();
    if (schema_check.is_error()) {
        return schema_check;
    }

    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "No database connection available",
                                COMPONENT);
    }

    try {
        pqxx::work txn(*connection);
        txn.exec("CREATE SCHEMA IF NOT EXISTS " + schema_);
        txn.exec("CREATE TABLE IF NOT EXISTS " + table("price_bars") +
                 " (symbol TEXT NOT NULL,"
                 " date DATE NOT NULL,"
                 " open DOUBLE PRECISION NOT NULL,"
                 " high DOUBLE PRECISION NOT NULL,"
                 " low DOUBLE PRECISION NOT NULL,"
                 " close DOUBLE PRECISION NOT NULL,"
                 " volume DOUBLE PRECISION NOT NULL,"
                 " updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
                 " PRIMARY KEY (symbol, date))");
        txn.exec("CREATE TABLE IF NOT EXISTS " + table("coverage_spans") +
                 " (symbol TEXT NOT NULL,"
                 " start_date DATE NOT NULL,"
                 " end_date DATE NOT NULL,"
                 " fetched_at TIMESTAMPTZ NOT NULL,"
                 " PRIMARY KEY (symbol, start_date),"
                 " CHECK (start_date <= end_date))");
        txn.exec("CREATE TABLE IF NOT EXISTS " + table("analysis_results") +
                 " (key TEXT PRIMARY KEY,"
                 " symbols TEXT NOT NULL,"
                 " computed_at TIMESTAMPTZ NOT NULL,"
                 " payload JSONB NOT NULL,"
                 " updated_at TIMESTAMPTZ NOT NULL DEFAULT now())");
        txn.commit();
        INFO("Schema " << schema_ << " ready");
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to initialize schema: " + std::string(e.what()),
                                COMPONENT);
    }
}

Result<std::vector<PriceBar>> PostgresPriceStore::load_bars(const std::string& symbol,
                                                            const DateRange& range) {
    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<std::vector<PriceBar>>(ErrorCode::CONNECTION_ERROR,
                                                 "No database connection available", COMPONENT);
    }

    pqxx::result rows;
    try {
        pqxx::read_transaction txn(*connection);
        rows = txn.exec_params(
            "SELECT EXTRACT(EPOCH FROM date::timestamp)::bigint AS time, symbol, open, high, "
            "low, close, volume FROM " +
                table("price_bars") +
                " WHERE symbol = $1 AND date BETWEEN $2::date AND $3::date ORDER BY date",
            symbol, core::format_date(range.start), core::format_date(range.end));
        txn.commit();
    } catch (const std::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::DATABASE_ERROR, "Failed to load bars: " + std::string(e.what()), COMPONENT);
    }

    auto table_result = convert_to_arrow_table(rows);
    if (table_result.is_error()) {
        return forward_error<std::vector<PriceBar>>(table_result);
    }
    return DataConversionUtils::arrow_table_to_bars(table_result.value());
}

Result<std::vector<CoverageSpan>> PostgresPriceStore::load_spans(const std::string& symbol,
                                                                 const DateRange& range) {
    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<std::vector<CoverageSpan>>(ErrorCode::CONNECTION_ERROR,
                                                     "No database connection available",
                                                     COMPONENT);
    }

    try {
        pqxx::read_transaction txn(*connection);
        auto rows = txn.exec_params(
            "SELECT to_char(start_date, 'YYYY-MM-DD') AS start_date, "
            "to_char(end_date, 'YYYY-MM-DD') AS end_date, "
            "EXTRACT(EPOCH FROM fetched_at)::bigint AS fetched_epoch FROM " +
                table("coverage_spans") +
                " WHERE symbol = $1 AND start_date <= $3::date AND end_date >= $2::date"
                " ORDER BY start_date",
            symbol, core::format_date(range.start), core::format_date(range.end));
        txn.commit();

        std::vector<CoverageSpan> spans;
        spans.reserve(rows.size());
        for (const auto& row : rows) {
            auto start = core::parse_date(row["start_date"].as<std::string>());
            auto end = core::parse_date(row["end_date"].as<std::string>());
            if (!start || !end) {
                return make_error<std::vector<CoverageSpan>>(
                    ErrorCode::CONVERSION_ERROR, "Unparseable span dates for " + symbol,
                    COMPONENT);
            }
            spans.push_back({symbol, DateRange(*start, *end),
                             core::from_epoch_seconds(row["fetched_epoch"].as<int64_t>())});
        }
        return Result<std::vector<CoverageSpan>>(std::move(spans));
    } catch (const std::exception& e) {
        return make_error<std::vector<CoverageSpan>>(
            ErrorCode::DATABASE_ERROR, "Failed to load coverage: " + std::string(e.what()),
            COMPONENT);
    }
}

Result<size_t> PostgresPriceStore::write_fetch(const std::string& symbol,
                                               const std::vector<PriceBar>& bars,
                                               const SpanUpdate& spans) {
    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<size_t>(ErrorCode::CONNECTION_ERROR, "No database connection available",
                                  COMPONENT);
    }

    const std::string upsert_bar =
        "INSERT INTO " + table("price_bars") +
        " (symbol, date, open, high, low, close, volume, updated_at)"
        " VALUES ($1, $2::date, $3, $4, $5, $6, $7, now())"
        " ON CONFLICT (symbol, date) DO UPDATE SET"
        " open = EXCLUDED.open, high = EXCLUDED.high, low = EXCLUDED.low,"
        " close = EXCLUDED.close, volume = EXCLUDED.volume, updated_at = now()"
        " WHERE (price_bars.open, price_bars.high, price_bars.low, price_bars.close,"
        " price_bars.volume) IS DISTINCT FROM (EXCLUDED.open, EXCLUDED.high, EXCLUDED.low,"
        " EXCLUDED.close, EXCLUDED.volume)";

    try {
        pqxx::work txn(*connection);

        size_t changed = 0;
        for (const auto& bar : bars) {
            auto result = txn.exec_params(upsert_bar, symbol, core::format_date(bar.date),
                                          bar.open, bar.high, bar.low, bar.close, bar.volume);
            changed += static_cast<size_t>(result.affected_rows());
        }

        for (const auto& span : spans.superseded) {
            txn.exec_params("DELETE FROM " + table("coverage_spans") +
                                " WHERE symbol = $1 AND start_date = $2::date",
                            symbol, core::format_date(span.range.start));
        }
        for (const auto& span : spans.inserted) {
            txn.exec_params("INSERT INTO " + table("coverage_spans") +
                                " (symbol, start_date, end_date, fetched_at)"
                                " VALUES ($1, $2::date, $3::date, $4::timestamptz)",
                            symbol, core::format_date(span.range.start),
                            core::format_date(span.range.end), format_timestamptz(span.fetched_at));
        }

        txn.commit();
        DEBUG("Stored " << changed << " changed bars for " << symbol << " across "
                        << spans.inserted.size() << " spans");
        return Result<size_t>(changed);
    } catch (const std::exception& e) {
        return make_error<size_t>(ErrorCode::DATABASE_ERROR,
                                  "Failed to store fetch for " + symbol + ": " + e.what(),
                                  COMPONENT);
    }
}

Result<std::optional<analytics::AnalysisResult>> PostgresPriceStore::get_analysis(
    const std::string& key) {
    using Lookup = std::optional<analytics::AnalysisResult>;

    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<Lookup>(ErrorCode::CONNECTION_ERROR, "No database connection available",
                                  COMPONENT);
    }

    std::string payload;
    try {
        pqxx::read_transaction txn(*connection);
        auto rows = txn.exec_params(
            "SELECT payload::text AS payload FROM " + table("analysis_results") + " WHERE key = $1",
            key);
        txn.commit();
        if (rows.empty()) {
            return Result<Lookup>(Lookup());
        }
        payload = rows[0]["payload"].as<std::string>();
    } catch (const std::exception& e) {
        return make_error<Lookup>(ErrorCode::DATABASE_ERROR,
                                  "Failed to load analysis " + key + ": " + e.what(), COMPONENT);
    }

    nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        return make_error<Lookup>(ErrorCode::JSON_PARSE_ERROR,
                                  "Stored analysis " + key + " is not valid JSON", COMPONENT);
    }

    auto parsed = analytics::AnalysisResult::from_json(j);
    if (parsed.is_error()) {
        return forward_error<Lookup>(parsed);
    }
    return Result<Lookup>(Lookup(parsed.value()));
}

Result<void> PostgresPriceStore::put_analysis(const analytics::AnalysisResult& result) {
    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "No database connection available",
                                COMPONENT);
    }

    try {
        pqxx::work txn(*connection);
        txn.exec_params("INSERT INTO " + table("analysis_results") +
                            " (key, symbols, computed_at, payload, updated_at)"
                            " VALUES ($1, $2, $3::timestamptz, $4::jsonb, now())"
                            " ON CONFLICT (key) DO UPDATE SET symbols = EXCLUDED.symbols,"
                            " computed_at = EXCLUDED.computed_at, payload = EXCLUDED.payload,"
                            " updated_at = now()",
                        result.key, symbols_column(result), format_timestamptz(result.computed_at),
                        result.to_json().dump());
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store analysis " + result.key + ": " + e.what(),
                                COMPONENT);
    }
}

Result<size_t> PostgresPriceStore::invalidate_symbol(const std::string& symbol) {
    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<size_t>(ErrorCode::CONNECTION_ERROR, "No database connection available",
                                  COMPONENT);
    }

    try {
        pqxx::work txn(*connection);
        auto spans = txn.exec_params("DELETE FROM " + table("coverage_spans") + " WHERE symbol = $1",
                                     symbol);
        auto analyses = txn.exec_params("DELETE FROM " + table("analysis_results") +
                                            " WHERE position(',' || $1 || ',' in symbols) > 0",
                                        symbol);
        txn.commit();
        return Result<size_t>(static_cast<size_t>(spans.affected_rows() + analyses.affected_rows()));
    } catch (const std::exception& e) {
        return make_error<size_t>(ErrorCode::DATABASE_ERROR,
                                  "Failed to invalidate " + symbol + ": " + e.what(), COMPONENT);
    }
}

Result<size_t> PostgresPriceStore::invalidate_all() {
    auto connection = pool_->acquire(acquire_timeout_);
    if (!connection) {
        return make_error<size_t>(ErrorCode::CONNECTION_ERROR, "No database connection available",
                                  COMPONENT);
    }

    try {
        pqxx::work txn(*connection);
        auto spans = txn.exec("DELETE FROM " + table("coverage_spans"));
        auto analyses = txn.exec("DELETE FROM " + table("analysis_results"));
        txn.commit();
        return Result<size_t>(static_cast<size_t>(spans.affected_rows() + analyses.affected_rows()));
    } catch (const std::exception& e) {
        return make_error<size_t>(ErrorCode::DATABASE_ERROR,
                                  "Failed to invalidate store: " + std::string(e.what()),
                                  COMPONENT);
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresPriceStore::convert_to_arrow_table(
    const pqxx::result& result) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::TimestampBuilder timestamp_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::StringBuilder symbol_builder(pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::DoubleBuilder volume_builder(pool);

    auto handle_builder_error = [](const std::string& operation) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Arrow builder error during " + operation, COMPONENT);
    };

    try {
        const auto rows = static_cast<int64_t>(result.size());
        if (!timestamp_builder.Reserve(rows).ok() || !symbol_builder.Reserve(rows).ok() ||
            !open_builder.Reserve(rows).ok() || !high_builder.Reserve(rows).ok() ||
            !low_builder.Reserve(rows).ok() || !close_builder.Reserve(rows).ok() ||
            !volume_builder.Reserve(rows).ok()) {
            return handle_builder_error("reserve");
        }

        for (const auto& row : result) {
            if (!timestamp_builder.Append(row["time"].as<int64_t>()).ok() ||
                !symbol_builder.Append(row["symbol"].as<std::string>()).ok() ||
                !open_builder.Append(row["open"].as<double>()).ok() ||
                !high_builder.Append(row["high"].as<double>()).ok() ||
                !low_builder.Append(row["low"].as<double>()).ok() ||
                !close_builder.Append(row["close"].as<double>()).ok() ||
                !volume_builder.Append(row["volume"].as<double>()).ok()) {
                return handle_builder_error("append");
            }
        }

        std::shared_ptr<arrow::Array> timestamp_array, symbol_array, open_array, high_array,
            low_array, close_array, volume_array;

        if (!timestamp_builder.Finish(&timestamp_array).ok() ||
            !symbol_builder.Finish(&symbol_array).ok() || !open_builder.Finish(&open_array).ok() ||
            !high_builder.Finish(&high_array).ok() || !low_builder.Finish(&low_array).ok() ||
            !close_builder.Finish(&close_array).ok() ||
            !volume_builder.Finish(&volume_array).ok()) {
            return handle_builder_error("finish");
        }

        auto table = arrow::Table::Make(DataConversionUtils::bar_schema(),
                                        {timestamp_array, symbol_array, open_array, high_array,
                                         low_array, close_array, volume_array});
        return Result<std::shared_ptr<arrow::Table>>(table);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during Arrow table conversion: " + std::string(e.what()), COMPONENT);
    }
}

}  // namespace riskdesk
