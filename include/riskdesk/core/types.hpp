// include/riskdesk/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace riskdesk {

/**
 * @brief Timestamp type for consistent time representation
 * Bar dates are Timestamps normalised to 00:00:00 UTC
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for holdings, fractional shares allowed
 */
using Quantity = double;

/**
 * @brief One trading day
 */
using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

/**
 * @brief Freshness class of a cached value
 */
enum class TtlClass {
    LIVE,        // Quotes, seconds to minutes
    HISTORICAL,  // Daily bars, day scale for the open trading day
    ANALYSIS     // Computed metrics, day scale
};

inline std::string ttl_class_to_string(TtlClass ttl_class) {
    switch (ttl_class) {
        case TtlClass::LIVE:
            return "LIVE";
        case TtlClass::HISTORICAL:
            return "HISTORICAL";
        case TtlClass::ANALYSIS:
            return "ANALYSIS";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Warning attached to otherwise successful data
 */
enum class DataWarning {
    NONE,
    STALE_DATA_RETURNED  // Refresh failed, previously cached data served instead
};

/**
 * @brief Daily OHLCV bar
 * Unique per (symbol, date)
 */
struct PriceBar {
    std::string symbol;
    Timestamp date;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    PriceBar() = default;
    PriceBar(std::string s, Timestamp d, Price o, Price h, Price l, Price c, double v)
        : symbol(std::move(s)), date(d), open(o), high(h), low(l), close(c), volume(v) {}

    bool same_values(const PriceBar& other) const {
        return open == other.open && high == other.high && low == other.low &&
               close == other.close && volume == other.volume;
    }

    bool operator==(const PriceBar& other) const {
        return symbol == other.symbol && date == other.date && same_values(other);
    }
};

/**
 * @brief Inclusive day-granular date range
 */
struct DateRange {
    Timestamp start;
    Timestamp end;

    DateRange() = default;
    DateRange(Timestamp s, Timestamp e) : start(s), end(e) {}

    bool is_valid() const {
        return start <= end;
    }

    bool contains(Timestamp date) const {
        return date >= start && date <= end;
    }

    bool covers(const DateRange& other) const {
        return start <= other.start && end >= other.end;
    }

    bool overlaps(const DateRange& other) const {
        return start <= other.end && other.start <= end;
    }

    bool operator==(const DateRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const DateRange& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Ordered bars for one symbol over a requested range
 * A view over stored bars, never persisted as such
 */
struct PriceSeries {
    std::string symbol;
    DateRange range;
    std::vector<PriceBar> bars;  // Ascending by date, unique dates
    Timestamp fetched_at{};      // Most recent provider fetch backing the series

    bool empty() const {
        return bars.empty();
    }
    size_t size() const {
        return bars.size();
    }

    /**
     * @brief Copy of the bars falling inside a sub-range
     */
    PriceSeries slice(const DateRange& sub) const {
        PriceSeries out;
        out.symbol = symbol;
        out.range = sub;
        out.fetched_at = fetched_at;
        for (const auto& bar : bars) {
            if (sub.contains(bar.date)) {
                out.bars.push_back(bar);
            }
        }
        return out;
    }
};

/**
 * @brief Record that a provider fetch covered a range at a point in time
 */
struct CoverageSpan {
    std::string symbol;
    DateRange range;
    Timestamp fetched_at{};
};

/**
 * @brief Series handed back to callers, with staleness surfaced
 */
struct SeriesResult {
    PriceSeries series;
    bool stale{false};
    DataWarning warning{DataWarning::NONE};
    std::string warning_message;
};

/**
 * @brief Latest quote, with staleness surfaced
 */
struct QuoteResult {
    PriceBar quote;
    Timestamp fetched_at{};
    bool stale{false};
    DataWarning warning{DataWarning::NONE};
    std::string warning_message;
};

/**
 * @brief Dollar allocation to one symbol, input to portfolio analytics
 */
struct Allocation {
    std::string symbol;
    double dollar_amount{0.0};
};

/**
 * @brief Position held, input to P&L
 */
struct Holding {
    std::string symbol;
    Quantity quantity{0.0};
    double cost_basis{0.0};  // Total amount paid
};

/**
 * @brief P&L of one holding at the current quote
 */
struct PositionPnl {
    std::string symbol;
    Quantity quantity{0.0};
    double cost_basis{0.0};
    Price current_price{0.0};
    double market_value{0.0};
    double pnl{0.0};
    std::optional<double> pnl_percent;
    bool stale{false};
};

/**
 * @brief Portfolio level P&L
 */
struct PortfolioPnl {
    std::vector<PositionPnl> positions;
    double total_cost{0.0};
    double total_value{0.0};
    double total_pnl{0.0};
    std::optional<double> pnl_percent;
    bool stale{false};
};

}  // namespace riskdesk
