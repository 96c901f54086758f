// include/riskdesk/analytics/analysis_types.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "riskdesk/core/error.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {
namespace analytics {

// ============================================================================
// Constants
// ============================================================================

constexpr double TRADING_DAYS_PER_YEAR = 252.0;
constexpr double ZERO_VOLATILITY_EPSILON = 1e-12;
constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

// ============================================================================
// Value Types
// ============================================================================

/**
 * @brief Return observation dated with the later of the two bars
 */
struct DatedReturn {
    Timestamp date;
    double value{0.0};
};

/**
 * @brief Risk statistics of one return series
 *
 * Optional members are undefined rather than zero: a Sharpe ratio over a
 * constant price series has no value.
 */
struct RiskMetrics {
    size_t observations{0};
    double mean_return{0.0};        // Mean daily return
    double annualized_return{0.0};  // mean * 252
    double volatility{0.0};         // Annualised sample standard deviation
    std::optional<double> sharpe_ratio;
    std::optional<double> sortino_ratio;
    double max_drawdown{0.0};  // Non-positive, fraction of running peak
    std::optional<double> calmar_ratio;
    std::optional<double> var_95;
    std::optional<double> expected_shortfall_95;
    std::optional<double> beta;

    nlohmann::json to_json() const;
    static RiskMetrics from_json(const nlohmann::json& j);
};

/**
 * @brief Pairwise correlation of asset returns
 *
 * Symmetric with a unit diagonal. Pairs with too little overlap or zero
 * variance hold NaN and are listed in undefined_pairs.
 */
struct CorrelationMatrix {
    std::vector<std::string> symbols;
    std::vector<std::vector<double>> values;
    std::vector<std::vector<size_t>> observations;
    std::vector<std::pair<std::string, std::string>> undefined_pairs;

    double at(const std::string& a, const std::string& b) const;

    nlohmann::json to_json() const;
    static CorrelationMatrix from_json(const nlohmann::json& j);
};

/**
 * @brief Per-constituent view inside a portfolio analysis
 */
struct AssetMetrics {
    std::string symbol;
    double weight{0.0};
    double dollar_amount{0.0};
    RiskMetrics metrics;
};

// ============================================================================
// Request / Result
// ============================================================================

/**
 * @brief Parameters of one analysis
 *
 * Two requests with the same allocations (in any order), range and
 * parameters share a fingerprint and therefore a cache entry.
 */
struct AnalysisRequest {
    std::string label;
    std::vector<Allocation> allocations;
    DateRange range;
    double risk_free_rate{0.02};
    bool include_correlation{true};
    std::string benchmark_symbol;  // Empty disables beta
    size_t min_correlation_samples{30};

    /**
     * @brief Deterministic cache key, FNV-1a 64 over the canonical form
     */
    std::string fingerprint() const;

    /**
     * @brief Canonical text the fingerprint is computed from
     */
    std::string canonical_form() const;

    /**
     * @brief Distinct symbols, sorted
     */
    std::vector<std::string> symbols() const;
};

/**
 * @brief Output of a portfolio or single-symbol analysis
 */
struct AnalysisResult {
    std::string key;
    std::string label;
    std::vector<std::string> symbols;
    DateRange range;
    double risk_free_rate{0.0};
    Timestamp computed_at{};  // Freshest fetched_at among backing series
    Timestamp cached_at{};    // When the engine computed it, ages the cached copy

    RiskMetrics metrics;
    std::map<std::string, double> weights;
    std::vector<AssetMetrics> assets;
    std::optional<CorrelationMatrix> correlation;

    // fetched_at of every series the result was computed from, benchmark
    // included. The result is valid only while these are unchanged
    std::map<std::string, Timestamp> series_fetched_at;

    bool stale{false};
    DataWarning warning{DataWarning::NONE};
    std::string warning_message;

    nlohmann::json to_json() const;
    static Result<AnalysisResult> from_json(const nlohmann::json& j);
};

/**
 * @brief FNV-1a 64 bit hash, hex encoded
 */
std::string fnv1a_hex(const std::string& text);

}  // namespace analytics
}  // namespace riskdesk
