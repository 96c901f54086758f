// include/riskdesk/analytics/risk_analytics.hpp
#pragma once

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "riskdesk/analytics/analysis_types.hpp"
#include "riskdesk/core/config_base.hpp"
#include "riskdesk/core/error.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {
namespace analytics {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Analytics defaults applied when a request leaves them open
 */
struct AnalyticsConfig : public ConfigBase {
    double default_risk_free_rate{0.02};
    size_t min_correlation_samples{30};
    size_t min_beta_samples{30};
    std::string benchmark_symbol{"SPY"};  // Empty disables beta
    int default_lookback_days{365};
    bool include_correlation{true};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["default_risk_free_rate"] = default_risk_free_rate;
        j["min_correlation_samples"] = min_correlation_samples;
        j["min_beta_samples"] = min_beta_samples;
        j["benchmark_symbol"] = benchmark_symbol;
        j["default_lookback_days"] = default_lookback_days;
        j["include_correlation"] = include_correlation;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("default_risk_free_rate"))
            default_risk_free_rate = j.at("default_risk_free_rate").get<double>();
        if (j.contains("min_correlation_samples"))
            min_correlation_samples = j.at("min_correlation_samples").get<size_t>();
        if (j.contains("min_beta_samples"))
            min_beta_samples = j.at("min_beta_samples").get<size_t>();
        if (j.contains("benchmark_symbol"))
            benchmark_symbol = j.at("benchmark_symbol").get<std::string>();
        if (j.contains("default_lookback_days"))
            default_lookback_days = j.at("default_lookback_days").get<int>();
        if (j.contains("include_correlation"))
            include_correlation = j.at("include_correlation").get<bool>();
    }
};

// ============================================================================
// Return Series
// ============================================================================

/**
 * @brief Simple daily returns of a bar series
 *
 * n bars give at most n-1 returns. A return whose previous close is zero is
 * dropped, not zeroed. Bars must be ascending by date.
 */
std::vector<DatedReturn> daily_returns(const std::vector<PriceBar>& bars);

/**
 * @brief Values of a dated return series
 */
std::vector<double> return_values(const std::vector<DatedReturn>& returns);

/**
 * @brief Weighted sum of constituent returns over the dates all share
 * @param asset_returns Returns per symbol
 * @param weights Weight per symbol, symbols without returns are an error
 */
Result<std::vector<DatedReturn>> portfolio_returns(
    const std::map<std::string, std::vector<DatedReturn>>& asset_returns,
    const std::map<std::string, double>& weights);

// ============================================================================
// Statistics
// ============================================================================

double mean(const std::vector<double>& values);

/**
 * @brief Sample (n-1) standard deviation
 * @return INSUFFICIENT_DATA with fewer than two values
 */
Result<double> sample_std(const std::vector<double>& values);

/**
 * @brief Annualised volatility, sample std * sqrt(252)
 */
Result<double> annualized_volatility(const std::vector<double>& returns);

/**
 * @brief (mean * 252 - rf) / volatility, undefined at zero volatility
 */
std::optional<double> sharpe_ratio(double mean_daily_return, double volatility,
                                   double risk_free_rate);

/**
 * @brief Sharpe analogue over downside deviation only
 * @return nullopt with fewer than two negative returns or zero downside deviation
 */
std::optional<double> sortino_ratio(const std::vector<double>& returns, double risk_free_rate);

/**
 * @brief Largest peak-to-trough loss of the compounded return path
 * @return Non-positive fraction, 0 for a path that never falls
 */
double max_drawdown(const std::vector<double>& returns);

/**
 * @brief Linear interpolation quantile, as numpy's default method
 */
std::optional<double> quantile(std::vector<double> values, double q);

/**
 * @brief Historical value at risk, reported as a positive loss
 */
std::optional<double> value_at_risk(const std::vector<double>& returns,
                                    double confidence = 0.95);

/**
 * @brief Mean loss beyond the VaR threshold
 * @return nullopt when no return lies beyond the threshold
 */
std::optional<double> expected_shortfall(const std::vector<double>& returns,
                                         double confidence = 0.95);

/**
 * @brief cov(asset, benchmark) / var(benchmark) over shared dates
 */
std::optional<double> beta(const std::vector<DatedReturn>& asset,
                           const std::vector<DatedReturn>& benchmark, size_t min_samples);

/**
 * @brief Full metric set for one return series
 * @return INSUFFICIENT_DATA with fewer than two returns
 */
Result<RiskMetrics> compute_risk_metrics(const std::vector<DatedReturn>& returns,
                                         double risk_free_rate);

/**
 * @brief Pairwise Pearson correlation on the date inner join of each pair
 */
CorrelationMatrix correlation_matrix(
    const std::vector<std::string>& symbols,
    const std::map<std::string, std::vector<DatedReturn>>& asset_returns, size_t min_samples);

// ============================================================================
// Portfolio
// ============================================================================

/**
 * @brief Derive weights from dollar allocations
 *
 * Duplicate symbols are summed. Empty, negative, non-finite or zero-total
 * allocations are VALIDATION_ERROR.
 */
Result<std::map<std::string, double>> compute_weights(const std::vector<Allocation>& allocations);

/**
 * @brief P&L of one holding at a price
 */
PositionPnl position_pnl(const Holding& holding, Price current_price);

/**
 * @brief Totals over positions
 */
PortfolioPnl aggregate_pnl(std::vector<PositionPnl> positions);

/**
 * @brief Run a complete analysis over resolved series
 * @param request Allocations, range and parameters
 * @param series Resolved series per symbol, every request symbol present
 * @param benchmark Benchmark series, when beta is wanted
 * @param min_beta_samples Minimum shared observations for beta
 */
Result<AnalysisResult> analyze(const AnalysisRequest& request,
                               const std::map<std::string, PriceSeries>& series,
                               const std::optional<PriceSeries>& benchmark,
                               size_t min_beta_samples = 30);

}  // namespace analytics
}  // namespace riskdesk
