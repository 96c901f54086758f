#include "riskdesk/analytics/risk_analytics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace riskdesk {
namespace analytics {

namespace {

const std::string COMPONENT = "RiskAnalytics";

/**
 * @brief Aligned values of two dated series over the dates both carry
 */
std::pair<Eigen::VectorXd, Eigen::VectorXd> inner_join(const std::vector<DatedReturn>& a,
                                                       const std::vector<DatedReturn>& b) {
    std::vector<double> left;
    std::vector<double> right;
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i].date < b[j].date) {
            ++i;
        } else if (b[j].date < a[i].date) {
            ++j;
        } else {
            left.push_back(a[i].value);
            right.push_back(b[j].value);
            ++i;
            ++j;
        }
    }

    Eigen::VectorXd x = Eigen::Map<Eigen::VectorXd>(left.data(), left.size());
    Eigen::VectorXd y = Eigen::Map<Eigen::VectorXd>(right.data(), right.size());
    return {x, y};
}

double sample_covariance(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    Eigen::VectorXd dx = x.array() - x.mean();
    Eigen::VectorXd dy = y.array() - y.mean();
    return dx.dot(dy) / static_cast<double>(x.size() - 1);
}

}  // namespace

// ============================================================================
// Return Series
// ============================================================================

std::vector<DatedReturn> daily_returns(const std::vector<PriceBar>& bars) {
    std::vector<DatedReturn> returns;
    if (bars.size() < 2) {
        return returns;
    }
    returns.reserve(bars.size() - 1);
    for (size_t i = 1; i < bars.size(); ++i) {
        double previous = bars[i - 1].close;
        if (previous == 0.0) {
            continue;
        }
        returns.push_back({bars[i].date, (bars[i].close - previous) / previous});
    }
    return returns;
}

std::vector<double> return_values(const std::vector<DatedReturn>& returns) {
    std::vector<double> values;
    values.reserve(returns.size());
    for (const auto& r : returns) {
        values.push_back(r.value);
    }
    return values;
}

Result<std::vector<DatedReturn>> portfolio_returns(
    const std::map<std::string, std::vector<DatedReturn>>& asset_returns,
    const std::map<std::string, double>& weights) {
    if (weights.empty()) {
        return make_error<std::vector<DatedReturn>>(ErrorCode::VALIDATION_ERROR,
                                                    "Portfolio has no constituents", COMPONENT);
    }

    // Count how many constituents carry each date, keeping the weighted sum
    std::map<Timestamp, std::pair<size_t, double>> by_date;
    for (const auto& [symbol, weight] : weights) {
        auto it = asset_returns.find(symbol);
        if (it == asset_returns.end()) {
            return make_error<std::vector<DatedReturn>>(
                ErrorCode::INSUFFICIENT_DATA, "No returns for constituent " + symbol, COMPONENT);
        }
        for (const auto& r : it->second) {
            auto& slot = by_date[r.date];
            slot.first++;
            slot.second += weight * r.value;
        }
    }

    std::vector<DatedReturn> combined;
    for (const auto& [date, slot] : by_date) {
        if (slot.first == weights.size()) {
            combined.push_back({date, slot.second});
        }
    }
    return Result<std::vector<DatedReturn>>(std::move(combined));
}

// ============================================================================
// Statistics
// ============================================================================

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

Result<double> sample_std(const std::vector<double>& values) {
    if (values.size() < 2) {
        return make_error<double>(ErrorCode::INSUFFICIENT_DATA,
                                  "At least 2 observations required, got " +
                                      std::to_string(values.size()),
                                  COMPONENT);
    }
    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return Result<double>(std::sqrt(sum_sq / static_cast<double>(values.size() - 1)));
}

Result<double> annualized_volatility(const std::vector<double>& returns) {
    auto std_dev = sample_std(returns);
    if (std_dev.is_error()) {
        return std_dev;
    }
    return Result<double>(std_dev.value() * std::sqrt(TRADING_DAYS_PER_YEAR));
}

std::optional<double> sharpe_ratio(double mean_daily_return, double volatility,
                                   double risk_free_rate) {
    if (std::abs(volatility) < ZERO_VOLATILITY_EPSILON) {
        return std::nullopt;
    }
    return (mean_daily_return * TRADING_DAYS_PER_YEAR - risk_free_rate) / volatility;
}

std::optional<double> sortino_ratio(const std::vector<double>& returns, double risk_free_rate) {
    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) {
            downside.push_back(r);
        }
    }

    auto downside_std = sample_std(downside);
    if (downside_std.is_error()) {
        return std::nullopt;
    }
    double downside_vol = downside_std.value() * std::sqrt(TRADING_DAYS_PER_YEAR);
    if (downside_vol < ZERO_VOLATILITY_EPSILON) {
        return std::nullopt;
    }
    return (mean(returns) * TRADING_DAYS_PER_YEAR - risk_free_rate) / downside_vol;
}

double max_drawdown(const std::vector<double>& returns) {
    double wealth = 1.0;
    double peak = 1.0;
    double worst = 0.0;
    for (double r : returns) {
        wealth *= (1.0 + r);
        peak = std::max(peak, wealth);
        if (peak > 0.0) {
            worst = std::min(worst, (wealth - peak) / peak);
        }
    }
    return worst;
}

std::optional<double> quantile(std::vector<double> values, double q) {
    if (values.empty() || q < 0.0 || q > 1.0) {
        return std::nullopt;
    }
    std::sort(values.begin(), values.end());

    double h = (static_cast<double>(values.size()) - 1.0) * q;
    auto lo = static_cast<size_t>(std::floor(h));
    size_t hi = std::min(lo + 1, values.size() - 1);
    return values[lo] + (h - static_cast<double>(lo)) * (values[hi] - values[lo]);
}

std::optional<double> value_at_risk(const std::vector<double>& returns, double confidence) {
    auto q = quantile(returns, 1.0 - confidence);
    if (!q) {
        return std::nullopt;
    }
    return -*q;
}

std::optional<double> expected_shortfall(const std::vector<double>& returns, double confidence) {
    auto var = value_at_risk(returns, confidence);
    if (!var) {
        return std::nullopt;
    }

    std::vector<double> tail;
    for (double r : returns) {
        if (r < -*var) {
            tail.push_back(r);
        }
    }
    if (tail.empty()) {
        return std::nullopt;
    }
    return -mean(tail);
}

std::optional<double> beta(const std::vector<DatedReturn>& asset,
                           const std::vector<DatedReturn>& benchmark, size_t min_samples) {
    auto [x, y] = inner_join(asset, benchmark);
    if (x.size() < 2 || static_cast<size_t>(x.size()) < min_samples) {
        return std::nullopt;
    }

    double benchmark_variance = sample_covariance(y, y);
    if (std::abs(benchmark_variance) < ZERO_VOLATILITY_EPSILON) {
        return std::nullopt;
    }
    return sample_covariance(x, y) / benchmark_variance;
}

Result<RiskMetrics> compute_risk_metrics(const std::vector<DatedReturn>& returns,
                                         double risk_free_rate) {
    std::vector<double> values = return_values(returns);

    auto volatility = annualized_volatility(values);
    if (volatility.is_error()) {
        return forward_error<RiskMetrics>(volatility);
    }

    RiskMetrics metrics;
    metrics.observations = values.size();
    metrics.mean_return = mean(values);
    metrics.annualized_return = metrics.mean_return * TRADING_DAYS_PER_YEAR;
    metrics.volatility = volatility.value();
    metrics.sharpe_ratio = sharpe_ratio(metrics.mean_return, metrics.volatility, risk_free_rate);
    metrics.sortino_ratio = sortino_ratio(values, risk_free_rate);
    metrics.max_drawdown = max_drawdown(values);
    if (std::abs(metrics.max_drawdown) > 0.0) {
        metrics.calmar_ratio = metrics.annualized_return / std::abs(metrics.max_drawdown);
    }
    metrics.var_95 = value_at_risk(values, 0.95);
    metrics.expected_shortfall_95 = expected_shortfall(values, 0.95);
    return Result<RiskMetrics>(std::move(metrics));
}

CorrelationMatrix correlation_matrix(
    const std::vector<std::string>& symbols,
    const std::map<std::string, std::vector<DatedReturn>>& asset_returns, size_t min_samples) {
    const size_t n = symbols.size();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CorrelationMatrix matrix;
    matrix.symbols = symbols;
    matrix.values.assign(n, std::vector<double>(n, nan));
    matrix.observations.assign(n, std::vector<size_t>(n, 0));

    static const std::vector<DatedReturn> no_returns;
    auto returns_of = [&asset_returns](const std::string& symbol) -> const std::vector<DatedReturn>& {
        auto it = asset_returns.find(symbol);
        return it == asset_returns.end() ? no_returns : it->second;
    };

    for (size_t i = 0; i < n; ++i) {
        matrix.values[i][i] = 1.0;
        matrix.observations[i][i] = returns_of(symbols[i]).size();

        for (size_t j = i + 1; j < n; ++j) {
            auto [x, y] = inner_join(returns_of(symbols[i]), returns_of(symbols[j]));
            size_t samples = static_cast<size_t>(x.size());
            matrix.observations[i][j] = samples;
            matrix.observations[j][i] = samples;

            double value = nan;
            if (samples >= std::max<size_t>(min_samples, 2)) {
                double var_x = sample_covariance(x, x);
                double var_y = sample_covariance(y, y);
                if (var_x > ZERO_VOLATILITY_EPSILON && var_y > ZERO_VOLATILITY_EPSILON) {
                    value = sample_covariance(x, y) / std::sqrt(var_x * var_y);
                    value = std::max(-1.0, std::min(1.0, value));
                }
            }

            matrix.values[i][j] = value;
            matrix.values[j][i] = value;
            if (std::isnan(value)) {
                matrix.undefined_pairs.emplace_back(symbols[i], symbols[j]);
            }
        }
    }
    return matrix;
}

// ============================================================================
// Portfolio
// ============================================================================

Result<std::map<std::string, double>> compute_weights(const std::vector<Allocation>& allocations) {
    if (allocations.empty()) {
        return make_error<std::map<std::string, double>>(ErrorCode::VALIDATION_ERROR,
                                                         "No allocations given", COMPONENT);
    }

    std::map<std::string, double> amounts;
    double total = 0.0;
    for (const auto& allocation : allocations) {
        if (!std::isfinite(allocation.dollar_amount) || allocation.dollar_amount < 0.0) {
            return make_error<std::map<std::string, double>>(
                ErrorCode::VALIDATION_ERROR,
                "Invalid allocation for " + allocation.symbol + ": " +
                    std::to_string(allocation.dollar_amount),
                COMPONENT);
        }
        amounts[allocation.symbol] += allocation.dollar_amount;
        total += allocation.dollar_amount;
    }

    if (total <= 0.0) {
        return make_error<std::map<std::string, double>>(
            ErrorCode::VALIDATION_ERROR, "Total allocation must be positive", COMPONENT);
    }

    std::map<std::string, double> weights;
    double weight_sum = 0.0;
    for (const auto& [symbol, amount] : amounts) {
        weights[symbol] = amount / total;
        weight_sum += weights[symbol];
    }

    if (std::abs(weight_sum - 1.0) > WEIGHT_SUM_TOLERANCE) {
        return make_error<std::map<std::string, double>>(
            ErrorCode::VALIDATION_ERROR,
            "Weights sum to " + std::to_string(weight_sum) + ", expected 1", COMPONENT);
    }
    return Result<std::map<std::string, double>>(std::move(weights));
}

PositionPnl position_pnl(const Holding& holding, Price current_price) {
    PositionPnl pnl;
    pnl.symbol = holding.symbol;
    pnl.quantity = holding.quantity;
    pnl.cost_basis = holding.cost_basis;
    pnl.current_price = current_price;
    pnl.market_value = current_price * holding.quantity;
    pnl.pnl = pnl.market_value - holding.cost_basis;
    if (holding.cost_basis > 0.0) {
        pnl.pnl_percent = pnl.pnl / holding.cost_basis * 100.0;
    }
    return pnl;
}

PortfolioPnl aggregate_pnl(std::vector<PositionPnl> positions) {
    PortfolioPnl portfolio;
    for (const auto& position : positions) {
        portfolio.total_cost += position.cost_basis;
        portfolio.total_value += position.market_value;
        portfolio.stale = portfolio.stale || position.stale;
    }
    portfolio.total_pnl = portfolio.total_value - portfolio.total_cost;
    if (portfolio.total_cost > 0.0) {
        portfolio.pnl_percent = portfolio.total_pnl / portfolio.total_cost * 100.0;
    }
    portfolio.positions = std::move(positions);
    return portfolio;
}

Result<AnalysisResult> analyze(const AnalysisRequest& request,
                               const std::map<std::string, PriceSeries>& series,
                               const std::optional<PriceSeries>& benchmark,
                               size_t min_beta_samples) {
    auto weights = compute_weights(request.allocations);
    if (weights.is_error()) {
        return forward_error<AnalysisResult>(weights);
    }

    AnalysisResult result;
    result.key = request.fingerprint();
    result.label = request.label;
    result.symbols = request.symbols();
    result.range = request.range;
    result.risk_free_rate = request.risk_free_rate;
    result.weights = weights.value();

    std::vector<DatedReturn> benchmark_returns;
    if (benchmark) {
        benchmark_returns = daily_returns(benchmark->bars);
        result.series_fetched_at[benchmark->symbol] = benchmark->fetched_at;
        result.computed_at = benchmark->fetched_at;
    }

    std::map<std::string, double> dollars;
    for (const auto& allocation : request.allocations) {
        dollars[allocation.symbol] += allocation.dollar_amount;
    }

    std::map<std::string, std::vector<DatedReturn>> asset_returns;
    for (const auto& symbol : result.symbols) {
        auto it = series.find(symbol);
        if (it == series.end()) {
            return make_error<AnalysisResult>(ErrorCode::INSUFFICIENT_DATA,
                                              "No price series for " + symbol, COMPONENT);
        }

        result.series_fetched_at[symbol] = it->second.fetched_at;
        result.computed_at = std::max(result.computed_at, it->second.fetched_at);

        auto returns = daily_returns(it->second.bars);
        auto metrics = compute_risk_metrics(returns, request.risk_free_rate);
        if (metrics.is_error()) {
            return make_error<AnalysisResult>(
                metrics.error()->code(),
                "Cannot analyse " + symbol + ": " + std::string(metrics.error()->what()),
                COMPONENT);
        }

        AssetMetrics asset;
        asset.symbol = symbol;
        asset.weight = result.weights.at(symbol);
        asset.dollar_amount = dollars[symbol];
        asset.metrics = metrics.value();
        if (benchmark) {
            asset.metrics.beta = beta(returns, benchmark_returns, min_beta_samples);
        }
        result.assets.push_back(std::move(asset));
        asset_returns[symbol] = std::move(returns);
    }

    auto combined = portfolio_returns(asset_returns, result.weights);
    if (combined.is_error()) {
        return forward_error<AnalysisResult>(combined);
    }

    auto portfolio_metrics = compute_risk_metrics(combined.value(), request.risk_free_rate);
    if (portfolio_metrics.is_error()) {
        return make_error<AnalysisResult>(
            portfolio_metrics.error()->code(),
            "Too few common dates across constituents: " +
                std::string(portfolio_metrics.error()->what()),
            COMPONENT);
    }
    result.metrics = portfolio_metrics.value();
    if (benchmark) {
        result.metrics.beta = beta(combined.value(), benchmark_returns, min_beta_samples);
    }

    if (request.include_correlation && result.symbols.size() > 1) {
        result.correlation =
            correlation_matrix(result.symbols, asset_returns, request.min_correlation_samples);
    }

    return Result<AnalysisResult>(std::move(result));
}

}  // namespace analytics
}  // namespace riskdesk
