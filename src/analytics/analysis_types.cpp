#include "riskdesk/analytics/analysis_types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <set>
#include <sstream>
#include "riskdesk/core/time_utils.hpp"

namespace riskdesk {
namespace analytics {

namespace {

nlohmann::json optional_to_json(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) {
        return nullptr;
    }
    return *value;
}

std::optional<double> optional_from_json(const nlohmann::json& j, const char* field) {
    if (!j.contains(field) || j.at(field).is_null()) {
        return std::nullopt;
    }
    return j.at(field).get<double>();
}

std::string format_fixed(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.10f", value);
    return std::string(buffer);
}

}  // namespace

std::string fnv1a_hex(const std::string& text) {
    constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    uint64_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= FNV_PRIME;
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buffer);
}

// ============================================================================
// RiskMetrics
// ============================================================================

nlohmann::json RiskMetrics::to_json() const {
    nlohmann::json j;
    j["observations"] = observations;
    j["mean_return"] = mean_return;
    j["annualized_return"] = annualized_return;
    j["volatility"] = volatility;
    j["sharpe_ratio"] = optional_to_json(sharpe_ratio);
    j["sortino_ratio"] = optional_to_json(sortino_ratio);
    j["max_drawdown"] = max_drawdown;
    j["calmar_ratio"] = optional_to_json(calmar_ratio);
    j["var_95"] = optional_to_json(var_95);
    j["expected_shortfall_95"] = optional_to_json(expected_shortfall_95);
    j["beta"] = optional_to_json(beta);
    return j;
}

RiskMetrics RiskMetrics::from_json(const nlohmann::json& j) {
    RiskMetrics m;
    m.observations = j.at("observations").get<size_t>();
    m.mean_return = j.at("mean_return").get<double>();
    m.annualized_return = j.value("annualized_return", m.mean_return * TRADING_DAYS_PER_YEAR);
    m.volatility = j.at("volatility").get<double>();
    m.sharpe_ratio = optional_from_json(j, "sharpe_ratio");
    m.sortino_ratio = optional_from_json(j, "sortino_ratio");
    m.max_drawdown = j.value("max_drawdown", 0.0);
    m.calmar_ratio = optional_from_json(j, "calmar_ratio");
    m.var_95 = optional_from_json(j, "var_95");
    m.expected_shortfall_95 = optional_from_json(j, "expected_shortfall_95");
    m.beta = optional_from_json(j, "beta");
    return m;
}

// ============================================================================
// CorrelationMatrix
// ============================================================================

double CorrelationMatrix::at(const std::string& a, const std::string& b) const {
    auto ia = std::find(symbols.begin(), symbols.end(), a);
    auto ib = std::find(symbols.begin(), symbols.end(), b);
    if (ia == symbols.end() || ib == symbols.end()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return values[static_cast<size_t>(ia - symbols.begin())]
                 [static_cast<size_t>(ib - symbols.begin())];
}

nlohmann::json CorrelationMatrix::to_json() const {
    nlohmann::json j;
    j["symbols"] = symbols;

    // NaN has no JSON form, undefined pairs are written as null
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : values) {
        nlohmann::json out_row = nlohmann::json::array();
        for (double v : row) {
            out_row.push_back(std::isfinite(v) ? nlohmann::json(v) : nlohmann::json(nullptr));
        }
        rows.push_back(out_row);
    }
    j["values"] = rows;
    j["observations"] = observations;

    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& [a, b] : undefined_pairs) {
        pairs.push_back({a, b});
    }
    j["undefined_pairs"] = pairs;
    return j;
}

CorrelationMatrix CorrelationMatrix::from_json(const nlohmann::json& j) {
    CorrelationMatrix m;
    m.symbols = j.at("symbols").get<std::vector<std::string>>();
    for (const auto& row : j.at("values")) {
        std::vector<double> out_row;
        for (const auto& v : row) {
            out_row.push_back(v.is_null() ? std::numeric_limits<double>::quiet_NaN()
                                          : v.get<double>());
        }
        m.values.push_back(std::move(out_row));
    }
    if (j.contains("observations")) {
        m.observations = j.at("observations").get<std::vector<std::vector<size_t>>>();
    }
    if (j.contains("undefined_pairs")) {
        for (const auto& pair : j.at("undefined_pairs")) {
            m.undefined_pairs.emplace_back(pair.at(0).get<std::string>(),
                                           pair.at(1).get<std::string>());
        }
    }
    return m;
}

// ============================================================================
// AnalysisRequest
// ============================================================================

std::vector<std::string> AnalysisRequest::symbols() const {
    std::set<std::string> unique;
    for (const auto& allocation : allocations) {
        unique.insert(allocation.symbol);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::string AnalysisRequest::canonical_form() const {
    std::map<std::string, double> amounts;
    double total = 0.0;
    for (const auto& allocation : allocations) {
        amounts[allocation.symbol] += allocation.dollar_amount;
        total += allocation.dollar_amount;
    }

    std::ostringstream ss;
    ss << "analysis|v1|";
    bool first = true;
    for (const auto& [symbol, amount] : amounts) {
        if (!first) {
            ss << ",";
        }
        first = false;
        ss << symbol << ":" << format_fixed(total != 0.0 ? amount / total : amount);
    }
    ss << "|" << core::format_date(range.start) << "|" << core::format_date(range.end);
    ss << "|rf=" << format_fixed(risk_free_rate);
    ss << "|corr=" << (include_correlation ? 1 : 0);
    ss << "|min_corr=" << min_correlation_samples;
    ss << "|bench=" << benchmark_symbol;
    return ss.str();
}

std::string AnalysisRequest::fingerprint() const {
    return fnv1a_hex(canonical_form());
}

// ============================================================================
// AnalysisResult
// ============================================================================

nlohmann::json AnalysisResult::to_json() const {
    nlohmann::json j;
    j["key"] = key;
    j["label"] = label;
    j["symbols"] = symbols;
    j["range"] = {{"start", core::format_date(range.start)},
                  {"end", core::format_date(range.end)}};
    j["risk_free_rate"] = risk_free_rate;
    j["computed_at"] = core::to_epoch_seconds(computed_at);
    j["cached_at"] = core::to_epoch_seconds(cached_at);
    j["metrics"] = metrics.to_json();
    j["weights"] = weights;

    nlohmann::json asset_array = nlohmann::json::array();
    for (const auto& asset : assets) {
        asset_array.push_back({{"symbol", asset.symbol},
                               {"weight", asset.weight},
                               {"dollar_amount", asset.dollar_amount},
                               {"metrics", asset.metrics.to_json()}});
    }
    j["assets"] = asset_array;
    j["correlation"] = correlation ? correlation->to_json() : nlohmann::json(nullptr);

    nlohmann::json fetched = nlohmann::json::object();
    for (const auto& [symbol, ts] : series_fetched_at) {
        fetched[symbol] = core::to_epoch_seconds(ts);
    }
    j["series_fetched_at"] = fetched;
    return j;
}

Result<AnalysisResult> AnalysisResult::from_json(const nlohmann::json& j) {
    try {
        AnalysisResult r;
        r.key = j.at("key").get<std::string>();
        r.label = j.value("label", "");
        r.symbols = j.at("symbols").get<std::vector<std::string>>();

        auto start = core::parse_date(j.at("range").at("start").get<std::string>());
        auto end = core::parse_date(j.at("range").at("end").get<std::string>());
        if (!start || !end) {
            return make_error<AnalysisResult>(ErrorCode::CONVERSION_ERROR,
                                              "Invalid range in stored analysis " + r.key,
                                              "AnalysisResult");
        }
        r.range = DateRange(*start, *end);
        r.risk_free_rate = j.at("risk_free_rate").get<double>();
        r.computed_at = core::from_epoch_seconds(j.at("computed_at").get<int64_t>());
        r.cached_at = core::from_epoch_seconds(
            j.value("cached_at", core::to_epoch_seconds(r.computed_at)));
        r.metrics = RiskMetrics::from_json(j.at("metrics"));
        r.weights = j.at("weights").get<std::map<std::string, double>>();

        for (const auto& asset : j.at("assets")) {
            AssetMetrics a;
            a.symbol = asset.at("symbol").get<std::string>();
            a.weight = asset.at("weight").get<double>();
            a.dollar_amount = asset.value("dollar_amount", 0.0);
            a.metrics = RiskMetrics::from_json(asset.at("metrics"));
            r.assets.push_back(std::move(a));
        }

        if (j.contains("correlation") && !j.at("correlation").is_null()) {
            r.correlation = CorrelationMatrix::from_json(j.at("correlation"));
        }

        if (j.contains("series_fetched_at")) {
            for (const auto& [symbol, seconds] : j.at("series_fetched_at").items()) {
                r.series_fetched_at[symbol] = core::from_epoch_seconds(seconds.get<int64_t>());
            }
        }
        return Result<AnalysisResult>(std::move(r));
    } catch (const nlohmann::json::exception& e) {
        return make_error<AnalysisResult>(ErrorCode::CONVERSION_ERROR,
                                          std::string("Malformed stored analysis: ") + e.what(),
                                          "AnalysisResult");
    }
}

}  // namespace analytics
}  // namespace riskdesk
