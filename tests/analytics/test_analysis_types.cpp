#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "../core/test_base.hpp"
#include "riskdesk/analytics/analysis_types.hpp"

using namespace riskdesk;
using namespace riskdesk::analytics;
using namespace riskdesk::testing;

class AnalysisTypesTest : public TestBase {
protected:
    AnalysisRequest base_request() {
        AnalysisRequest request;
        request.allocations = {{"AAPL", 60000}, {"MSFT", 40000}};
        request.range = DateRange(day(2024, 1, 1), day(2024, 3, 1));
        request.risk_free_rate = 0.02;
        request.benchmark_symbol = "SPY";
        return request;
    }
};

TEST_F(AnalysisTypesTest, FnvMatchesKnownVectors) {
    EXPECT_EQ(fnv1a_hex(""), "cbf29ce484222325");
    EXPECT_EQ(fnv1a_hex("a"), "af63dc4c8601ec8c");
}

TEST_F(AnalysisTypesTest, FingerprintIgnoresAllocationOrder) {
    AnalysisRequest a = base_request();
    AnalysisRequest b = base_request();
    b.allocations = {{"MSFT", 40000}, {"AAPL", 60000}};

    EXPECT_EQ(a.fingerprint(), b.fingerprint());
    EXPECT_EQ(a.fingerprint().size(), 16u);
}

TEST_F(AnalysisTypesTest, FingerprintFollowsWeightsNotScale) {
    AnalysisRequest a = base_request();
    AnalysisRequest b = base_request();
    b.allocations = {{"AAPL", 6}, {"MSFT", 4}};
    EXPECT_EQ(a.fingerprint(), b.fingerprint());

    b.allocations = {{"AAPL", 5}, {"MSFT", 5}};
    EXPECT_NE(a.fingerprint(), b.fingerprint());
}

TEST_F(AnalysisTypesTest, FingerprintCoversParameters) {
    const std::string key = base_request().fingerprint();

    AnalysisRequest rf = base_request();
    rf.risk_free_rate = 0.03;
    EXPECT_NE(rf.fingerprint(), key);

    AnalysisRequest range = base_request();
    range.range.end = day(2024, 3, 2);
    EXPECT_NE(range.fingerprint(), key);

    AnalysisRequest bench = base_request();
    bench.benchmark_symbol.clear();
    EXPECT_NE(bench.fingerprint(), key);

    AnalysisRequest corr = base_request();
    corr.include_correlation = false;
    EXPECT_NE(corr.fingerprint(), key);
}

TEST_F(AnalysisTypesTest, SymbolsAreDistinctAndSorted) {
    AnalysisRequest request = base_request();
    request.allocations.push_back({"AAPL", 1});
    request.allocations.push_back({"GOOG", 1});
    EXPECT_EQ(request.symbols(), (std::vector<std::string>{"AAPL", "GOOG", "MSFT"}));
}

TEST_F(AnalysisTypesTest, StoredResultKeepsUndefinedValues) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    AnalysisResult result;
    result.key = base_request().fingerprint();
    result.label = "portfolio";
    result.symbols = {"AAPL", "MSFT"};
    result.range = base_request().range;
    result.risk_free_rate = 0.02;
    result.computed_at = day(2024, 3, 1) + std::chrono::hours(15);
    result.cached_at = day(2024, 3, 4) + std::chrono::hours(9);
    result.metrics.observations = 40;
    result.metrics.volatility = 0.25;
    result.metrics.sharpe_ratio = 1.2;
    result.weights = {{"AAPL", 0.6}, {"MSFT", 0.4}};
    result.series_fetched_at = {{"AAPL", result.computed_at}, {"MSFT", day(2024, 3, 1)}};

    CorrelationMatrix matrix;
    matrix.symbols = {"AAPL", "MSFT"};
    matrix.values = {{1.0, nan}, {nan, 1.0}};
    matrix.observations = {{40, 12}, {12, 40}};
    matrix.undefined_pairs = {{"AAPL", "MSFT"}};
    result.correlation = matrix;

    auto restored = AnalysisResult::from_json(nlohmann::json::parse(result.to_json().dump()));
    ASSERT_TRUE(restored.is_ok()) << restored.error()->what();
    const auto& r = restored.value();

    EXPECT_EQ(r.key, result.key);
    EXPECT_EQ(r.range, result.range);
    EXPECT_EQ(r.computed_at, result.computed_at);
    EXPECT_EQ(r.cached_at, result.cached_at);
    EXPECT_EQ(r.series_fetched_at, result.series_fetched_at);
    EXPECT_FALSE(r.metrics.sortino_ratio.has_value());
    ASSERT_TRUE(r.metrics.sharpe_ratio.has_value());
    EXPECT_DOUBLE_EQ(*r.metrics.sharpe_ratio, 1.2);
    ASSERT_TRUE(r.correlation.has_value());
    EXPECT_TRUE(std::isnan(r.correlation->at("AAPL", "MSFT")));
    EXPECT_EQ(r.correlation->undefined_pairs.size(), 1u);
}

TEST_F(AnalysisTypesTest, MalformedStoredResultRejected) {
    auto restored = AnalysisResult::from_json(nlohmann::json{{"key", "abc"}});
    ASSERT_TRUE(restored.is_error());
    EXPECT_EQ(restored.error()->code(), ErrorCode::CONVERSION_ERROR);
}
