#include <gtest/gtest.h>
#include <cmath>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "../data/test_db_utils.hpp"
#include "../providers/mock_providers.hpp"
#include "riskdesk/cache/cache_orchestrator.hpp"

using namespace riskdesk;
using namespace riskdesk::testing;

class CacheOrchestratorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock = std::make_unique<core::ManualClock>(day(2024, 3, 15) + std::chrono::hours(16));
        store = std::make_shared<MockPriceStore>();
        provider = std::make_shared<MockQuoteProvider>("primary");

        ProviderSettings settings;
        settings.bucket_capacity = 1000.0;
        settings.refill_per_minute = 1000.0;
        adapter = std::make_shared<QuoteProviderAdapter>(*clock);
        adapter->add_provider(provider, settings);

        // 2024-02-01 .. 2024-03-15
        provider->set_history("AAPL", make_bars("AAPL", day(2024, 2, 1), wave(44, 180.0, 4.0, 7)));
        provider->set_history("MSFT", make_bars("MSFT", day(2024, 2, 1), wave(44, 400.0, 6.0, 9)));
        provider->set_history("SPY", make_bars("SPY", day(2024, 2, 1), wave(44, 500.0, 5.0, 7)));
        provider->set_quote("AAPL", PriceBar("AAPL", day(2024, 3, 15), 180, 182, 179, 181, 1e6));

        orchestrator = make_orchestrator(CacheConfig());
    }

    std::unique_ptr<CacheOrchestrator> make_orchestrator(const CacheConfig& config) {
        return std::make_unique<CacheOrchestrator>(store, adapter, config, *clock);
    }

    static std::vector<double> wave(size_t n, double base, double amplitude, int period) {
        std::vector<double> closes;
        for (size_t i = 0; i < n; ++i) {
            double phase = 6.283185307179586 * static_cast<double>(i) / period;
            closes.push_back(base + amplitude * std::sin(phase) + 0.1 * static_cast<double>(i));
        }
        return closes;
    }

    DateRange range(int m1, int d1, int m2, int d2) {
        return DateRange(day(2024, m1, d1), day(2024, m2, d2));
    }

    analytics::AnalysisRequest portfolio_request(const std::string& benchmark = "SPY") {
        analytics::AnalysisRequest request;
        request.label = "portfolio";
        request.allocations = {{"AAPL", 60000}, {"MSFT", 40000}};
        request.range = range(2, 1, 3, 15);
        request.benchmark_symbol = benchmark;
        return request;
    }

    std::unique_ptr<core::ManualClock> clock;
    std::shared_ptr<MockPriceStore> store;
    std::shared_ptr<MockQuoteProvider> provider;
    std::shared_ptr<QuoteProviderAdapter> adapter;
    std::unique_ptr<CacheOrchestrator> orchestrator;
};

// ================= Series =================

TEST_F(CacheOrchestratorTest, MissFetchesAndWritesBack) {
    auto result = orchestrator->resolve_series("aapl", range(3, 1, 3, 10));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    EXPECT_FALSE(result.value().stale);
    EXPECT_EQ(result.value().series.symbol, "AAPL");
    EXPECT_EQ(result.value().series.size(), 10u);
    EXPECT_EQ(result.value().series.fetched_at, clock->now());

    EXPECT_EQ(provider->history_calls(), 1u);
    EXPECT_EQ(store->bars("AAPL").size(), 10u);
    ASSERT_EQ(store->spans("AAPL").size(), 1u);
    EXPECT_EQ(store->spans("AAPL")[0].range, range(3, 1, 3, 10));
}

TEST_F(CacheOrchestratorTest, RepeatedAndSubRangeReadsServedFromMemory) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());
    store->set_fail_reads(true);

    auto again = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
    auto sub = orchestrator->resolve_series("AAPL", range(3, 3, 3, 5));
    ASSERT_TRUE(again.is_ok());
    ASSERT_TRUE(sub.is_ok());

    EXPECT_EQ(again.value().series.size(), 10u);
    EXPECT_EQ(sub.value().series.size(), 3u);
    EXPECT_EQ(sub.value().series.range, range(3, 3, 3, 5));
    EXPECT_EQ(provider->history_calls(), 1u);
}

TEST_F(CacheOrchestratorTest, StoreHitNeedsNoProvider) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());

    auto cold = make_orchestrator(CacheConfig());
    auto result = cold->resolve_series("AAPL", range(3, 2, 3, 8));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().series.size(), 7u);
    EXPECT_EQ(provider->history_calls(), 1u);
}

TEST_F(CacheOrchestratorTest, IdenticalRequestsReturnIdenticalSeries) {
    auto first = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
    auto cold = make_orchestrator(CacheConfig());
    auto second = cold->resolve_series("AAPL", range(3, 1, 3, 10));

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().series.bars, second.value().series.bars);
    EXPECT_EQ(first.value().series.fetched_at, second.value().series.fetched_at);
}

TEST_F(CacheOrchestratorTest, PartialHitFetchesOnlyTheGap) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 5)).is_ok());

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().series.size(), 10u);

    auto ranges = provider->requested_ranges();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[1], range(3, 6, 3, 10));
}

TEST_F(CacheOrchestratorTest, OpenPartRefetchedOnceAfterTtl) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 15)).is_ok());

    clock->advance(std::chrono::hours(25));
    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 15));
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().stale);
    EXPECT_EQ(result.value().series.size(), 15u);
    EXPECT_EQ(result.value().series.fetched_at, clock->now());

    auto ranges = provider->requested_ranges();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[1], range(3, 15, 3, 15));

    // Spans now end before their fetch day, nothing is open any more
    clock->advance(std::chrono::hours(48));
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 15)).is_ok());
    EXPECT_EQ(provider->history_calls(), 2u);
}

TEST_F(CacheOrchestratorTest, ClosedHistoryNeverRefetched) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(2, 1, 2, 10)).is_ok());

    clock->advance(std::chrono::hours(24 * 30));
    auto result = orchestrator->resolve_series("AAPL", range(2, 1, 2, 10));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().series.size(), 10u);
    EXPECT_EQ(provider->history_calls(), 1u);
}

TEST_F(CacheOrchestratorTest, StoredDataServedStaleWhenProviderFails) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 15)).is_ok());
    Timestamp first_fetch = clock->now();

    clock->advance(std::chrono::hours(25));
    provider->fail_with(ErrorCode::TRANSIENT_ERROR);

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 15));
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().stale);
    EXPECT_EQ(result.value().warning, DataWarning::STALE_DATA_RETURNED);
    EXPECT_FALSE(result.value().warning_message.empty());
    EXPECT_EQ(result.value().series.size(), 15u);
    EXPECT_EQ(result.value().series.fetched_at, first_fetch);

    // A stale answer is not promoted, the next read tries again
    provider->clear_failure();
    auto recovered = orchestrator->resolve_series("AAPL", range(3, 1, 3, 15));
    ASSERT_TRUE(recovered.is_ok());
    EXPECT_FALSE(recovered.value().stale);
    EXPECT_EQ(provider->history_calls(), 3u);
}

TEST_F(CacheOrchestratorTest, ProviderFailureWithNothingStoredIsError) {
    provider->fail_with(ErrorCode::TRANSIENT_ERROR);

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::TRANSIENT_ERROR);
}

TEST_F(CacheOrchestratorTest, UnknownSymbolIsNotFound) {
    auto result = orchestrator->resolve_series("ZZZZ", range(3, 1, 3, 10));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_FOUND);
}

TEST_F(CacheOrchestratorTest, InvalidRequestsNeverReachProviders) {
    auto empty = orchestrator->resolve_series("  ", range(3, 1, 3, 10));
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::VALIDATION_ERROR);

    auto inverted = orchestrator->resolve_series("AAPL", range(3, 10, 3, 1));
    ASSERT_TRUE(inverted.is_error());
    EXPECT_EQ(inverted.error()->code(), ErrorCode::VALIDATION_ERROR);

    auto quote = orchestrator->resolve_quote("BAD;SYM");
    ASSERT_TRUE(quote.is_error());
    EXPECT_EQ(quote.error()->code(), ErrorCode::VALIDATION_ERROR);

    EXPECT_EQ(provider->history_calls() + provider->quote_calls(), 0u);
}

TEST_F(CacheOrchestratorTest, StoreReadFailureDegradesToProvider) {
    store->set_fail_reads(true);

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().stale);
    EXPECT_EQ(result.value().series.size(), 10u);
    EXPECT_EQ(provider->history_calls(), 1u);
}

TEST_F(CacheOrchestratorTest, StoreWriteFailureStillServes) {
    store->set_fail_writes(true);

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().series.size(), 10u);
    EXPECT_TRUE(store->bars("AAPL").empty());
}

TEST_F(CacheOrchestratorTest, ConcurrentRequestsFetchOnce) {
    provider->set_delay(std::chrono::milliseconds(50));

    constexpr int THREADS = 8;
    std::vector<size_t> sizes(THREADS, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([this, &sizes, i]() {
            auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 10));
            sizes[i] = result.is_ok() ? result.value().series.size() : 0;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(provider->history_calls(), 1u);
    for (size_t size : sizes) {
        EXPECT_EQ(size, 10u);
    }
}

// ================= Merge policy =================

TEST_F(CacheOrchestratorTest, MergeBarsPolicies) {
    std::vector<PriceBar> stored = make_bars("AAPL", day(2024, 3, 1), {100, 101});
    std::vector<PriceBar> fetched = make_bars("AAPL", day(2024, 3, 2), {150, 102});

    auto freshest =
        CacheOrchestrator::merge_bars(stored, fetched, MergePolicy::FRESHEST_WINS);
    ASSERT_EQ(freshest.size(), 3u);
    EXPECT_DOUBLE_EQ(freshest[1].close, 150.0);

    auto kept = CacheOrchestrator::merge_bars(stored, fetched, MergePolicy::STORED_WINS);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_DOUBLE_EQ(kept[1].close, 101.0);
    EXPECT_DOUBLE_EQ(kept[2].close, 102.0);
}

TEST_F(CacheOrchestratorTest, RevisedBarReplacesStoredOneByDefault) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 15)).is_ok());
    double original = store->bars("AAPL").back().close;

    auto revised = make_bars("AAPL", day(2024, 2, 1), wave(44, 180.0, 4.0, 7));
    revised.back().close = original + 10.0;
    provider->set_history("AAPL", revised);
    clock->advance(std::chrono::hours(25));

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 15));
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().series.bars.back().close, original + 10.0);
    EXPECT_DOUBLE_EQ(store->bars("AAPL").back().close, original + 10.0);
}

TEST_F(CacheOrchestratorTest, StoredWinsKeepsStoredBar) {
    CacheConfig config;
    config.merge_policy = MergePolicy::STORED_WINS;
    orchestrator = make_orchestrator(config);

    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 15)).is_ok());
    double original = store->bars("AAPL").back().close;

    auto revised = make_bars("AAPL", day(2024, 2, 1), wave(44, 180.0, 4.0, 7));
    revised.back().close = original + 10.0;
    provider->set_history("AAPL", revised);
    clock->advance(std::chrono::hours(25));

    auto result = orchestrator->resolve_series("AAPL", range(3, 1, 3, 15));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(provider->history_calls(), 2u);
    EXPECT_DOUBLE_EQ(result.value().series.bars.back().close, original);
    EXPECT_DOUBLE_EQ(store->bars("AAPL").back().close, original);
}

// ================= Refetch planning =================

TEST_F(CacheOrchestratorTest, RefetchRangesMergeGapsAndStaleOpenParts) {
    Timestamp old_fetch = clock->now() - std::chrono::hours(48);

    StoreRead read;
    read.spans = {
        CoverageSpan{"AAPL", range(3, 1, 3, 5), old_fetch},
        CoverageSpan{"AAPL", range(3, 8, 3, 14), old_fetch},
    };
    read.gaps = {range(3, 6, 3, 7)};

    auto ranges = orchestrator->refetch_ranges(read, range(3, 1, 3, 14));
    // The open part starts on the fetch day, 3/13, and touches nothing else
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], range(3, 6, 3, 7));
    EXPECT_EQ(ranges[1], range(3, 13, 3, 14));
}

TEST_F(CacheOrchestratorTest, FreshOpenPartIsNotRefetched) {
    StoreRead read;
    read.spans = {CoverageSpan{"AAPL", range(3, 1, 3, 15), clock->now() - std::chrono::hours(2)}};

    EXPECT_TRUE(orchestrator->refetch_ranges(read, range(3, 1, 3, 15)).empty());
}

// ================= Quotes =================

TEST_F(CacheOrchestratorTest, QuoteCachedForLiveTtl) {
    auto first = orchestrator->resolve_quote("AAPL");
    ASSERT_TRUE(first.is_ok());
    EXPECT_DOUBLE_EQ(first.value().quote.close, 181.0);
    EXPECT_EQ(first.value().fetched_at, clock->now());
    EXPECT_FALSE(first.value().stale);

    clock->advance(std::chrono::seconds(299));
    ASSERT_TRUE(orchestrator->resolve_quote("AAPL").is_ok());
    EXPECT_EQ(provider->quote_calls(), 1u);

    clock->advance(std::chrono::seconds(1));
    ASSERT_TRUE(orchestrator->resolve_quote("AAPL").is_ok());
    EXPECT_EQ(provider->quote_calls(), 2u);
}

TEST_F(CacheOrchestratorTest, QuoteFallsBackToLastStoredClose) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());
    double last_close = store->bars("AAPL").back().close;

    auto cold = make_orchestrator(CacheConfig());
    provider->fail_with(ErrorCode::RATE_LIMITED);

    auto quote = cold->resolve_quote("AAPL");
    ASSERT_TRUE(quote.is_ok());
    EXPECT_TRUE(quote.value().stale);
    EXPECT_EQ(quote.value().warning, DataWarning::STALE_DATA_RETURNED);
    EXPECT_EQ(quote.value().quote.date, day(2024, 3, 10));
    EXPECT_DOUBLE_EQ(quote.value().quote.close, last_close);
}

TEST_F(CacheOrchestratorTest, QuoteFallbackOnlyUsesRecentBars) {
    // February bars sit in memory but are older than the fallback window
    auto old_only = make_orchestrator(CacheConfig());
    ASSERT_TRUE(old_only->resolve_series("AAPL", range(2, 1, 2, 10)).is_ok());
    provider->fail_with(ErrorCode::TRANSIENT_ERROR);

    auto old_quote = old_only->resolve_quote("AAPL");
    ASSERT_TRUE(old_quote.is_error());
    EXPECT_EQ(old_quote.error()->code(), ErrorCode::TRANSIENT_ERROR);

    // A recent bar in memory still answers, even with the store unreadable
    provider->clear_failure();
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());
    provider->fail_with(ErrorCode::TRANSIENT_ERROR);
    store->set_fail_reads(true);

    auto recent = orchestrator->resolve_quote("AAPL");
    ASSERT_TRUE(recent.is_ok());
    EXPECT_TRUE(recent.value().stale);
    EXPECT_EQ(recent.value().quote.date, day(2024, 3, 10));
}

TEST_F(CacheOrchestratorTest, QuoteWithoutAnyDataIsError) {
    provider->fail_with(ErrorCode::TRANSIENT_ERROR);

    auto quote = orchestrator->resolve_quote("AAPL");
    ASSERT_TRUE(quote.is_error());
    EXPECT_EQ(quote.error()->code(), ErrorCode::TRANSIENT_ERROR);
}

// ================= Analyses =================

TEST_F(CacheOrchestratorTest, MetricsComputedThenReused) {
    auto first = orchestrator->resolve_metrics(portfolio_request());
    ASSERT_TRUE(first.is_ok()) << first.error()->what();
    EXPECT_FALSE(first.value().stale);
    EXPECT_TRUE(first.value().metrics.beta.has_value());
    EXPECT_EQ(store->analysis_count(), 1u);
    EXPECT_EQ(provider->history_calls(), 3u);

    auto second = orchestrator->resolve_metrics(portfolio_request());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().key, first.value().key);
    EXPECT_EQ(second.value().computed_at, first.value().computed_at);
    EXPECT_DOUBLE_EQ(second.value().metrics.volatility, first.value().metrics.volatility);
    EXPECT_EQ(provider->history_calls(), 3u);
}

TEST_F(CacheOrchestratorTest, ScaledAllocationReusesAnalysisWithCallerDollars) {
    ASSERT_TRUE(orchestrator->resolve_metrics(portfolio_request()).is_ok());

    auto scaled_request = portfolio_request();
    scaled_request.allocations = {{"AAPL", 6}, {"MSFT", 4}};
    auto scaled = orchestrator->resolve_metrics(scaled_request);
    ASSERT_TRUE(scaled.is_ok());
    EXPECT_EQ(store->analysis_count(), 1u);
    ASSERT_EQ(scaled.value().assets.size(), 2u);
    EXPECT_DOUBLE_EQ(scaled.value().assets[0].dollar_amount, 6.0);
}

TEST_F(CacheOrchestratorTest, MetricsRecomputedWhenBackingSeriesChange) {
    CacheConfig config;
    config.ttl_analysis_seconds = 7 * 86400;
    orchestrator = make_orchestrator(config);

    auto first = orchestrator->resolve_metrics(portfolio_request());
    ASSERT_TRUE(first.is_ok());

    clock->advance(std::chrono::hours(25));
    auto second = orchestrator->resolve_metrics(portfolio_request());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(second.value().key, first.value().key);
    EXPECT_EQ(second.value().computed_at, clock->now());
    EXPECT_GT(second.value().computed_at, first.value().computed_at);
    EXPECT_EQ(second.value().series_fetched_at.at("AAPL"), clock->now());
}

TEST_F(CacheOrchestratorTest, ClosedRangeAnalysisCachedAcrossTtlBoundary) {
    auto request = portfolio_request();
    request.range = range(2, 1, 3, 10);

    auto first = orchestrator->resolve_metrics(request);
    ASSERT_TRUE(first.is_ok()) << first.error()->what();
    const Timestamp first_fetch = clock->now();
    EXPECT_EQ(first.value().computed_at, first_fetch);
    EXPECT_EQ(first.value().cached_at, first_fetch);
    EXPECT_EQ(store->analysis_write_count(), 1u);

    clock->advance(std::chrono::hours(23));
    ASSERT_TRUE(orchestrator->resolve_metrics(request).is_ok());
    EXPECT_EQ(store->analysis_write_count(), 1u);

    // One recompute once the cached copy is a day old
    clock->advance(std::chrono::hours(2));
    auto renewed = orchestrator->resolve_metrics(request);
    ASSERT_TRUE(renewed.is_ok());
    EXPECT_EQ(store->analysis_write_count(), 2u);
    EXPECT_EQ(renewed.value().computed_at, first_fetch);
    EXPECT_EQ(renewed.value().cached_at, clock->now());

    for (int i = 0; i < 3; ++i) {
        clock->advance(std::chrono::minutes(5));
        auto again = orchestrator->resolve_metrics(request);
        ASSERT_TRUE(again.is_ok());
        EXPECT_EQ(again.value().cached_at, renewed.value().cached_at);
    }
    EXPECT_EQ(store->analysis_write_count(), 2u);
    EXPECT_EQ(provider->history_calls(), 3u);

    // A cold instance reuses the stored row
    auto cold = make_orchestrator(CacheConfig());
    ASSERT_TRUE(cold->resolve_metrics(request).is_ok());
    EXPECT_EQ(store->analysis_write_count(), 2u);
}

TEST_F(CacheOrchestratorTest, MetricsOnStaleSeriesAreFlaggedAndNotStored) {
    ASSERT_TRUE(orchestrator->resolve_metrics(portfolio_request()).is_ok());

    clock->advance(std::chrono::hours(25));
    provider->fail_with(ErrorCode::TRANSIENT_ERROR);

    auto stale = orchestrator->resolve_metrics(portfolio_request());
    ASSERT_TRUE(stale.is_ok());
    EXPECT_TRUE(stale.value().stale);
    EXPECT_EQ(stale.value().warning, DataWarning::STALE_DATA_RETURNED);
    EXPECT_EQ(store->analysis_count(), 1u);
}

TEST_F(CacheOrchestratorTest, MissingBenchmarkOmitsBeta) {
    auto result = orchestrator->resolve_metrics(portfolio_request("NOPE"));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_FALSE(result.value().metrics.beta.has_value());
    EXPECT_EQ(result.value().series_fetched_at.count("NOPE"), 0u);
}

TEST_F(CacheOrchestratorTest, MetricsRejectBadAllocationsBeforeFetching) {
    auto request = portfolio_request();
    request.allocations = {{"AAPL", 0}, {"MSFT", 0}};

    auto result = orchestrator->resolve_metrics(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(provider->history_calls(), 0u);
}

// ================= Invalidation =================

TEST_F(CacheOrchestratorTest, InvalidateSymbolForcesRefetch) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());
    ASSERT_TRUE(orchestrator->resolve_series("MSFT", range(3, 1, 3, 10)).is_ok());

    // Memory series entry plus one stored span
    EXPECT_EQ(orchestrator->invalidate(CacheScope::symbol("aapl")), 2u);

    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());
    ASSERT_TRUE(orchestrator->resolve_series("MSFT", range(3, 1, 3, 10)).is_ok());
    EXPECT_EQ(provider->history_calls(), 3u);
}

TEST_F(CacheOrchestratorTest, InvalidateSymbolDropsAnalysesUsingIt) {
    ASSERT_TRUE(orchestrator->resolve_metrics(portfolio_request()).is_ok());
    ASSERT_EQ(store->analysis_count(), 1u);

    EXPECT_GT(orchestrator->invalidate(CacheScope::symbol("SPY")), 0u);
    EXPECT_EQ(store->analysis_count(), 0u);
}

TEST_F(CacheOrchestratorTest, InvalidateAllClearsEverything) {
    ASSERT_TRUE(orchestrator->resolve_series("AAPL", range(3, 1, 3, 10)).is_ok());
    ASSERT_TRUE(orchestrator->resolve_quote("AAPL").is_ok());

    // Series and quote in memory, one stored span
    EXPECT_EQ(orchestrator->invalidate(CacheScope::all()), 3u);
    EXPECT_TRUE(store->spans("AAPL").empty());

    ASSERT_TRUE(orchestrator->resolve_quote("AAPL").is_ok());
    EXPECT_EQ(provider->quote_calls(), 2u);
}
