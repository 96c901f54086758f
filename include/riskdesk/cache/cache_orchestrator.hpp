// include/riskdesk/cache/cache_orchestrator.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "riskdesk/analytics/analysis_types.hpp"
#include "riskdesk/analytics/risk_analytics.hpp"
#include "riskdesk/cache/cache_config.hpp"
#include "riskdesk/cache/keyed_mutex.hpp"
#include "riskdesk/cache/memory_cache.hpp"
#include "riskdesk/cache/request_coalescer.hpp"
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/data/price_store.hpp"
#include "riskdesk/providers/provider_chain.hpp"

namespace riskdesk {

/**
 * @brief Target of a cache invalidation
 */
class CacheScope {
public:
    static CacheScope symbol(std::string symbol) {
        return CacheScope(std::move(symbol));
    }

    static CacheScope all() {
        return CacheScope(std::string());
    }

    bool is_all() const {
        return symbol_.empty();
    }

    const std::string& target() const {
        return symbol_;
    }

private:
    explicit CacheScope(std::string symbol) : symbol_(std::move(symbol)) {}

    std::string symbol_;
};

/**
 * @brief Memory tier value for a symbol's most recent series
 * Spans are kept so sub-range reads report the same fetched_at as the store
 */
struct CachedSeries {
    PriceSeries series;
    std::vector<CoverageSpan> spans;
};

/**
 * @class CacheOrchestrator
 * @brief Resolves series, quotes and analyses through memory, store and
 *        provider tiers
 *
 * Memory is consulted first, then the persistent store. Only the parts the
 * store lacks, or holds with an expired open part, are fetched from the
 * provider chain, once per concurrent (symbol, range) request. Fetched bars
 * are merged with stored ones, written back and promoted to memory. When the
 * provider fails, stored data is served with a stale warning.
 */
class CacheOrchestrator {
public:
    CacheOrchestrator(std::shared_ptr<PriceStore> store,
                      std::shared_ptr<QuoteProviderAdapter> providers, CacheConfig config,
                      const core::Clock& clock,
                      analytics::AnalyticsConfig analytics_config = analytics::AnalyticsConfig());

    /**
     * @brief Daily bars for a symbol over a range
     * @param symbol Ticker, normalised here
     * @param range Inclusive range, floored to days
     */
    Result<SeriesResult> resolve_series(const std::string& symbol, const DateRange& range,
                                        const RequestContext& ctx = RequestContext());

    /**
     * @brief Latest quote, falling back to the last stored close
     */
    Result<QuoteResult> resolve_quote(const std::string& symbol,
                                      const RequestContext& ctx = RequestContext());

    /**
     * @brief Cached or freshly computed analysis of a request
     *
     * A cached result is reused only while every backing series still
     * reports the fetched_at it was computed from. Results built on stale
     * series carry the stale warning and are not cached.
     */
    Result<analytics::AnalysisResult> resolve_metrics(const analytics::AnalysisRequest& request,
                                                      const RequestContext& ctx = RequestContext());

    /**
     * @brief Drop memory entries and store rows for one symbol or everything
     * @return Entries and rows removed
     */
    size_t invalidate(const CacheScope& scope);

    /**
     * @brief Ranges a store read requires from the provider
     *
     * Gaps plus the open part of every span whose fetch is older than the
     * historical TTL, clipped to the request, sorted and with adjacent ranges
     * merged.
     */
    std::vector<DateRange> refetch_ranges(const StoreRead& read, const DateRange& range) const;

    /**
     * @brief Fetched bars combined with stored ones under a merge policy
     */
    static std::vector<PriceBar> merge_bars(const std::vector<PriceBar>& stored,
                                            const std::vector<PriceBar>& fetched,
                                            MergePolicy policy);

    const CacheConfig& config() const {
        return config_;
    }

private:
    Result<SeriesResult> load_or_fetch_series(const std::string& symbol, const DateRange& range);

    Result<QuoteResult> fetch_quote_or_fallback(const std::string& symbol);

    std::optional<analytics::AnalysisResult> cached_analysis(const std::string& key);

    bool is_still_valid(const analytics::AnalysisResult& result,
                        const std::map<std::string, PriceSeries>& series,
                        const std::optional<PriceSeries>& benchmark) const;

    void promote_series(const std::string& symbol, const PriceSeries& series,
                        const std::vector<CoverageSpan>& spans);

    bool has_open_part(const CoverageSpan& span) const;

    bool is_stale_span(const CoverageSpan& span) const;

    static Timestamp fetched_at_within(const std::vector<CoverageSpan>& spans,
                                       const DateRange& range);

    static std::string series_key(const std::string& symbol) {
        return "series|" + symbol;
    }

    static std::string quote_key(const std::string& symbol) {
        return "quote|" + symbol;
    }

    std::shared_ptr<PriceStore> store_;
    std::shared_ptr<QuoteProviderAdapter> providers_;
    CacheConfig config_;
    TtlPolicy ttl_;
    const core::Clock& clock_;
    analytics::AnalyticsConfig analytics_config_;

    MemoryCache<CachedSeries> series_cache_;
    MemoryCache<QuoteResult> quote_cache_;
    MemoryCache<analytics::AnalysisResult> analysis_cache_;

    KeyedMutex key_locks_;
    // Last, so running fetches finish before the tiers they touch go away
    RequestCoalescer<SeriesResult> series_flights_;
    RequestCoalescer<QuoteResult> quote_flights_;
};

}  // namespace riskdesk
