// src/cache/cache_orchestrator.cpp

#include "riskdesk/cache/cache_orchestrator.hpp"
#include <algorithm>
#include <map>
#include <set>
#include "riskdesk/core/logger.hpp"

namespace riskdesk {

namespace {

const std::string COMPONENT = "CacheOrchestrator";

// Window searched for a last close when the quote providers fail
constexpr int QUOTE_FALLBACK_LOOKBACK_DAYS = 14;

void apply_span_update(std::vector<CoverageSpan>& spans, const SpanUpdate& update) {
    for (const auto& old : update.superseded) {
        spans.erase(std::remove_if(spans.begin(), spans.end(),
                                   [&old](const CoverageSpan& span) {
                                       return span.range == old.range &&
                                              span.fetched_at == old.fetched_at;
                                   }),
                    spans.end());
    }
    spans.insert(spans.end(), update.inserted.begin(), update.inserted.end());
    std::sort(spans.begin(), spans.end(), [](const CoverageSpan& a, const CoverageSpan& b) {
        return a.range.start < b.range.start;
    });
}

}  // namespace

CacheOrchestrator::CacheOrchestrator(std::shared_ptr<PriceStore> store,
                                     std::shared_ptr<QuoteProviderAdapter> providers,
                                     CacheConfig config, const core::Clock& clock,
                                     analytics::AnalyticsConfig analytics_config)
    : store_(std::move(store)),
      providers_(std::move(providers)),
      config_(std::move(config)),
      ttl_(config_.ttl_policy()),
      clock_(clock),
      analytics_config_(std::move(analytics_config)),
      series_cache_(config_.capacity, config_.shards, ttl_, clock),
      quote_cache_(config_.capacity, config_.shards, ttl_, clock),
      analysis_cache_(config_.capacity, config_.shards, ttl_, clock),
      series_flights_(std::chrono::milliseconds(config_.fetch_wait_timeout_ms)),
      quote_flights_(std::chrono::milliseconds(config_.fetch_wait_timeout_ms)) {
    Logger::register_component(COMPONENT);
}

// ============================================================================
// Series
// ============================================================================

Result<SeriesResult> CacheOrchestrator::resolve_series(const std::string& symbol,
                                                       const DateRange& range,
                                                       const RequestContext& ctx) {
    auto normalized = normalize_symbol(symbol);
    if (normalized.is_error()) {
        return forward_error<SeriesResult>(normalized);
    }
    const std::string sym = normalized.value();

    if (!range.is_valid()) {
        return make_error<SeriesResult>(ErrorCode::VALIDATION_ERROR,
                                        "Range start after end for " + sym, COMPONENT);
    }
    const DateRange days(core::floor_to_day(range.start), core::floor_to_day(range.end));

    auto cached = series_cache_.get(series_key(sym));
    if (cached && cached->series.range.covers(days)) {
        DEBUG("Memory hit for " << sym << " " << core::format_date(days.start) << ".."
                                << core::format_date(days.end));
        SeriesResult result;
        result.series = cached->series.slice(days);
        result.series.fetched_at = fetched_at_within(cached->spans, days);
        return Result<SeriesResult>(std::move(result));
    }
    DEBUG("Memory miss for " << sym);

    const std::string flight_key =
        "series|" + sym + "|" + core::format_date(days.start) + "|" + core::format_date(days.end);
    return series_flights_.run(
        flight_key, [this, sym, days]() { return load_or_fetch_series(sym, days); }, ctx);
}

Result<SeriesResult> CacheOrchestrator::load_or_fetch_series(const std::string& symbol,
                                                             const DateRange& range) {
    StoreRead read;
    std::vector<DateRange> refetch;
    {
        std::lock_guard<std::mutex> lock(key_locks_.for_key(symbol));
        auto stored = store_->get(symbol, range);
        if (stored.is_error()) {
            WARN("Store read failed for " << symbol
                                          << ", continuing without stored data: "
                                          << stored.error()->what());
            read.series.symbol = symbol;
            read.series.range = range;
            read.gaps = {range};
        } else {
            read = stored.value();
        }

        refetch = refetch_ranges(read, range);
        if (refetch.empty()) {
            DEBUG("Store hit for " << symbol << " with " << read.series.size() << " bars");
            promote_series(symbol, read.series, read.spans);
            SeriesResult result;
            result.series = read.series;
            return Result<SeriesResult>(std::move(result));
        }
    }

    DEBUG("Store " << (read.is_miss() ? "miss" : "partial hit") << " for " << symbol
                   << ", fetching " << refetch.size() << " range(s)");

    // No lock is held while the providers run
    std::vector<PriceSeries> fetched;
    std::unique_ptr<RiskDeskError> failure;
    for (const auto& part : refetch) {
        auto result = providers_->fetch_history(symbol, part);
        if (result.is_error()) {
            failure = result.error()->clone();
            break;
        }
        fetched.push_back(result.value());
    }

    if (failure && failure->code() == ErrorCode::VALIDATION_ERROR) {
        return Result<SeriesResult>(std::move(failure));
    }

    PriceSeries merged;
    merged.symbol = symbol;
    merged.range = range;
    merged.bars = read.series.bars;
    std::vector<CoverageSpan> spans = read.spans;

    {
        std::lock_guard<std::mutex> lock(key_locks_.for_key(symbol));
        for (const auto& part : fetched) {
            PriceSeries to_write = part;
            if (config_.merge_policy == MergePolicy::STORED_WINS) {
                std::set<Timestamp> stored_dates;
                for (const auto& bar : merged.bars) {
                    stored_dates.insert(bar.date);
                }
                to_write.bars.erase(std::remove_if(to_write.bars.begin(), to_write.bars.end(),
                                                   [&stored_dates](const PriceBar& bar) {
                                                       return stored_dates.count(bar.date) > 0;
                                                   }),
                                    to_write.bars.end());
            }
            merged.bars = merge_bars(merged.bars, part.bars, config_.merge_policy);

            auto written = store_->put(to_write, part.fetched_at);
            if (written.is_error()) {
                WARN("Write-back failed for " << symbol << ": " << written.error()->what());
            } else {
                DEBUG("Wrote " << written.value() << " changed bars for " << symbol);
            }

            CoverageSpan incoming{symbol, part.range, part.fetched_at};
            apply_span_update(spans, PriceStore::plan_span_update(spans, incoming));
        }
        merged.fetched_at = fetched_at_within(spans, range);

        if (!failure) {
            promote_series(symbol, merged, spans);
        }
    }

    if (failure) {
        if (merged.bars.empty()) {
            ERROR("No data for " << symbol << ": " << failure->to_string());
            return Result<SeriesResult>(std::move(failure));
        }
        WARN("Serving stored data for " << symbol << " after provider failure: "
                                        << failure->what());
        SeriesResult result;
        result.series = std::move(merged);
        result.stale = true;
        result.warning = DataWarning::STALE_DATA_RETURNED;
        result.warning_message = failure->to_string();
        return Result<SeriesResult>(std::move(result));
    }

    SeriesResult result;
    result.series = std::move(merged);
    return Result<SeriesResult>(std::move(result));
}

std::vector<DateRange> CacheOrchestrator::refetch_ranges(const StoreRead& read,
                                                         const DateRange& range) const {
    std::vector<DateRange> ranges = read.gaps;

    for (const auto& span : read.spans) {
        if (!is_stale_span(span)) {
            continue;
        }
        Timestamp open_start = std::max(span.range.start, core::floor_to_day(span.fetched_at));
        DateRange open(std::max(open_start, range.start), std::min(span.range.end, range.end));
        if (open.is_valid()) {
            ranges.push_back(open);
        }
    }

    std::sort(ranges.begin(), ranges.end(),
              [](const DateRange& a, const DateRange& b) { return a.start < b.start; });

    std::vector<DateRange> merged;
    for (const auto& r : ranges) {
        if (!merged.empty() && r.start <= core::next_day(merged.back().end)) {
            merged.back().end = std::max(merged.back().end, r.end);
        } else {
            merged.push_back(r);
        }
    }
    return merged;
}

std::vector<PriceBar> CacheOrchestrator::merge_bars(const std::vector<PriceBar>& stored,
                                                    const std::vector<PriceBar>& fetched,
                                                    MergePolicy policy) {
    std::map<Timestamp, PriceBar> by_date;
    for (const auto& bar : stored) {
        by_date[bar.date] = bar;
    }
    for (const auto& bar : fetched) {
        if (policy == MergePolicy::FRESHEST_WINS) {
            by_date[bar.date] = bar;
        } else {
            by_date.emplace(bar.date, bar);
        }
    }

    std::vector<PriceBar> bars;
    bars.reserve(by_date.size());
    for (auto& [date, bar] : by_date) {
        bars.push_back(std::move(bar));
    }
    return bars;
}

void CacheOrchestrator::promote_series(const std::string& symbol, const PriceSeries& series,
                                       const std::vector<CoverageSpan>& spans) {
    // The entry expires with the oldest open part it contains; closed bars
    // alone keep it for a full period
    Timestamp anchor = clock_.now();
    for (const auto& span : spans) {
        if (!has_open_part(span)) {
            continue;
        }
        Timestamp open_start = std::max(span.range.start, core::floor_to_day(span.fetched_at));
        if (series.range.overlaps(DateRange(open_start, span.range.end))) {
            anchor = std::min(anchor, span.fetched_at);
        }
    }
    series_cache_.set(series_key(symbol), CachedSeries{series, spans}, TtlClass::HISTORICAL,
                      anchor);
}

bool CacheOrchestrator::has_open_part(const CoverageSpan& span) const {
    return core::floor_to_day(span.fetched_at) <= span.range.end;
}

bool CacheOrchestrator::is_stale_span(const CoverageSpan& span) const {
    return has_open_part(span) && clock_.now() - span.fetched_at >= ttl_.historical;
}

Timestamp CacheOrchestrator::fetched_at_within(const std::vector<CoverageSpan>& spans,
                                               const DateRange& range) {
    Timestamp fetched_at{};
    for (const auto& span : spans) {
        if (span.range.overlaps(range)) {
            fetched_at = std::max(fetched_at, span.fetched_at);
        }
    }
    return fetched_at;
}

// ============================================================================
// Quotes
// ============================================================================

Result<QuoteResult> CacheOrchestrator::resolve_quote(const std::string& symbol,
                                                     const RequestContext& ctx) {
    auto normalized = normalize_symbol(symbol);
    if (normalized.is_error()) {
        return forward_error<QuoteResult>(normalized);
    }
    const std::string sym = normalized.value();

    auto cached = quote_cache_.get(quote_key(sym));
    if (cached) {
        DEBUG("Memory hit for quote " << sym);
        return Result<QuoteResult>(std::move(*cached));
    }

    return quote_flights_.run(
        "quote|" + sym, [this, sym]() { return fetch_quote_or_fallback(sym); }, ctx);
}

Result<QuoteResult> CacheOrchestrator::fetch_quote_or_fallback(const std::string& symbol) {
    auto quote = providers_->fetch_quote(symbol);
    if (quote.is_ok()) {
        QuoteResult result;
        result.quote = quote.value();
        result.fetched_at = clock_.now();
        quote_cache_.set(quote_key(symbol), result, TtlClass::LIVE, result.fetched_at);
        return Result<QuoteResult>(std::move(result));
    }

    if (quote.error()->code() == ErrorCode::VALIDATION_ERROR) {
        return forward_error<QuoteResult>(quote);
    }

    std::optional<PriceBar> last_bar;
    Timestamp backing_fetch{};

    // Both tiers answer only from the same recent window
    Timestamp today = core::floor_to_day(clock_.now());
    DateRange window(today - Days(QUOTE_FALLBACK_LOOKBACK_DAYS), today);

    auto cached = series_cache_.get(series_key(symbol));
    if (cached && !cached->series.empty() && window.contains(cached->series.bars.back().date)) {
        last_bar = cached->series.bars.back();
        backing_fetch = cached->series.fetched_at;
    } else {
        auto stored = store_->get(symbol, window);
        if (stored.is_error()) {
            WARN("Store read failed for quote fallback of " << symbol << ": "
                                                             << stored.error()->what());
        } else if (!stored.value().series.empty()) {
            last_bar = stored.value().series.bars.back();
            backing_fetch = stored.value().series.fetched_at;
        }
    }

    if (!last_bar) {
        ERROR("No quote for " << symbol << ": " << quote.error()->to_string());
        return forward_error<QuoteResult>(quote);
    }

    WARN("Serving last stored close for " << symbol << " after provider failure: "
                                          << quote.error()->what());
    QuoteResult result;
    result.quote = *last_bar;
    result.fetched_at = backing_fetch;
    result.stale = true;
    result.warning = DataWarning::STALE_DATA_RETURNED;
    result.warning_message = quote.error()->to_string();
    return Result<QuoteResult>(std::move(result));
}

// ============================================================================
// Analyses
// ============================================================================

Result<analytics::AnalysisResult> CacheOrchestrator::resolve_metrics(
    const analytics::AnalysisRequest& request, const RequestContext& ctx) {
    using analytics::AnalysisResult;

    analytics::AnalysisRequest normalized = request;
    for (auto& allocation : normalized.allocations) {
        auto sym = normalize_symbol(allocation.symbol);
        if (sym.is_error()) {
            return forward_error<AnalysisResult>(sym);
        }
        allocation.symbol = sym.value();
    }
    if (!normalized.benchmark_symbol.empty()) {
        auto sym = normalize_symbol(normalized.benchmark_symbol);
        if (sym.is_error()) {
            return forward_error<AnalysisResult>(sym);
        }
        normalized.benchmark_symbol = sym.value();
    }
    if (!normalized.range.is_valid()) {
        return make_error<AnalysisResult>(ErrorCode::VALIDATION_ERROR,
                                          "Analysis range start after end", COMPONENT);
    }
    normalized.range = DateRange(core::floor_to_day(normalized.range.start),
                                 core::floor_to_day(normalized.range.end));

    auto weights = analytics::compute_weights(normalized.allocations);
    if (weights.is_error()) {
        return forward_error<AnalysisResult>(weights);
    }

    const std::string key = normalized.fingerprint();
    auto candidate = cached_analysis(key);

    std::map<std::string, PriceSeries> series;
    std::vector<std::string> stale_symbols;
    std::string stale_message;
    for (const auto& sym : normalized.symbols()) {
        auto resolved = resolve_series(sym, normalized.range, ctx);
        if (resolved.is_error()) {
            return forward_error<AnalysisResult>(resolved);
        }
        if (resolved.value().stale) {
            stale_symbols.push_back(sym);
            stale_message = resolved.value().warning_message;
        }
        series[sym] = resolved.value().series;
    }

    std::optional<PriceSeries> benchmark;
    if (!normalized.benchmark_symbol.empty()) {
        auto in_portfolio = series.find(normalized.benchmark_symbol);
        if (in_portfolio != series.end()) {
            benchmark = in_portfolio->second;
        } else {
            auto resolved = resolve_series(normalized.benchmark_symbol, normalized.range, ctx);
            if (resolved.is_error()) {
                WARN("Benchmark " << normalized.benchmark_symbol
                                  << " unavailable, beta omitted: " << resolved.error()->what());
            } else {
                if (resolved.value().stale) {
                    stale_symbols.push_back(normalized.benchmark_symbol);
                    stale_message = resolved.value().warning_message;
                }
                benchmark = resolved.value().series;
            }
        }
    }

    if (candidate && stale_symbols.empty() && is_still_valid(*candidate, series, benchmark)) {
        DEBUG("Analysis hit for " << key);
        analysis_cache_.set(key, *candidate, TtlClass::ANALYSIS, candidate->cached_at);

        // The key holds weights, not amounts; report the caller's dollars
        std::map<std::string, double> dollars;
        for (const auto& allocation : normalized.allocations) {
            dollars[allocation.symbol] += allocation.dollar_amount;
        }
        for (auto& asset : candidate->assets) {
            asset.dollar_amount = dollars[asset.symbol];
        }
        candidate->label = normalized.label;
        return Result<AnalysisResult>(std::move(*candidate));
    }
    DEBUG("Analysis miss for " << key);

    auto computed =
        analytics::analyze(normalized, series, benchmark, analytics_config_.min_beta_samples);
    if (computed.is_error()) {
        return forward_error<AnalysisResult>(computed);
    }
    AnalysisResult result = computed.value();

    if (!stale_symbols.empty()) {
        std::string joined;
        for (const auto& sym : stale_symbols) {
            joined += (joined.empty() ? "" : ",") + sym;
        }
        WARN("Analysis " << key << " computed from stale series: " << joined);
        result.stale = true;
        result.warning = DataWarning::STALE_DATA_RETURNED;
        result.warning_message = "Stale series " + joined + ": " + stale_message;
        return Result<AnalysisResult>(std::move(result));
    }

    // Whole seconds, as the row keeps it
    result.cached_at = core::from_epoch_seconds(core::to_epoch_seconds(clock_.now()));
    analysis_cache_.set(key, result, TtlClass::ANALYSIS, result.cached_at);
    auto stored = store_->put_analysis(result);
    if (stored.is_error()) {
        WARN("Failed to persist analysis " << key << ": " << stored.error()->what());
    }
    return Result<AnalysisResult>(std::move(result));
}

std::optional<analytics::AnalysisResult> CacheOrchestrator::cached_analysis(
    const std::string& key) {
    auto in_memory = analysis_cache_.get(key);
    if (in_memory) {
        return in_memory;
    }

    auto stored = store_->get_analysis(key);
    if (stored.is_error()) {
        WARN("Store read failed for analysis " << key << ": " << stored.error()->what());
        return std::nullopt;
    }
    const auto& found = stored.value();
    if (!found || clock_.now() - found->cached_at >= ttl_.analysis) {
        return std::nullopt;
    }
    return found;
}

bool CacheOrchestrator::is_still_valid(const analytics::AnalysisResult& result,
                                       const std::map<std::string, PriceSeries>& series,
                                       const std::optional<PriceSeries>& benchmark) const {
    if (clock_.now() - result.cached_at >= ttl_.analysis) {
        return false;
    }

    std::map<std::string, Timestamp> current;
    for (const auto& [symbol, s] : series) {
        current[symbol] = s.fetched_at;
    }
    if (benchmark) {
        current[benchmark->symbol] = benchmark->fetched_at;
    }
    return current == result.series_fetched_at;
}

// ============================================================================
// Invalidation
// ============================================================================

size_t CacheOrchestrator::invalidate(const CacheScope& scope) {
    size_t removed = 0;

    if (scope.is_all()) {
        removed += series_cache_.clear();
        removed += quote_cache_.clear();
        removed += analysis_cache_.clear();

        auto stored = store_->invalidate_all();
        if (stored.is_error()) {
            WARN("Store invalidation failed: " << stored.error()->what());
        } else {
            removed += stored.value();
        }
        INFO("Invalidated all cached data, " << removed << " entries removed");
        return removed;
    }

    auto normalized = normalize_symbol(scope.target());
    if (normalized.is_error()) {
        WARN("Ignoring invalidation of invalid symbol " << scope.target());
        return 0;
    }
    const std::string sym = normalized.value();

    std::lock_guard<std::mutex> lock(key_locks_.for_key(sym));
    removed += series_cache_.erase(series_key(sym)) ? 1 : 0;
    removed += quote_cache_.erase(quote_key(sym)) ? 1 : 0;
    removed += analysis_cache_.erase_if(
        [&sym](const std::string&, const analytics::AnalysisResult& result) {
            return result.series_fetched_at.count(sym) > 0 ||
                   std::find(result.symbols.begin(), result.symbols.end(), sym) !=
                       result.symbols.end();
        });

    auto stored = store_->invalidate_symbol(sym);
    if (stored.is_error()) {
        WARN("Store invalidation failed for " << sym << ": " << stored.error()->what());
    } else {
        removed += stored.value();
    }
    INFO("Invalidated " << sym << ", " << removed << " entries removed");
    return removed;
}

}  // namespace riskdesk
