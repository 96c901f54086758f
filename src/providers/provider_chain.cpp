#include "riskdesk/providers/provider_chain.hpp"
#include "riskdesk/core/logger.hpp"
#include "riskdesk/providers/alpha_vantage_provider.hpp"
#include "riskdesk/providers/yahoo_finance_provider.hpp"

namespace riskdesk {

namespace {

const std::string COMPONENT = "QuoteProviderAdapter";

template <typename T>
Result<T> invoke_provider(const std::function<Result<T>(QuoteProvider&)>& call,
                          QuoteProvider& provider) {
    try {
        return call(provider);
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::TRANSIENT_ERROR,
                             "Provider " + provider.name() + " threw: " + e.what(), COMPONENT);
    }
}

}  // namespace

QuoteProviderAdapter::QuoteProviderAdapter(const core::Clock& clock) : clock_(clock) {}

void QuoteProviderAdapter::add_provider(std::shared_ptr<QuoteProvider> provider,
                                        const ProviderSettings& settings) {
    auto slot = std::make_unique<Slot>();
    slot->provider = std::move(provider);
    slot->bucket = std::make_unique<TokenBucket>(settings.bucket_capacity,
                                                 settings.refill_per_minute, clock_);
    slot->cooldown = std::chrono::seconds(settings.rate_limit_cooldown_seconds);
    slots_.push_back(std::move(slot));
}

std::unique_ptr<QuoteProviderAdapter> QuoteProviderAdapter::create(
    const ProviderConfig& config, std::shared_ptr<HttpTransport> transport,
    const std::string& alpha_vantage_key, const core::Clock& clock) {
    auto adapter = std::make_unique<QuoteProviderAdapter>(clock);

    for (const auto& name : config.provider_order()) {
        if (name == "alpha_vantage" && config.alpha_vantage.enabled) {
            adapter->add_provider(std::make_shared<AlphaVantageProvider>(
                                      transport, alpha_vantage_key, config.alpha_vantage, clock),
                                  config.alpha_vantage);
        } else if (name == "yahoo_finance" && config.yahoo_finance.enabled) {
            adapter->add_provider(
                std::make_shared<YahooFinanceProvider>(transport, config.yahoo_finance, clock),
                config.yahoo_finance);
        }
    }
    return adapter;
}

template <typename T>
Result<T> QuoteProviderAdapter::run_chain(const std::string& operation, const std::string& symbol,
                                          const std::function<Result<T>(QuoteProvider&)>& call) {
    Logger::register_component(COMPONENT);

    if (slots_.empty()) {
        return make_error<T>(ErrorCode::NOT_INITIALIZED, "No quote providers configured",
                             COMPONENT);
    }

    size_t attempted = 0;
    size_t not_found = 0;
    bool any_transient = false;
    std::string last_message;

    for (size_t i = 0; i < slots_.size(); ++i) {
        Slot& slot = *slots_[i];
        const std::string provider_name = slot.provider->name();

        if (!slot.bucket->try_acquire()) {
            slot.skipped_rate_limited++;
            WARN("Skipping " << provider_name << " for " << operation << " " << symbol
                             << ": call budget exhausted");
            continue;
        }

        attempted++;
        slot.attempts++;
        Result<T> result = invoke_provider(call, *slot.provider);

        if (result.is_ok()) {
            slot.successes++;
            if (i > 0) {
                INFO(operation << " " << symbol << " served by fallback " << provider_name);
            }
            return result;
        }

        const RiskDeskError* err = result.error();
        last_message = provider_name + ": " + err->what();

        switch (err->code()) {
            case ErrorCode::NOT_FOUND:
                slot.not_found++;
                DEBUG(provider_name << " does not know " << symbol);
                break;
            case ErrorCode::RATE_LIMITED: {
                slot.rate_limited++;
                std::chrono::seconds cooldown = slot.cooldown;
                if (auto rate_error = dynamic_cast<const RateLimitError*>(err)) {
                    if (rate_error->retry_after()) {
                        cooldown = *rate_error->retry_after();
                    }
                }
                slot.bucket->block_for(cooldown);
                WARN(provider_name << " rate limited on " << operation << " " << symbol
                                   << ", blocked for " << cooldown.count() << "s");
                break;
            }
            case ErrorCode::VALIDATION_ERROR:
                return result;
            default:
                slot.transient_failures++;
                any_transient = true;
                WARN(provider_name << " failed on " << operation << " " << symbol << ": "
                                   << err->what());
                break;
        }
    }

    if (any_transient) {
        return make_error<T>(ErrorCode::TRANSIENT_ERROR,
                             "All providers failed for " + symbol + " (last: " + last_message +
                                 ")",
                             COMPONENT);
    }
    if (attempted > 0 && not_found == attempted) {
        return make_error<T>(ErrorCode::NOT_FOUND, "Symbol not found: " + symbol, COMPONENT);
    }
    return make_error<T>(ErrorCode::RATE_LIMITED,
                         "All providers rate limited for " + symbol, COMPONENT);
}

Result<PriceSeries> QuoteProviderAdapter::fetch_history(const std::string& symbol,
                                                        const DateRange& range) {
    auto normalized = normalize_symbol(symbol);
    if (normalized.is_error()) {
        return forward_error<PriceSeries>(normalized);
    }
    if (!range.is_valid()) {
        return make_error<PriceSeries>(ErrorCode::VALIDATION_ERROR,
                                       "Range start after end: " +
                                           core::format_date(range.start) + " > " +
                                           core::format_date(range.end),
                                       COMPONENT);
    }

    const std::string& sym = normalized.value();
    DateRange day_range(core::floor_to_day(range.start), core::floor_to_day(range.end));

    auto bars = run_chain<std::vector<PriceBar>>(
        "history", sym,
        [&sym, &day_range](QuoteProvider& provider) {
            return provider.fetch_history(sym, day_range);
        });
    if (bars.is_error()) {
        return forward_error<PriceSeries>(bars);
    }

    PriceSeries series;
    series.symbol = sym;
    series.range = day_range;
    series.bars = normalize_bars(bars.value(), day_range);
    for (auto& bar : series.bars) {
        bar.symbol = sym;
    }
    // Whole seconds, the precision coverage spans are persisted at
    series.fetched_at = core::from_epoch_seconds(core::to_epoch_seconds(clock_.now()));
    return Result<PriceSeries>(std::move(series));
}

Result<PriceBar> QuoteProviderAdapter::fetch_quote(const std::string& symbol) {
    auto normalized = normalize_symbol(symbol);
    if (normalized.is_error()) {
        return forward_error<PriceBar>(normalized);
    }

    const std::string& sym = normalized.value();
    auto quote = run_chain<PriceBar>(
        "quote", sym, [&sym](QuoteProvider& provider) { return provider.fetch_quote(sym); });
    if (quote.is_error()) {
        return quote;
    }

    PriceBar bar = quote.value();
    bar.symbol = sym;
    return Result<PriceBar>(std::move(bar));
}

std::vector<std::string> QuoteProviderAdapter::provider_names() const {
    std::vector<std::string> names;
    for (const auto& slot : slots_) {
        names.push_back(slot->provider->name());
    }
    return names;
}

std::vector<ProviderStats> QuoteProviderAdapter::stats() const {
    std::vector<ProviderStats> out;
    for (const auto& slot : slots_) {
        ProviderStats s;
        s.name = slot->provider->name();
        s.attempts = slot->attempts.load();
        s.successes = slot->successes.load();
        s.skipped_rate_limited = slot->skipped_rate_limited.load();
        s.rate_limited = slot->rate_limited.load();
        s.transient_failures = slot->transient_failures.load();
        s.not_found = slot->not_found.load();
        out.push_back(s);
    }
    return out;
}

}  // namespace riskdesk
