// src/engine/market_data_service.cpp

#include "riskdesk/engine/market_data_service.hpp"
#include <cmath>
#include "riskdesk/core/logger.hpp"
#include "riskdesk/data/connection_pool.hpp"
#include "riskdesk/data/postgres_price_store.hpp"
#include "riskdesk/providers/http_client.hpp"

namespace riskdesk {

namespace {
const std::string COMPONENT = "MarketDataService";
}

MarketDataService::MarketDataService(EngineConfig config, std::shared_ptr<PriceStore> store,
                                     std::shared_ptr<QuoteProviderAdapter> providers,
                                     std::shared_ptr<const core::Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)), providers_(std::move(providers)) {
    Logger::register_component(COMPONENT);
    orchestrator_ = std::make_unique<CacheOrchestrator>(std::move(store), providers_, config_.cache,
                                                        *clock_, config_.analytics);
}

Result<std::shared_ptr<MarketDataService>> MarketDataService::create(
    const EngineConfig& config, const CredentialStore& credentials) {
    using ServicePtr = std::shared_ptr<MarketDataService>;
    Logger::register_component(COMPONENT);

    auto username = credentials.get_credential("database", "username");
    if (username.is_error()) {
        return forward_error<ServicePtr>(username);
    }
    auto password = credentials.get_credential("database", "password");
    if (password.is_error()) {
        return forward_error<ServicePtr>(password);
    }

    auto pool = std::make_shared<ConnectionPool>(
        config.database.connection_string(username.value(), password.value()),
        config.database.pool_size, config.database.max_pool_size);
    auto pool_ready = pool->initialize();
    if (pool_ready.is_error()) {
        return forward_error<ServicePtr>(pool_ready);
    }

    auto store = std::make_shared<PostgresPriceStore>(
        pool, config.database.schema, std::chrono::milliseconds(config.database.acquire_timeout_ms));
    auto schema_ready = store->initialize_schema();
    if (schema_ready.is_error()) {
        return forward_error<ServicePtr>(schema_ready);
    }

    std::string alpha_vantage_key;
    auto key = credentials.get_credential("providers", "alpha_vantage_key");
    if (key.is_error()) {
        WARN("No Alpha Vantage key configured, requests will fall through to the next provider");
    } else {
        alpha_vantage_key = key.value();
    }

    auto clock = std::make_shared<core::SystemClock>();
    auto transport = std::make_shared<CurlHttpClient>();
    std::shared_ptr<QuoteProviderAdapter> providers =
        QuoteProviderAdapter::create(config.providers, transport, alpha_vantage_key, *clock);
    if (providers->size() == 0) {
        return make_error<ServicePtr>(ErrorCode::NOT_INITIALIZED, "No quote provider is enabled",
                                      COMPONENT);
    }

    std::string provider_names;
    for (const auto& name : providers->provider_names()) {
        provider_names += (provider_names.empty() ? "" : ", ") + name;
    }
    INFO("Market data service ready, providers in order: " << provider_names);

    return Result<ServicePtr>(
        std::make_shared<MarketDataService>(config, store, providers, clock));
}

Result<SeriesResult> MarketDataService::get_historical_series(const std::string& symbol,
                                                              Timestamp start, Timestamp end) {
    return orchestrator_->resolve_series(symbol, DateRange(start, end));
}

Result<QuoteResult> MarketDataService::get_live_quote(const std::string& symbol) {
    return orchestrator_->resolve_quote(symbol);
}

Result<analytics::AnalysisResult> MarketDataService::get_portfolio_metrics(
    const std::vector<Allocation>& allocations, std::optional<double> risk_free_rate,
    std::optional<DateRange> range) {
    analytics::AnalysisRequest request;
    request.label = "portfolio";
    request.allocations = allocations;
    request.range = range.value_or(default_range());
    request.risk_free_rate = risk_free_rate.value_or(config_.analytics.default_risk_free_rate);
    request.include_correlation = config_.analytics.include_correlation;
    request.benchmark_symbol = config_.analytics.benchmark_symbol;
    request.min_correlation_samples = config_.analytics.min_correlation_samples;

    if (!std::isfinite(request.risk_free_rate)) {
        return make_error<analytics::AnalysisResult>(ErrorCode::VALIDATION_ERROR,
                                                     "Risk-free rate must be finite", COMPONENT);
    }
    return orchestrator_->resolve_metrics(request);
}

Result<analytics::AnalysisResult> MarketDataService::get_symbol_metrics(
    const std::string& symbol, const DateRange& range, std::optional<double> risk_free_rate) {
    analytics::AnalysisRequest request;
    request.label = symbol;
    request.allocations = {Allocation{symbol, 1.0}};
    request.range = range;
    request.risk_free_rate = risk_free_rate.value_or(config_.analytics.default_risk_free_rate);
    request.include_correlation = false;
    request.benchmark_symbol = config_.analytics.benchmark_symbol;
    request.min_correlation_samples = config_.analytics.min_correlation_samples;

    if (!std::isfinite(request.risk_free_rate)) {
        return make_error<analytics::AnalysisResult>(ErrorCode::VALIDATION_ERROR,
                                                     "Risk-free rate must be finite", COMPONENT);
    }
    return orchestrator_->resolve_metrics(request);
}

size_t MarketDataService::invalidate_cache(const CacheScope& scope) {
    return orchestrator_->invalidate(scope);
}

Result<PortfolioPnl> MarketDataService::get_portfolio_pnl(const std::vector<Holding>& holdings) {
    if (holdings.empty()) {
        return make_error<PortfolioPnl>(ErrorCode::VALIDATION_ERROR, "No holdings given",
                                        COMPONENT);
    }

    std::vector<PositionPnl> positions;
    positions.reserve(holdings.size());
    for (const auto& holding : holdings) {
        if (!std::isfinite(holding.quantity) || !std::isfinite(holding.cost_basis) ||
            holding.cost_basis < 0.0) {
            return make_error<PortfolioPnl>(ErrorCode::VALIDATION_ERROR,
                                            "Invalid holding for " + holding.symbol, COMPONENT);
        }

        auto quote = orchestrator_->resolve_quote(holding.symbol);
        if (quote.is_error()) {
            return forward_error<PortfolioPnl>(quote);
        }

        PositionPnl position = analytics::position_pnl(holding, quote.value().quote.close);
        position.symbol = quote.value().quote.symbol.empty() ? holding.symbol
                                                             : quote.value().quote.symbol;
        position.stale = quote.value().stale;
        positions.push_back(std::move(position));
    }
    return Result<PortfolioPnl>(analytics::aggregate_pnl(std::move(positions)));
}

DateRange MarketDataService::default_range() const {
    Timestamp today = core::floor_to_day(clock_->now());
    return DateRange(today - Days(config_.analytics.default_lookback_days), today);
}

}  // namespace riskdesk
