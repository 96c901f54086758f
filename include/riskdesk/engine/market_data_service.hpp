// include/riskdesk/engine/market_data_service.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "riskdesk/cache/cache_orchestrator.hpp"
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/data/credential_store.hpp"
#include "riskdesk/engine/engine_config.hpp"

namespace riskdesk {

/**
 * @class MarketDataService
 * @brief Entry point of the engine for presentation collaborators
 *
 * Hard failures are Result errors. Data served from the store after a
 * provider failure is a successful result flagged stale.
 */
class MarketDataService {
public:
    /**
     * @param config Engine configuration, cache and analytics sections used
     * @param store Durable tier
     * @param providers Provider chain
     * @param clock Time source shared with the providers
     */
    MarketDataService(EngineConfig config, std::shared_ptr<PriceStore> store,
                      std::shared_ptr<QuoteProviderAdapter> providers,
                      std::shared_ptr<const core::Clock> clock);

    /**
     * @brief Wire the production stack: PostgreSQL store, libcurl transport
     *        and the configured provider chain
     */
    static Result<std::shared_ptr<MarketDataService>> create(const EngineConfig& config,
                                                             const CredentialStore& credentials);

    Result<SeriesResult> get_historical_series(const std::string& symbol, Timestamp start,
                                               Timestamp end);

    Result<QuoteResult> get_live_quote(const std::string& symbol);

    /**
     * @brief Risk metrics of a dollar allocation
     * @param risk_free_rate Annual rate, configured default when unset
     * @param range Defaults to the configured lookback ending today
     */
    Result<analytics::AnalysisResult> get_portfolio_metrics(
        const std::vector<Allocation>& allocations,
        std::optional<double> risk_free_rate = std::nullopt,
        std::optional<DateRange> range = std::nullopt);

    Result<analytics::AnalysisResult> get_symbol_metrics(
        const std::string& symbol, const DateRange& range,
        std::optional<double> risk_free_rate = std::nullopt);

    /**
     * @return Entries and rows removed
     */
    size_t invalidate_cache(const CacheScope& scope);

    /**
     * @brief P&L of holdings at their latest quotes
     */
    Result<PortfolioPnl> get_portfolio_pnl(const std::vector<Holding>& holdings);

    const EngineConfig& config() const {
        return config_;
    }

    CacheOrchestrator& orchestrator() {
        return *orchestrator_;
    }

private:
    DateRange default_range() const;

    EngineConfig config_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<QuoteProviderAdapter> providers_;
    std::unique_ptr<CacheOrchestrator> orchestrator_;
};

}  // namespace riskdesk
