// include/riskdesk/providers/provider_chain.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/providers/http_client.hpp"
#include "riskdesk/providers/provider_config.hpp"
#include "riskdesk/providers/quote_provider.hpp"
#include "riskdesk/providers/token_bucket.hpp"

namespace riskdesk {

/**
 * @brief Per-provider call accounting, for logs and tests
 */
struct ProviderStats {
    std::string name;
    size_t attempts{0};
    size_t successes{0};
    size_t skipped_rate_limited{0};
    size_t rate_limited{0};
    size_t transient_failures{0};
    size_t not_found{0};
};

/**
 * @class QuoteProviderAdapter
 * @brief Ordered chain of quote providers with validation, rate limiting
 *        and fallback
 *
 * Each request is validated before any provider is touched. Providers are
 * tried in order; TRANSIENT_ERROR and RATE_LIMITED move on to the next one,
 * NOT_FOUND is final only if every attempted provider said so, and a provider
 * whose token bucket is empty or blocked is skipped without being called.
 */
class QuoteProviderAdapter {
public:
    explicit QuoteProviderAdapter(const core::Clock& clock);

    /**
     * @brief Append a provider to the chain
     * @param provider Provider implementation
     * @param settings Bucket and cooldown settings for this provider
     */
    void add_provider(std::shared_ptr<QuoteProvider> provider, const ProviderSettings& settings);

    /**
     * @brief Build the configured chain over a shared HTTP transport
     */
    static std::unique_ptr<QuoteProviderAdapter> create(const ProviderConfig& config,
                                                        std::shared_ptr<HttpTransport> transport,
                                                        const std::string& alpha_vantage_key,
                                                        const core::Clock& clock);

    /**
     * @brief Fetch daily history for a symbol
     * @return Series clipped to the range, ascending, stamped with the fetch time
     */
    Result<PriceSeries> fetch_history(const std::string& symbol, const DateRange& range);

    /**
     * @brief Fetch the latest quote for a symbol
     */
    Result<PriceBar> fetch_quote(const std::string& symbol);

    std::vector<std::string> provider_names() const;

    std::vector<ProviderStats> stats() const;

    size_t size() const {
        return slots_.size();
    }

private:
    struct Slot {
        std::shared_ptr<QuoteProvider> provider;
        std::unique_ptr<TokenBucket> bucket;
        std::chrono::seconds cooldown;

        std::atomic<size_t> attempts{0};
        std::atomic<size_t> successes{0};
        std::atomic<size_t> skipped_rate_limited{0};
        std::atomic<size_t> rate_limited{0};
        std::atomic<size_t> transient_failures{0};
        std::atomic<size_t> not_found{0};
    };

    template <typename T>
    Result<T> run_chain(const std::string& operation, const std::string& symbol,
                        const std::function<Result<T>(QuoteProvider&)>& call);

    const core::Clock& clock_;
    std::vector<std::unique_ptr<Slot>> slots_;
};

}  // namespace riskdesk
