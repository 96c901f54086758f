// include/riskdesk/providers/quote_provider.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "riskdesk/core/error.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {

/**
 * @brief Interface for a remote source of daily bars and quotes
 *
 * Implementations are stateless apart from their transport and must be safe
 * to call from several threads at once. They report failures with the engine
 * taxonomy: NOT_FOUND for unknown symbols, RATE_LIMITED for quota signals and
 * TRANSIENT_ERROR for everything that may succeed on another attempt.
 */
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    /**
     * @brief Short stable name used in logs and configuration
     */
    virtual std::string name() const = 0;

    /**
     * @brief Fetch daily bars for a symbol
     * @param symbol Normalised (upper-case) ticker
     * @param range Inclusive date range
     * @return Bars inside the range, any order, possibly with duplicates
     */
    virtual Result<std::vector<PriceBar>> fetch_history(const std::string& symbol,
                                                        const DateRange& range) = 0;

    /**
     * @brief Fetch the latest quote for a symbol
     * @return Bar whose close is the last traded price
     */
    virtual Result<PriceBar> fetch_quote(const std::string& symbol) = 0;
};

/**
 * @brief RATE_LIMITED error carrying the server's requested back-off
 */
class RateLimitError : public RiskDeskError {
public:
    RateLimitError(const std::string& message, const std::string& component,
                   std::optional<std::chrono::seconds> retry_after = std::nullopt)
        : RiskDeskError(ErrorCode::RATE_LIMITED, message, component), retry_after_(retry_after) {}

    std::optional<std::chrono::seconds> retry_after() const {
        return retry_after_;
    }

    std::unique_ptr<RiskDeskError> clone() const override {
        return std::make_unique<RateLimitError>(*this);
    }

private:
    std::optional<std::chrono::seconds> retry_after_;
};

/**
 * @brief Error Result for a non-2xx HTTP status
 *
 * 429 responses produce a RateLimitError so the Retry-After header survives
 * up to the provider chain.
 */
template <typename T>
Result<T> make_status_error(ErrorCode code, const std::string& message,
                            const std::string& component,
                            std::optional<long> retry_after_seconds = std::nullopt) {
    if (code == ErrorCode::RATE_LIMITED) {
        std::optional<std::chrono::seconds> retry_after;
        if (retry_after_seconds && *retry_after_seconds > 0) {
            retry_after = std::chrono::seconds(*retry_after_seconds);
        }
        return Result<T>(std::unique_ptr<RiskDeskError>(
            std::make_unique<RateLimitError>(message, component, retry_after)));
    }
    return make_error<T>(code, message, component);
}

/**
 * @brief Map an HTTP status to the engine error taxonomy
 * @return ErrorCode::NONE for 2xx responses
 */
ErrorCode classify_http_status(long status);

/**
 * @brief Upper-case and validate a ticker symbol
 * @return Normalised symbol or VALIDATION_ERROR
 */
Result<std::string> normalize_symbol(const std::string& symbol);

/**
 * @brief Clip bars to a range, sort ascending and drop duplicate dates
 *
 * When two bars share a date the later one in the input wins.
 */
std::vector<PriceBar> normalize_bars(std::vector<PriceBar> bars, const DateRange& range);

}  // namespace riskdesk
