// include/riskdesk/providers/yahoo_finance_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/providers/http_client.hpp"
#include "riskdesk/providers/provider_config.hpp"
#include "riskdesk/providers/quote_provider.hpp"

namespace riskdesk {

/**
 * @class YahooFinanceProvider
 * @brief Consumer grade fallback provider over the Yahoo v8 chart endpoint
 */
class YahooFinanceProvider : public QuoteProvider {
public:
    YahooFinanceProvider(std::shared_ptr<HttpTransport> transport, ProviderSettings settings,
                         const core::Clock& clock);

    std::string name() const override {
        return "yahoo_finance";
    }

    Result<std::vector<PriceBar>> fetch_history(const std::string& symbol,
                                                const DateRange& range) override;

    /**
     * @brief Latest bar of a five day window, close replaced by the
     *        regular market price when the payload carries one
     */
    Result<PriceBar> fetch_quote(const std::string& symbol) override;

    /**
     * @brief Parse a chart response body into daily bars
     *
     * Bar dates are the exchange-local trading day, derived from the bar
     * timestamp shifted by the payload's gmtoffset.
     */
    static Result<std::vector<PriceBar>> parse_chart(const std::string& symbol,
                                                     const std::string& body);

    /**
     * @brief Regular market price from a chart body, if present
     */
    static std::optional<Price> parse_market_price(const std::string& body);

private:
    Result<std::string> request(const std::string& symbol, Timestamp period1, Timestamp period2);

    std::shared_ptr<HttpTransport> transport_;
    ProviderSettings settings_;
    const core::Clock& clock_;
};

}  // namespace riskdesk
