// include/riskdesk/providers/alpha_vantage_provider.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/providers/http_client.hpp"
#include "riskdesk/providers/provider_config.hpp"
#include "riskdesk/providers/quote_provider.hpp"

namespace riskdesk {

/**
 * @class AlphaVantageProvider
 * @brief Professional grade provider over the Alpha Vantage query API
 *
 * History uses TIME_SERIES_DAILY, quotes use GLOBAL_QUOTE. Alpha Vantage
 * answers most failures with HTTP 200 and a JSON body that carries
 * "Error Message" (unknown symbol) or "Note"/"Information" (quota).
 */
class AlphaVantageProvider : public QuoteProvider {
public:
    AlphaVantageProvider(std::shared_ptr<HttpTransport> transport, std::string api_key,
                         ProviderSettings settings, const core::Clock& clock);

    std::string name() const override {
        return "alpha_vantage";
    }

    Result<std::vector<PriceBar>> fetch_history(const std::string& symbol,
                                                const DateRange& range) override;

    Result<PriceBar> fetch_quote(const std::string& symbol) override;

    /**
     * @brief Parse a TIME_SERIES_DAILY body
     */
    static Result<std::vector<PriceBar>> parse_daily_series(const std::string& symbol,
                                                            const std::string& body);

    /**
     * @brief Parse a GLOBAL_QUOTE body
     */
    static Result<PriceBar> parse_global_quote(const std::string& symbol,
                                               const std::string& body);

private:
    Result<std::string> request(const std::string& query);

    static Result<void> check_api_errors(const nlohmann::json& body);

    std::shared_ptr<HttpTransport> transport_;
    std::string api_key_;
    ProviderSettings settings_;
    const core::Clock& clock_;
};

}  // namespace riskdesk
