#include "riskdesk/providers/alpha_vantage_provider.hpp"
#include "riskdesk/core/logger.hpp"

namespace riskdesk {

namespace {

const std::string COMPONENT = "AlphaVantageProvider";

double parse_number(const nlohmann::json& node, const char* field) {
    const auto& value = node.at(field);
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}

}  // namespace

AlphaVantageProvider::AlphaVantageProvider(std::shared_ptr<HttpTransport> transport,
                                           std::string api_key, ProviderSettings settings,
                                           const core::Clock& clock)
    : transport_(std::move(transport)),
      api_key_(std::move(api_key)),
      settings_(std::move(settings)),
      clock_(clock) {}

Result<std::string> AlphaVantageProvider::request(const std::string& query) {
    if (!transport_) {
        return make_error<std::string>(ErrorCode::NOT_INITIALIZED, "No HTTP transport",
                                       COMPONENT);
    }
    if (api_key_.empty()) {
        // Without a key every call comes back as an "Information" body, treat
        // it like any other refusal and let the chain move on
        return make_error<std::string>(ErrorCode::TRANSIENT_ERROR,
                                       "Alpha Vantage API key not configured", COMPONENT);
    }

    std::string url = settings_.base_url + "?" + query + "&apikey=" + url_encode(api_key_);
    auto response = transport_->get(url, {}, std::chrono::milliseconds(settings_.timeout_ms));
    if (response.is_error()) {
        return forward_error<std::string>(response, COMPONENT);
    }

    const HttpResponse& http = response.value();
    ErrorCode status_code = classify_http_status(http.status);
    if (status_code != ErrorCode::NONE) {
        return make_status_error<std::string>(
            status_code, "HTTP " + std::to_string(http.status) + " from Alpha Vantage",
            COMPONENT, http.retry_after_seconds);
    }
    return Result<std::string>(http.body);
}

Result<void> AlphaVantageProvider::check_api_errors(const nlohmann::json& body) {
    if (!body.is_object()) {
        return make_error<void>(ErrorCode::TRANSIENT_ERROR, "Response is not a JSON object",
                                COMPONENT);
    }
    if (body.contains("Error Message")) {
        return make_error<void>(ErrorCode::NOT_FOUND, body.at("Error Message").dump(),
                                COMPONENT);
    }
    if (body.contains("Note")) {
        return make_error<void>(ErrorCode::RATE_LIMITED, body.at("Note").dump(), COMPONENT);
    }
    if (body.contains("Information")) {
        return make_error<void>(ErrorCode::RATE_LIMITED, body.at("Information").dump(),
                                COMPONENT);
    }
    return Result<void>();
}

Result<std::vector<PriceBar>> AlphaVantageProvider::parse_daily_series(const std::string& symbol,
                                                                       const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<std::vector<PriceBar>>(ErrorCode::TRANSIENT_ERROR,
                                                 std::string("Malformed response: ") + e.what(),
                                                 COMPONENT);
    }

    auto api_check = check_api_errors(j);
    if (api_check.is_error()) {
        return forward_error<std::vector<PriceBar>>(api_check);
    }

    const char* series_key = "Time Series (Daily)";
    if (!j.contains(series_key) || !j.at(series_key).is_object()) {
        return make_error<std::vector<PriceBar>>(ErrorCode::TRANSIENT_ERROR,
                                                 "Missing '" + std::string(series_key) +
                                                     "' in response for " + symbol,
                                                 COMPONENT);
    }

    std::vector<PriceBar> bars;
    try {
        for (const auto& [date_str, values] : j.at(series_key).items()) {
            auto date = core::parse_date(date_str);
            if (!date) {
                WARN("Skipping bar with unparseable date '" << date_str << "' for " << symbol);
                continue;
            }
            bars.emplace_back(symbol, *date, parse_number(values, "1. open"),
                              parse_number(values, "2. high"), parse_number(values, "3. low"),
                              parse_number(values, "4. close"),
                              parse_number(values, "5. volume"));
        }
    } catch (const std::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::TRANSIENT_ERROR,
            "Malformed bar in response for " + symbol + ": " + e.what(), COMPONENT);
    }
    return Result<std::vector<PriceBar>>(std::move(bars));
}

Result<PriceBar> AlphaVantageProvider::parse_global_quote(const std::string& symbol,
                                                          const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<PriceBar>(ErrorCode::TRANSIENT_ERROR,
                                    std::string("Malformed response: ") + e.what(), COMPONENT);
    }

    auto api_check = check_api_errors(j);
    if (api_check.is_error()) {
        return forward_error<PriceBar>(api_check);
    }

    // Unknown symbols come back as an empty "Global Quote" object
    if (!j.contains("Global Quote") || !j.at("Global Quote").is_object() ||
        j.at("Global Quote").empty()) {
        return make_error<PriceBar>(ErrorCode::NOT_FOUND, "No quote for symbol " + symbol,
                                    COMPONENT);
    }

    const auto& quote = j.at("Global Quote");
    try {
        auto date = core::parse_date(quote.at("07. latest trading day").get<std::string>());
        if (!date) {
            return make_error<PriceBar>(ErrorCode::TRANSIENT_ERROR,
                                        "Unparseable trading day in quote for " + symbol,
                                        COMPONENT);
        }
        return Result<PriceBar>(PriceBar(symbol, *date, parse_number(quote, "02. open"),
                                         parse_number(quote, "03. high"),
                                         parse_number(quote, "04. low"),
                                         parse_number(quote, "05. price"),
                                         parse_number(quote, "06. volume")));
    } catch (const std::exception& e) {
        return make_error<PriceBar>(ErrorCode::TRANSIENT_ERROR,
                                    "Malformed quote for " + symbol + ": " + e.what(), COMPONENT);
    }
}

Result<std::vector<PriceBar>> AlphaVantageProvider::fetch_history(const std::string& symbol,
                                                                  const DateRange& range) {
    Logger::register_component(COMPONENT);

    auto compact_cutoff = core::floor_to_day(clock_.now()) - Days(settings_.compact_window_days);
    std::string output_size = range.start >= compact_cutoff ? "compact" : "full";

    std::string query = "function=TIME_SERIES_DAILY&symbol=" + url_encode(symbol) +
                        "&outputsize=" + output_size;
    DEBUG("Requesting " << output_size << " daily series for " << symbol);

    auto response = request(query);
    if (response.is_error()) {
        return forward_error<std::vector<PriceBar>>(response);
    }

    auto parsed = parse_daily_series(symbol, response.value());
    if (parsed.is_error()) {
        return parsed;
    }
    return Result<std::vector<PriceBar>>(normalize_bars(parsed.value(), range));
}

Result<PriceBar> AlphaVantageProvider::fetch_quote(const std::string& symbol) {
    Logger::register_component(COMPONENT);

    auto response = request("function=GLOBAL_QUOTE&symbol=" + url_encode(symbol));
    if (response.is_error()) {
        return forward_error<PriceBar>(response);
    }
    return parse_global_quote(symbol, response.value());
}

}  // namespace riskdesk
