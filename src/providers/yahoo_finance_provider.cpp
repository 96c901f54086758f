#include "riskdesk/providers/yahoo_finance_provider.hpp"
#include <nlohmann/json.hpp>
#include "riskdesk/core/logger.hpp"

namespace riskdesk {

namespace {

const std::string COMPONENT = "YahooFinanceProvider";

// A Yahoo chart response with HTTP 404 still carries chart.error, so the
// body is inspected before the status when it parses
std::optional<ErrorCode> chart_error_code(const nlohmann::json& j, std::string& description) {
    if (!j.is_object() || !j.contains("chart") || !j.at("chart").is_object()) {
        return std::nullopt;
    }
    const auto& chart = j.at("chart");
    if (!chart.contains("error") || chart.at("error").is_null()) {
        return std::nullopt;
    }

    const auto& error = chart.at("error");
    if (!error.is_object()) {
        description = error.dump();
        return ErrorCode::TRANSIENT_ERROR;
    }
    std::string code = error.value("code", "");
    description = error.value("description", code);
    if (code == "Not Found") {
        return ErrorCode::NOT_FOUND;
    }
    if (code == "Too Many Requests") {
        return ErrorCode::RATE_LIMITED;
    }
    return ErrorCode::TRANSIENT_ERROR;
}

}  // namespace

YahooFinanceProvider::YahooFinanceProvider(std::shared_ptr<HttpTransport> transport,
                                           ProviderSettings settings, const core::Clock& clock)
    : transport_(std::move(transport)), settings_(std::move(settings)), clock_(clock) {}

Result<std::string> YahooFinanceProvider::request(const std::string& symbol, Timestamp period1,
                                                  Timestamp period2) {
    if (!transport_) {
        return make_error<std::string>(ErrorCode::NOT_INITIALIZED, "No HTTP transport",
                                       COMPONENT);
    }

    std::string url = settings_.base_url + "/v8/finance/chart/" + url_encode(symbol) +
                      "?period1=" + std::to_string(core::to_epoch_seconds(period1)) +
                      "&period2=" + std::to_string(core::to_epoch_seconds(period2)) +
                      "&interval=1d&events=history";

    auto response = transport_->get(url, {"Accept: application/json"},
                                    std::chrono::milliseconds(settings_.timeout_ms));
    if (response.is_error()) {
        return forward_error<std::string>(response, COMPONENT);
    }

    const HttpResponse& http = response.value();
    ErrorCode status_code = classify_http_status(http.status);
    if (status_code != ErrorCode::NONE) {
        std::string description = "HTTP " + std::to_string(http.status) + " from Yahoo Finance";
        if (status_code != ErrorCode::RATE_LIMITED) {
            auto body = nlohmann::json::parse(http.body, nullptr, false);
            std::string chart_description;
            auto chart_code = chart_error_code(body, chart_description);
            if (chart_code) {
                return make_error<std::string>(*chart_code, description + ": " + chart_description,
                                               COMPONENT);
            }
        }
        return make_status_error<std::string>(status_code, description, COMPONENT,
                                              http.retry_after_seconds);
    }
    return Result<std::string>(http.body);
}

Result<std::vector<PriceBar>> YahooFinanceProvider::parse_chart(const std::string& symbol,
                                                                const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return make_error<std::vector<PriceBar>>(ErrorCode::TRANSIENT_ERROR,
                                                 "Malformed chart response for " + symbol,
                                                 COMPONENT);
    }

    std::string description;
    auto chart_code = chart_error_code(j, description);
    if (chart_code) {
        return make_error<std::vector<PriceBar>>(*chart_code, description, COMPONENT);
    }

    std::vector<PriceBar> bars;
    try {
        const auto& results = j.at("chart").at("result");
        if (!results.is_array() || results.empty()) {
            return make_error<std::vector<PriceBar>>(ErrorCode::NOT_FOUND,
                                                     "No chart result for " + symbol, COMPONENT);
        }

        const auto& result = results.at(0);
        // A valid symbol with no trading days in the window has no timestamps
        if (!result.contains("timestamp") || result.at("timestamp").is_null()) {
            return Result<std::vector<PriceBar>>(std::move(bars));
        }

        int64_t gmt_offset = 0;
        if (result.contains("meta") && result.at("meta").contains("gmtoffset") &&
            result.at("meta").at("gmtoffset").is_number()) {
            gmt_offset = result.at("meta").at("gmtoffset").get<int64_t>();
        }

        const auto& timestamps = result.at("timestamp");
        const auto& quote = result.at("indicators").at("quote").at(0);
        const auto& opens = quote.at("open");
        const auto& highs = quote.at("high");
        const auto& lows = quote.at("low");
        const auto& closes = quote.at("close");
        const auto& volumes = quote.at("volume");

        bars.reserve(timestamps.size());
        for (size_t i = 0; i < timestamps.size(); ++i) {
            // Days without a close are holidays or suspended sessions
            if (i >= closes.size() || closes.at(i).is_null()) {
                continue;
            }
            double close = closes.at(i).get<double>();
            auto field_or_close = [&](const nlohmann::json& column) {
                return (i < column.size() && !column.at(i).is_null()) ? column.at(i).get<double>()
                                                                      : close;
            };
            double volume =
                (i < volumes.size() && !volumes.at(i).is_null()) ? volumes.at(i).get<double>() : 0.0;

            Timestamp date = core::floor_to_day(
                core::from_epoch_seconds(timestamps.at(i).get<int64_t>() + gmt_offset));
            bars.emplace_back(symbol, date, field_or_close(opens), field_or_close(highs),
                              field_or_close(lows), close, volume);
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::TRANSIENT_ERROR,
            "Malformed chart response for " + symbol + ": " + e.what(), COMPONENT);
    }
    return Result<std::vector<PriceBar>>(std::move(bars));
}

std::optional<Price> YahooFinanceProvider::parse_market_price(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("chart") ||
        !j.at("chart").is_object()) {
        return std::nullopt;
    }
    const auto& results = j.at("chart").value("result", nlohmann::json());
    if (!results.is_array() || results.empty() || !results.at(0).contains("meta")) {
        return std::nullopt;
    }
    const auto& meta = results.at(0).at("meta");
    if (meta.contains("regularMarketPrice") && meta.at("regularMarketPrice").is_number()) {
        return meta.at("regularMarketPrice").get<double>();
    }
    return std::nullopt;
}

Result<std::vector<PriceBar>> YahooFinanceProvider::fetch_history(const std::string& symbol,
                                                                  const DateRange& range) {
    Logger::register_component(COMPONENT);
    DEBUG("Requesting chart for " << symbol << " " << core::format_date(range.start) << " to "
                                  << core::format_date(range.end));

    // period2 is exclusive upstream
    auto body = request(symbol, range.start, core::next_day(range.end));
    if (body.is_error()) {
        return forward_error<std::vector<PriceBar>>(body);
    }

    auto parsed = parse_chart(symbol, body.value());
    if (parsed.is_error()) {
        return parsed;
    }
    return Result<std::vector<PriceBar>>(normalize_bars(parsed.value(), range));
}

Result<PriceBar> YahooFinanceProvider::fetch_quote(const std::string& symbol) {
    Logger::register_component(COMPONENT);

    Timestamp now = clock_.now();
    Timestamp today = core::floor_to_day(now);
    auto body = request(symbol, today - Days(5), core::next_day(today));
    if (body.is_error()) {
        return forward_error<PriceBar>(body);
    }

    auto parsed = parse_chart(symbol, body.value());
    if (parsed.is_error()) {
        return forward_error<PriceBar>(parsed);
    }

    auto bars = normalize_bars(parsed.value(), DateRange(today - Days(5), today));
    if (bars.empty()) {
        return make_error<PriceBar>(ErrorCode::NOT_FOUND,
                                    "No recent trading data for " + symbol, COMPONENT);
    }

    PriceBar latest = bars.back();
    auto market_price = parse_market_price(body.value());
    if (market_price) {
        latest.close = *market_price;
    }
    return Result<PriceBar>(std::move(latest));
}

}  // namespace riskdesk
