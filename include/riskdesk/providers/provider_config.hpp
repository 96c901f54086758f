// include/riskdesk/providers/provider_config.hpp
#pragma once

#include <string>
#include <vector>
#include "riskdesk/core/config_base.hpp"

namespace riskdesk {

/**
 * @brief Connection and quota settings of one provider
 */
struct ProviderSettings {
    bool enabled{true};
    std::string base_url;
    int timeout_ms{10000};
    double bucket_capacity{5.0};               // Burst size
    double refill_per_minute{5.0};             // Sustained calls per minute
    int rate_limit_cooldown_seconds{60};       // Block after a quota signal
    int compact_window_days{100};              // Alpha Vantage compact output size

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["enabled"] = enabled;
        j["base_url"] = base_url;
        j["timeout_ms"] = timeout_ms;
        j["bucket_capacity"] = bucket_capacity;
        j["refill_per_minute"] = refill_per_minute;
        j["rate_limit_cooldown_seconds"] = rate_limit_cooldown_seconds;
        j["compact_window_days"] = compact_window_days;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("enabled"))
            enabled = j.at("enabled").get<bool>();
        if (j.contains("base_url"))
            base_url = j.at("base_url").get<std::string>();
        if (j.contains("timeout_ms"))
            timeout_ms = j.at("timeout_ms").get<int>();
        if (j.contains("bucket_capacity"))
            bucket_capacity = j.at("bucket_capacity").get<double>();
        if (j.contains("refill_per_minute"))
            refill_per_minute = j.at("refill_per_minute").get<double>();
        if (j.contains("rate_limit_cooldown_seconds"))
            rate_limit_cooldown_seconds = j.at("rate_limit_cooldown_seconds").get<int>();
        if (j.contains("compact_window_days"))
            compact_window_days = j.at("compact_window_days").get<int>();
    }
};

/**
 * @brief Provider selection and per-provider settings
 */
struct ProviderConfig : public ConfigBase {
    std::string primary_provider{"alpha_vantage"};
    ProviderSettings alpha_vantage;
    ProviderSettings yahoo_finance;

    ProviderConfig() {
        alpha_vantage.base_url = "https://www.alphavantage.co/query";
        alpha_vantage.bucket_capacity = 5.0;
        alpha_vantage.refill_per_minute = 5.0;

        yahoo_finance.base_url = "https://query1.finance.yahoo.com";
        yahoo_finance.bucket_capacity = 30.0;
        yahoo_finance.refill_per_minute = 60.0;
    }

    /**
     * @brief Provider names in the order they should be tried
     */
    std::vector<std::string> provider_order() const {
        if (primary_provider == "yahoo_finance") {
            return {"yahoo_finance", "alpha_vantage"};
        }
        return {"alpha_vantage", "yahoo_finance"};
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["primary_provider"] = primary_provider;
        j["alpha_vantage"] = alpha_vantage.to_json();
        j["yahoo_finance"] = yahoo_finance.to_json();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("primary_provider"))
            primary_provider = j.at("primary_provider").get<std::string>();
        if (j.contains("alpha_vantage"))
            alpha_vantage.from_json(j.at("alpha_vantage"));
        if (j.contains("yahoo_finance"))
            yahoo_finance.from_json(j.at("yahoo_finance"));
    }
};

}  // namespace riskdesk
