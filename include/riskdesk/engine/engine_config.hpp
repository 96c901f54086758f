// include/riskdesk/engine/engine_config.hpp
#pragma once

#include "riskdesk/analytics/risk_analytics.hpp"
#include "riskdesk/cache/cache_config.hpp"
#include "riskdesk/core/config_base.hpp"
#include "riskdesk/core/logger.hpp"
#include "riskdesk/data/postgres_price_store.hpp"
#include "riskdesk/providers/provider_config.hpp"

namespace riskdesk {

/**
 * @brief Complete engine configuration, one section per component
 *
 * {"cache": {...}, "providers": {...}, "analytics": {...},
 *  "database": {...}, "logging": {...}}. Missing sections keep defaults.
 */
struct EngineConfig : public ConfigBase {
    CacheConfig cache;
    ProviderConfig providers;
    analytics::AnalyticsConfig analytics;
    DatabaseConfig database;
    LoggerConfig logging;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["cache"] = cache.to_json();
        j["providers"] = providers.to_json();
        j["analytics"] = analytics.to_json();
        j["database"] = database.to_json();
        j["logging"] = logging.to_json();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("cache"))
            cache.from_json(j.at("cache"));
        if (j.contains("providers"))
            providers.from_json(j.at("providers"));
        if (j.contains("analytics"))
            analytics.from_json(j.at("analytics"));
        if (j.contains("database"))
            database.from_json(j.at("database"));
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
    }
};

}  // namespace riskdesk
