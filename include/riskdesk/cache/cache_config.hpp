// include/riskdesk/cache/cache_config.hpp
#pragma once

#include <chrono>
#include <string>
#include "riskdesk/core/config_base.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {

/**
 * @brief Which side wins when fetched and stored bars share a date
 */
enum class MergePolicy {
    FRESHEST_WINS,  // Fetched values replace stored ones
    STORED_WINS     // Stored values are kept
};

inline std::string merge_policy_to_string(MergePolicy policy) {
    switch (policy) {
        case MergePolicy::FRESHEST_WINS:
            return "FRESHEST_WINS";
        case MergePolicy::STORED_WINS:
            return "STORED_WINS";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Time to live per freshness class
 */
struct TtlPolicy {
    std::chrono::seconds live{300};
    std::chrono::seconds historical{86400};
    std::chrono::seconds analysis{86400};

    std::chrono::seconds for_class(TtlClass ttl_class) const {
        switch (ttl_class) {
            case TtlClass::LIVE:
                return live;
            case TtlClass::HISTORICAL:
                return historical;
            case TtlClass::ANALYSIS:
                return analysis;
        }
        return live;
    }
};

/**
 * @brief Configuration of the memory tier and the orchestrator
 */
struct CacheConfig : public ConfigBase {
    int ttl_live_seconds{300};
    int ttl_historical_seconds{86400};  // Open part of a span only
    int ttl_analysis_seconds{86400};
    size_t capacity{2048};              // Entries per memory cache
    size_t shards{16};
    int fetch_wait_timeout_ms{30000};   // Default wait on a shared fetch
    MergePolicy merge_policy{MergePolicy::FRESHEST_WINS};

    TtlPolicy ttl_policy() const {
        TtlPolicy policy;
        policy.live = std::chrono::seconds(ttl_live_seconds);
        policy.historical = std::chrono::seconds(ttl_historical_seconds);
        policy.analysis = std::chrono::seconds(ttl_analysis_seconds);
        return policy;
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["ttl_live_seconds"] = ttl_live_seconds;
        j["ttl_historical_seconds"] = ttl_historical_seconds;
        j["ttl_analysis_seconds"] = ttl_analysis_seconds;
        j["capacity"] = capacity;
        j["shards"] = shards;
        j["fetch_wait_timeout_ms"] = fetch_wait_timeout_ms;
        j["merge_policy"] = merge_policy_to_string(merge_policy);
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("ttl_live_seconds"))
            ttl_live_seconds = j.at("ttl_live_seconds").get<int>();
        if (j.contains("ttl_historical_seconds"))
            ttl_historical_seconds = j.at("ttl_historical_seconds").get<int>();
        if (j.contains("ttl_analysis_seconds"))
            ttl_analysis_seconds = j.at("ttl_analysis_seconds").get<int>();
        if (j.contains("capacity"))
            capacity = j.at("capacity").get<size_t>();
        if (j.contains("shards"))
            shards = j.at("shards").get<size_t>();
        if (j.contains("fetch_wait_timeout_ms"))
            fetch_wait_timeout_ms = j.at("fetch_wait_timeout_ms").get<int>();
        if (j.contains("merge_policy")) {
            std::string policy = j.at("merge_policy").get<std::string>();
            if (policy == "FRESHEST_WINS")
                merge_policy = MergePolicy::FRESHEST_WINS;
            else if (policy == "STORED_WINS")
                merge_policy = MergePolicy::STORED_WINS;
        }
    }
};

}  // namespace riskdesk
