// include/riskdesk/data/credential_store.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include "riskdesk/core/error.hpp"

namespace riskdesk {

/**
 * @brief Read-only store of secrets: provider API keys and database login
 *
 * Values come from a JSON file ({"providers": {"alpha_vantage_key": ...},
 * "database": {"username": ..., "password": ...}}). Environment variables
 * override individual values, and RISKDESK_CREDENTIALS_PATH overrides the
 * file location. A missing file is not an error when every value needed is
 * supplied by the environment.
 */
class CredentialStore {
public:
    /**
     * @param path Path to the credentials file
     */
    explicit CredentialStore(std::string path = "credentials.json");

    /**
     * @brief Load or reload the credentials file
     * @return FILE_NOT_FOUND when the file is absent, JSON_PARSE_ERROR when
     *         it is malformed
     */
    Result<void> load_config();

    /**
     * @brief Get a credential, environment first, then file
     */
    Result<std::string> get_credential(const std::string& section, const std::string& key) const;

    /**
     * @brief Get a typed value from the file
     */
    template <typename T>
    Result<T> get(const std::string& section, const std::string& key) const;

    /**
     * @brief Get a value with default fallback
     */
    template <typename T>
    T get_with_default(const std::string& section, const std::string& key,
                       const T& default_value) const;

    bool has_credential(const std::string& section, const std::string& key) const;

    const std::string& path() const {
        return config_path_;
    }

    /**
     * @brief Environment variable overriding section.key, if any
     */
    static std::string env_override_name(const std::string& section, const std::string& key);

private:
    Result<void> validate_names(const std::string& section, const std::string& key) const;

    nlohmann::json config_;
    std::string config_path_;
};

template <typename T>
Result<T> CredentialStore::get(const std::string& section, const std::string& key) const {
    auto name_validation = validate_names(section, key);
    if (name_validation.is_error()) {
        return forward_error<T>(name_validation);
    }

    if (!config_.contains(section) || !config_[section].contains(key)) {
        return make_error<T>(ErrorCode::NOT_FOUND,
                             "Configuration not found: " + section + "." + key, "CredentialStore");
    }

    try {
        return Result<T>(config_[section][key].get<T>());
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::CONVERSION_ERROR,
                             "Failed to convert configuration value: " + std::string(e.what()),
                             "CredentialStore");
    }
}

template <typename T>
T CredentialStore::get_with_default(const std::string& section, const std::string& key,
                                    const T& default_value) const {
    auto result = get<T>(section, key);
    return result.is_error() ? default_value : result.value();
}

}  // namespace riskdesk
