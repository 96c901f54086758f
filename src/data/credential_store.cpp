#include "riskdesk/data/credential_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include "riskdesk/core/logger.hpp"

namespace riskdesk {

CredentialStore::CredentialStore(std::string path) : config_path_(std::move(path)) {
    const char* env_path = std::getenv("RISKDESK_CREDENTIALS_PATH");
    if (env_path && *env_path) {
        std::filesystem::path candidate(env_path);
        if (candidate.extension() == ".json" && candidate.string().length() < 512) {
            config_path_ = env_path;
        }
    }
    config_ = nlohmann::json::object();
}

std::string CredentialStore::env_override_name(const std::string& section,
                                               const std::string& key) {
    static const std::map<std::pair<std::string, std::string>, std::string> overrides = {
        {{"providers", "alpha_vantage_key"}, "ALPHA_VANTAGE_API_KEY"},
        {{"database", "username"}, "RISKDESK_DB_USER"},
        {{"database", "password"}, "RISKDESK_DB_PASSWORD"},
    };
    auto it = overrides.find({section, key});
    return it == overrides.end() ? std::string() : it->second;
}

Result<void> CredentialStore::load_config() {
    if (!std::filesystem::exists(config_path_)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Credentials file not found: " + config_path_, "CredentialStore");
    }

    std::error_code ec;
    auto perms = std::filesystem::status(config_path_, ec).permissions();
    if (!ec && (perms & std::filesystem::perms::others_read) != std::filesystem::perms::none) {
        WARN("Credentials file is world readable: " << config_path_);
    }

    std::ifstream config_file(config_path_);
    if (!config_file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open credentials file: " + config_path_,
                                "CredentialStore");
    }

    try {
        nlohmann::json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Credentials file must hold a JSON object", "CredentialStore");
        }
        config_ = std::move(parsed);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse credentials file: " + std::string(e.what()),
                                "CredentialStore");
    }
    return Result<void>();
}

Result<void> CredentialStore::validate_names(const std::string& section,
                                             const std::string& key) const {
    static const std::regex name_pattern(R"(^[a-zA-Z0-9_]{1,64}$)");
    if (!std::regex_match(section, name_pattern)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Invalid section name: " + section,
                                "CredentialStore");
    }
    if (!std::regex_match(key, name_pattern)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Invalid key name: " + key,
                                "CredentialStore");
    }
    return Result<void>();
}

Result<std::string> CredentialStore::get_credential(const std::string& section,
                                                    const std::string& key) const {
    auto name_validation = validate_names(section, key);
    if (name_validation.is_error()) {
        return forward_error<std::string>(name_validation);
    }

    std::string env_name = env_override_name(section, key);
    if (!env_name.empty()) {
        const char* env_value = std::getenv(env_name.c_str());
        if (env_value && *env_value) {
            return Result<std::string>(std::string(env_value));
        }
    }

    return get<std::string>(section, key);
}

bool CredentialStore::has_credential(const std::string& section, const std::string& key) const {
    return get_credential(section, key).is_ok();
}

}  // namespace riskdesk
