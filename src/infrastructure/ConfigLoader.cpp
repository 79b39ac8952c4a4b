/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace smartcook::infrastructure {

namespace fs = std::filesystem;

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;
    if (!j.is_object()) return config;

    config.provider = j.value("provider", config.provider);
    config.model = j.value("model", config.model);
    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.apiKeyEnv = j.value("api_key_env", config.apiKeyEnv);
    config.maxTokens = j.value("max_tokens", config.maxTokens);
    config.repairMaxTokens = j.value("repair_max_tokens", config.repairMaxTokens);
    config.profilesPath = j.value("profiles_path", config.profilesPath);
    return config;
}

std::optional<fs::path> ConfigLoader::FindSettingsFile(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        if (fs::exists(explicitPath)) return fs::path(explicitPath);
        return std::nullopt;
    }
    fs::path local = fs::current_path() / "settings.json";
    if (fs::exists(local)) return local;

    fs::path user = PathUtils::GetDefaultSettingsPath();
    if (fs::exists(user)) return user;
    return std::nullopt;
}

AppConfig ConfigLoader::Load(const std::string& explicitPath) {
    auto path = FindSettingsFile(explicitPath);
    AppConfig config;

    if (!path) {
        if (!explicitPath.empty()) {
            throw std::runtime_error("Settings file not found: " + explicitPath);
        }
        std::cout << "[ConfigLoader] No settings.json found, using defaults." << std::endl;
    } else {
        std::ifstream f(*path);
        if (!f.is_open()) {
            throw std::runtime_error("Cannot open settings file: " + path->string());
        }
        nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
        if (j.is_discarded()) {
            throw std::runtime_error("Settings file is not valid JSON: " + path->string());
        }
        try {
            config = FromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid value in " + path->string() + ": " + e.what());
        }
        config.sourcePath = path->string();
        std::cout << "[ConfigLoader] Loaded " << config.sourcePath << std::endl;
    }

    if (auto key = ReadEnv(config.apiKeyEnv)) {
        config.apiKey = *key;
        std::cout << "[ConfigLoader] Loaded " << config.apiKeyEnv << " prefix: " << MaskSecret(config.apiKey) << std::endl;
    }
    if (config.profilesPath.empty()) {
        config.profilesPath = PathUtils::GetDefaultProfilesPath().string();
    }
    return config;
}

std::optional<std::string> ConfigLoader::ReadEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

std::string ConfigLoader::MaskSecret(const std::string& secret) {
    return secret.substr(0, 6) + "...";
}

} // namespace smartcook::infrastructure
