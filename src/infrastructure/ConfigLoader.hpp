/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of settings out of the services; the resulting AppConfig
 * is read once at startup and used to build the completion client.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace smartcook::infrastructure {

/**
 * @struct AppConfig
 * @brief Startup settings. Retry budget and backoff are not part of it.
 */
struct AppConfig {
    std::string provider = "groq";      ///< "groq" or "ollama".
    std::string model;                  ///< Empty -> provider default.
    std::string host;                   ///< Base URL (groq) or hostname (ollama). Empty -> default.
    int port = 11434;                   ///< Ollama only.
    std::string apiKeyEnv = "GROQ_API_KEY";
    std::string apiKey;                 ///< Resolved from the environment, never from the file.
    int maxTokens = 1100;
    int repairMaxTokens = 900;
    std::string profilesPath;           ///< Empty -> <data home>/SmartCook/profiles.json.
    std::string sourcePath;             ///< File the settings were read from, empty for defaults.
};

class ConfigLoader {
public:
    /**
     * @brief Resolves and reads the settings file.
     * Order: explicitPath, ./settings.json, <config home>/SmartCook/settings.json.
     * Missing files fall back to defaults, except an explicit path which must exist.
     * @throws std::runtime_error when the explicit file is missing or a file is not valid JSON.
     */
    static AppConfig Load(const std::string& explicitPath = "");

    /** @brief Applies known keys on top of the defaults; unknown keys are ignored. */
    static AppConfig FromJson(const nlohmann::json& j);

    /** @brief First existing settings file in lookup order. */
    static std::optional<std::filesystem::path> FindSettingsFile(const std::string& explicitPath);

    /** @brief Reads an environment variable; nullopt when unset or empty. */
    static std::optional<std::string> ReadEnv(const std::string& name);

    /** @brief "gsk_ab..." - first 6 characters only. */
    static std::string MaskSecret(const std::string& secret);
};

} // namespace smartcook::infrastructure
