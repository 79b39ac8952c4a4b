#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "app/SmartCookApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace smartcook::infrastructure;
namespace fs = std::filesystem;

namespace {

void TestDefaults() {
    AppConfig config = ConfigLoader::FromJson(nlohmann::json::object());
    assert(config.provider == "groq");
    assert(config.model.empty());
    assert(config.apiKeyEnv == "GROQ_API_KEY");
    assert(config.maxTokens == 1100);
    assert(config.repairMaxTokens == 900);
    assert(config.port == 11434);
}

void TestOverrides() {
    auto j = nlohmann::json::parse(R"({
        "provider": "ollama", "model": "llama3.1:8b", "host": "gpu-box", "port": 8080,
        "api_key_env": "SMARTCOOK_KEY", "max_tokens": 2048, "repair_max_tokens": 512,
        "profiles_path": "/tmp/profiles.json", "unknown": true
    })");
    AppConfig config = ConfigLoader::FromJson(j);
    assert(config.provider == "ollama");
    assert(config.model == "llama3.1:8b");
    assert(config.host == "gpu-box");
    assert(config.port == 8080);
    assert(config.apiKeyEnv == "SMARTCOOK_KEY");
    assert(config.maxTokens == 2048);
    assert(config.repairMaxTokens == 512);
    assert(config.profilesPath == "/tmp/profiles.json");
}

void TestLoadFromFileAndEnvironment(const fs::path& root) {
    fs::path settings = root / "settings.json";
    {
        std::ofstream f(settings);
        f << R"({"provider": "groq", "api_key_env": "SMARTCOOK_TEST_KEY", "profiles_path": "p.json"})";
    }
    setenv("SMARTCOOK_TEST_KEY", "gsk_test_secret_value", 1);

    AppConfig config = ConfigLoader::Load(settings.string());
    assert(config.sourcePath == settings.string());
    assert(config.apiKey == "gsk_test_secret_value");
    assert(config.profilesPath == "p.json");

    auto client = smartcook::app::SmartCookApp::CreateCompletionService(config);
    assert(client->providerName() == "Groq");
    assert(client->modelName() == "llama-3.1-8b-instant");

    unsetenv("SMARTCOOK_TEST_KEY");
    AppConfig withoutKey = ConfigLoader::Load(settings.string());
    assert(withoutKey.apiKey.empty());
    bool threw = false;
    try {
        smartcook::app::SmartCookApp::CreateCompletionService(withoutKey);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("SMARTCOOK_TEST_KEY") != std::string::npos;
    }
    assert(threw);
}

void TestErrors(const fs::path& root) {
    bool threw = false;
    try {
        ConfigLoader::Load((root / "missing.json").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    fs::path broken = root / "broken.json";
    {
        std::ofstream f(broken);
        f << "{ provider: groq";
    }
    threw = false;
    try {
        ConfigLoader::Load(broken.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    AppConfig unknown;
    unknown.provider = "openai";
    threw = false;
    try {
        smartcook::app::SmartCookApp::CreateCompletionService(unknown);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void TestXdgDefaults(const fs::path& root) {
    fs::path settings = root / "minimal.json";
    {
        std::ofstream f(settings);
        f << "{}";
    }
    setenv("XDG_DATA_HOME", (root / "data").string().c_str(), 1);
    setenv("XDG_CONFIG_HOME", (root / "config").string().c_str(), 1);

    AppConfig config = ConfigLoader::Load(settings.string());
    assert(config.profilesPath == (root / "data" / "SmartCook" / "profiles.json").string());
    assert(PathUtils::GetDefaultSettingsPath() == root / "config" / "SmartCook" / "settings.json");

    unsetenv("XDG_DATA_HOME");
    unsetenv("XDG_CONFIG_HOME");
}

void TestSecretMasking() {
    assert(ConfigLoader::MaskSecret("gsk_abcdefghijkl") == "gsk_ab...");
    assert(ConfigLoader::MaskSecret("abc") == "abc...");
    assert(!ConfigLoader::ReadEnv(""));
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path testRoot = "test_project_root_config";
    fs::create_directories(testRoot);

    TestDefaults();
    TestOverrides();
    TestLoadFromFileAndEnvironment(testRoot);
    TestErrors(testRoot);
    TestXdgDefaults(testRoot);
    TestSecretMasking();

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
