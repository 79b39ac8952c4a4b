#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "app/SmartCookApp.hpp"

using namespace smartcook;
namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

/// Runs the CLI with std::cout captured; returns the exit code.
int RunCaptured(const std::vector<std::string>& args, std::string& captured) {
    std::vector<std::string> storage = args;
    storage.insert(storage.begin(), "smartcook");
    std::vector<char*> argv;
    for (auto& arg : storage) argv.push_back(arg.data());

    std::ostringstream out;
    std::streambuf* original = std::cout.rdbuf(out.rdbuf());
    app::SmartCookApp app;
    int code = app.Run(static_cast<int>(argv.size()), argv.data());
    // Run must hand std::cout back the way it found it.
    assert(std::cout.rdbuf() == out.rdbuf());
    std::cout.rdbuf(original);

    captured = out.str();
    return code;
}

void PrepareFiles(const fs::path& root) {
    // Port 1 has no server; the vegetarian filter empties the inventory so no model call is made.
    WriteFile(root / "settings.json",
              R"({"provider": "ollama", "host": "127.0.0.1", "port": 1, "profiles_path": ")" +
              (root / "profiles.json").string() + R"("})");
    WriteFile(root / "request.json",
              R"({"user_id": 3, "inventory": ["chicken"], "message": "dinner",
                  "preferences": {"dietary": ["vegetarian"]}})");
}

void TestStdoutCarriesOnlyResult(const fs::path& root) {
    std::string captured;
    int code = RunCaptured({"--config", (root / "settings.json").string(),
                            "--request", (root / "request.json").string()}, captured);
    assert(code == 0);

    nlohmann::json result = nlohmann::json::parse(captured, nullptr, false);
    assert(!result.is_discarded());
    assert(result["error"] == "No safe ingredients available.");
    assert(result["recipes"].empty());
    assert(captured.find("[ConfigLoader]") == std::string::npos);
}

void TestOutputFile(const fs::path& root) {
    std::string captured;
    fs::path output = root / "result.json";
    int code = RunCaptured({"--config", (root / "settings.json").string(),
                            "--request", (root / "request.json").string(),
                            "--output", output.string()}, captured);
    assert(code == 0);
    assert(captured.find("[SmartCookApp] Result written to") != std::string::npos);

    std::ifstream f(output);
    nlohmann::json result = nlohmann::json::parse(f, nullptr, false);
    assert(!result.is_discarded());
    assert(result["error"] == "No safe ingredients available.");
}

void TestInvalidUtf8InErrorMessage() {
    auto result = domain::GenerationResult::Failure(
        domain::ErrorKind::ExhaustedRetries,
        "Model call failed after 4 attempts: Fake API error (HTTP 502: \xff\xfe gateway)", 4);

    std::string rendered = app::SmartCookApp::RenderResult(result);
    assert(rendered.find("\xEF\xBF\xBD") != std::string::npos);
    assert(rendered.find("gateway") != std::string::npos);

    nlohmann::json reparsed = nlohmann::json::parse(rendered, nullptr, false);
    assert(!reparsed.is_discarded());
    assert(reparsed["recipes"].empty());
}

void TestBadArguments() {
    std::string captured;
    assert(RunCaptured({"--request"}, captured) == 1);
    assert(RunCaptured({"--bogus"}, captured) == 1);
}

} // namespace

int main() {
    std::cout << "[Test] Starting SmartCookApp Test..." << std::endl;

    fs::path testRoot = fs::absolute("test_project_root_app");
    fs::create_directories(testRoot);
    PrepareFiles(testRoot);

    TestStdoutCarriesOnlyResult(testRoot);
    TestOutputFile(testRoot);
    TestInvalidUtf8InErrorMessage();
    TestBadArguments();

    fs::remove_all(testRoot);
    std::cout << "[PASS] SmartCookApp Test." << std::endl;
    return 0;
}
