/**
 * @file SmartCookApp.cpp
 * @brief Implementation of the SmartCookApp class.
 */
#include "app/SmartCookApp.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/BasicUnitNormalizer.hpp"
#include "infrastructure/GroqClient.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/ProfileRepository.hpp"

namespace smartcook::app {

namespace {

const char* kUsage =
    "smartcook [--config <settings.json>] [--request <request.json>|-] [--output <result.json>]\n"
    "  Reads a generation request (stdin by default) and writes the result as JSON\n"
    "  (stdout by default).\n";

/// Points std::cout at stderr's buffer until destroyed.
class StdoutToStderr {
public:
    StdoutToStderr() : m_stdout(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~StdoutToStderr() { std::cout.rdbuf(m_stdout); }

    StdoutToStderr(const StdoutToStderr&) = delete;
    StdoutToStderr& operator=(const StdoutToStderr&) = delete;

    std::streambuf* stdoutBuffer() const { return m_stdout; }

private:
    std::streambuf* m_stdout;
};

} // namespace

std::string SmartCookApp::RenderResult(const domain::GenerationResult& result) {
    return result.toJson().dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::shared_ptr<domain::CompletionService> SmartCookApp::CreateCompletionService(const infrastructure::AppConfig& config) {
    if (config.provider == "ollama") {
        const std::string host = config.host.empty() ? "localhost" : config.host;
        const std::string configured = config.model.empty() ? "llama3" : config.model;

        infrastructure::OllamaClient probe(configured, host, config.port);
        const std::string model = infrastructure::ModelSelector::SelectBest(probe.getAvailableModels(), configured);
        if (model != configured) {
            std::cout << "[SmartCookApp] Auto-selected model: " << model << std::endl;
        }
        return std::make_shared<infrastructure::OllamaClient>(model, host, config.port);
    }

    if (config.provider == "groq") {
        if (config.apiKey.empty()) {
            throw std::runtime_error("Missing API key: set the " + config.apiKeyEnv + " environment variable.");
        }
        return std::make_shared<infrastructure::GroqClient>(
            config.apiKey,
            config.model.empty() ? infrastructure::GroqClient::kDefaultModel : config.model,
            config.host.empty() ? infrastructure::GroqClient::kDefaultBaseUrl : config.host);
    }

    throw std::runtime_error("Unknown provider '" + config.provider + "' (expected \"groq\" or \"ollama\").");
}

bool SmartCookApp::ParseArgs(int argc, char** argv) {
    int i = 1;
    while (i < argc) {
        std::string flag = argv[i++];
        auto next = [&](std::string& dst) {
            if (i >= argc) {
                std::cerr << "Missing value after " << flag << "\n";
                return false;
            }
            dst = argv[i++];
            return true;
        };
        if (flag == "--config") {
            if (!next(m_configPath)) return false;
        } else if (flag == "--request") {
            if (!next(m_requestPath)) return false;
        } else if (flag == "--output") {
            if (!next(m_outputPath)) return false;
        } else if (flag == "-h" || flag == "--help") {
            std::cout << kUsage;
            return false;
        } else {
            std::cerr << "Unknown flag: " << flag << "\n" << kUsage;
            return false;
        }
    }
    return true;
}

void SmartCookApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_configPath);

    m_services.completion = CreateCompletionService(m_config);
    std::cout << "[SmartCookApp] Using " << m_services.completion->providerName()
              << " model " << m_services.completion->modelName() << std::endl;

    auto profiles = std::make_shared<infrastructure::ProfileRepository>(m_config.profilesPath);
    m_services.spices = profiles;
    m_services.ratings = profiles;
    m_services.unitNormalizer = std::make_shared<infrastructure::BasicUnitNormalizer>();

    application::GenerationSettings settings;
    settings.maxTokens = m_config.maxTokens;
    settings.repairMaxTokens = m_config.repairMaxTokens;

    m_services.generationService = std::make_unique<application::RecipeGenerationService>(
        m_services.completion, m_services.unitNormalizer, m_services.spices, m_services.ratings, settings);
}

std::string SmartCookApp::readRequestText() const {
    if (m_requestPath == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream f(m_requestPath);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open request file: " + m_requestPath);
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

int SmartCookApp::Run(int argc, char** argv) {
    if (!ParseArgs(argc, argv)) {
        return 1;
    }

    std::optional<StdoutToStderr> logRedirect;
    if (m_outputPath.empty()) {
        logRedirect.emplace();
    }

    try {
        Init();

        nlohmann::json requestJson = nlohmann::json::parse(readRequestText(), nullptr, false);
        if (requestJson.is_discarded() || !requestJson.is_object()) {
            throw std::runtime_error("Request is not a JSON object.");
        }
        const auto request = application::GenerationRequest::FromJson(requestJson);

        const auto result = m_services.generationService->generate(request);
        const std::string payload = RenderResult(result);
        if (logRedirect) {
            std::ostream out(logRedirect->stdoutBuffer());
            out << payload << std::endl;
        } else {
            std::ofstream out(m_outputPath);
            if (!out.is_open()) {
                throw std::runtime_error("Cannot write result file: " + m_outputPath);
            }
            out << payload << "\n";
            std::cout << "[SmartCookApp] Result written to " << m_outputPath << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[SmartCookApp] " << e.what() << std::endl;
        return 1;
    }
}

} // namespace smartcook::app
