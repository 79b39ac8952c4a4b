/**
 * @file SmartCookApp.hpp
 * @brief Command-line application wiring configuration, clients and services.
 */

#pragma once

#include <memory>
#include <string>
#include "application/AppServices.hpp"
#include "domain/GenerationResult.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace smartcook::app {

/**
 * @class SmartCookApp
 * @brief Reads a generation request, runs the pipeline once, writes the result JSON.
 */
class SmartCookApp {
public:
    /**
     * @brief Parses arguments, initializes services and handles one request.
     * Without --output the result is the only thing written to stdout; progress
     * lines go to stderr for the duration of the run.
     * @return 0 when a result was printed (including error results), 1 otherwise.
     */
    int Run(int argc, char** argv);

    /** @brief Result JSON, indented. Invalid UTF-8 from provider messages is replaced, never thrown. */
    static std::string RenderResult(const domain::GenerationResult& result);

    /** @brief Builds the completion client named by the configuration. */
    static std::shared_ptr<domain::CompletionService> CreateCompletionService(const infrastructure::AppConfig& config);

private:
    bool ParseArgs(int argc, char** argv);

    /**
     * @brief Loads settings and constructs every service once.
     * @throws std::runtime_error on configuration problems.
     */
    void Init();

    std::string readRequestText() const;

    std::string m_configPath;        ///< --config
    std::string m_requestPath = "-"; ///< --request, "-" is stdin.
    std::string m_outputPath;        ///< --output, empty is stdout.
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace smartcook::app
