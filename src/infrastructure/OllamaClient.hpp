/**
 * @file OllamaClient.hpp
 * @brief Completion service backed by a local Ollama server.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/CompletionService.hpp"

namespace smartcook::infrastructure {

class OllamaClient : public domain::CompletionService {
public:
    OllamaClient(const std::string& model = "llama3",
                 const std::string& host = "localhost",
                 int port = 11434);

    /** @brief Sends a POST request to /api/chat with stream disabled. */
    std::string complete(const std::string& systemText,
                         const std::string& userText,
                         double temperature,
                         int maxTokens) const override;

    std::string providerName() const override { return "Ollama"; }
    std::string modelName() const override { return m_model; }

    /** @brief Fetches available models from /api/tags. Empty when the server is unreachable. */
    std::vector<std::string> getAvailableModels() const;

private:
    std::string m_model;
    std::string m_host;
    int m_port;
};

} // namespace smartcook::infrastructure
