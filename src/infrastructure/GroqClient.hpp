/**
 * @file GroqClient.hpp
 * @brief Completion service for Groq's OpenAI-compatible chat endpoint.
 */

#pragma once

#include <string>
#include "domain/CompletionService.hpp"

namespace smartcook::infrastructure {

/**
 * @class GroqClient
 * @brief POSTs {model, messages, temperature, max_tokens} to
 * /openai/v1/chat/completions and returns choices[0].message.content.
 * Configuration is immutable after construction.
 */
class GroqClient : public domain::CompletionService {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.groq.com";
    static constexpr const char* kDefaultModel = "llama-3.1-8b-instant";
    static constexpr const char* kCompletionsPath = "/openai/v1/chat/completions";

    GroqClient(const std::string& apiKey,
               const std::string& model = kDefaultModel,
               const std::string& baseUrl = kDefaultBaseUrl);

    std::string complete(const std::string& systemText,
                         const std::string& userText,
                         double temperature,
                         int maxTokens) const override;

    std::string providerName() const override { return "Groq"; }
    std::string modelName() const override { return m_model; }

    /** @brief Builds the JSON request body; exposed for tests. */
    static std::string BuildRequestBody(const std::string& model,
                                        const std::string& systemText,
                                        const std::string& userText,
                                        double temperature,
                                        int maxTokens);

    /** @brief Pulls choices[0].message.content out of a response body. */
    static std::string ParseResponseBody(const std::string& body);

private:
    std::string m_apiKey;
    std::string m_model;
    std::string m_baseUrl;
};

} // namespace smartcook::infrastructure
