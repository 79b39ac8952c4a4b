/**
 * @file GroqClient.cpp
 * @brief Implementation of GroqClient.
 */

#include "infrastructure/GroqClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace smartcook::infrastructure {

using json = nlohmann::json;

GroqClient::GroqClient(const std::string& apiKey, const std::string& model, const std::string& baseUrl)
    : m_apiKey(apiKey), m_model(model), m_baseUrl(baseUrl) {}

std::string GroqClient::BuildRequestBody(const std::string& model,
                                         const std::string& systemText,
                                         const std::string& userText,
                                         double temperature,
                                         int maxTokens) {
    json messages = json::array({
        {{"role", ChatMessage::RoleToString(ChatMessage::Role::System)}, {"content", systemText}},
        {{"role", ChatMessage::RoleToString(ChatMessage::Role::User)}, {"content", userText}}
    });

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"temperature", temperature},
        {"max_tokens", maxTokens}
    };
    return requestData.dump();
}

std::string GroqClient::ParseResponseBody(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw domain::ModelCallError("unparsable response body");
    }
    if (!parsed.contains("choices") || !parsed["choices"].is_array() || parsed["choices"].empty()) {
        throw domain::ModelCallError("response has no choices");
    }
    const auto& message = parsed["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        throw domain::ModelCallError("response is missing choices[0].message.content");
    }
    return message["content"].get<std::string>();
}

std::string GroqClient::complete(const std::string& systemText,
                                 const std::string& userText,
                                 double temperature,
                                 int maxTokens) const {
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(120);
    cli.set_bearer_token_auth(m_apiKey);

    auto res = cli.Post(kCompletionsPath,
                        BuildRequestBody(m_model, systemText, userText, temperature, maxTokens),
                        "application/json");
    if (!res) {
        throw domain::ModelCallError("connection to " + m_baseUrl + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw domain::ModelCallError("HTTP " + std::to_string(res->status) + ": " + res->body);
    }
    return ParseResponseBody(res->body);
}

} // namespace smartcook::infrastructure
