#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace smartcook::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& model, const std::string& host, int port)
    : m_model(model), m_host(host), m_port(port) {}

std::string OllamaClient::complete(const std::string& systemText,
                                   const std::string& userText,
                                   double temperature,
                                   int maxTokens) const {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600); // 10 min, CPU inference is slow

    json messages = json::array({
        {{"role", ChatMessage::RoleToString(ChatMessage::Role::System)}, {"content", systemText}},
        {{"role", ChatMessage::RoleToString(ChatMessage::Role::User)}, {"content", userText}}
    });

    json requestData = {
        {"model", m_model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"num_predict", maxTokens}
        }}
    };

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        throw domain::ModelCallError("connection to " + m_host + ":" + std::to_string(m_port) +
                                     " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw domain::ModelCallError("HTTP " + std::to_string(res->status) + ": " + res->body);
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        throw domain::ModelCallError("unparsable response body");
    }
    // { "message": { "role": "assistant", "content": "..." }, ... }
    if (!body.contains("message") || !body["message"].contains("content") ||
        !body["message"]["content"].is_string()) {
        throw domain::ModelCallError("response is missing message.content");
    }
    return body["message"]["content"].get<std::string>();
}

std::vector<std::string> OllamaClient::getAvailableModels() const {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (!res || res->status != 200) {
        std::cerr << "[OllamaClient] Failed to list models. Is Ollama running?" << std::endl;
        return models;
    }
    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.contains("models") || !body["models"].is_array()) {
        std::cerr << "[OllamaClient] Unexpected /api/tags payload." << std::endl;
        return models;
    }
    for (const auto& item : body["models"]) {
        if (item.contains("name") && item["name"].is_string()) {
            models.push_back(item["name"].get<std::string>());
        }
    }
    return models;
}

} // namespace smartcook::infrastructure
