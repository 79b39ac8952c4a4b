/**
 * @file CompletionService.hpp
 * @brief Interface to a hosted or local text-completion model.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace smartcook::domain {

/**
 * @class ModelCallError
 * @brief Raised by a CompletionService when the transport or the provider fails.
 */
class ModelCallError : public std::runtime_error {
public:
    explicit ModelCallError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class CompletionService
 * @brief Stateless chat-completion endpoint. Implementations keep no per-call
 * mutable state so one instance can serve concurrent requests. No retries here.
 */
class CompletionService {
public:
    virtual ~CompletionService() = default;

    /**
     * @struct ChatMessage
     * @brief Represents a single message in a chat conversation.
     */
    struct ChatMessage {
        enum class Role { System, User, Assistant };
        Role role;
        std::string content;

        static std::string RoleToString(Role r) {
            switch (r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
            }
            return "user";
        }
    };

    /**
     * @brief Sends a system + user instruction pair and returns the raw reply.
     * @param systemText System-level instructions.
     * @param userText User content.
     * @param temperature Sampling temperature.
     * @param maxTokens Upper bound on generated tokens.
     * @return The model's raw text.
     * @throws ModelCallError on connection, HTTP or payload failures.
     */
    virtual std::string complete(const std::string& systemText,
                                 const std::string& userText,
                                 double temperature,
                                 int maxTokens) const = 0;

    /** @brief Provider label used in log lines and error messages ("Groq", "Ollama"). */
    virtual std::string providerName() const = 0;

    /** @brief Name of the model requests are sent to. */
    virtual std::string modelName() const = 0;
};

} // namespace smartcook::domain
