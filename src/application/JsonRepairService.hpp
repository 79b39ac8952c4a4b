/**
 * @file JsonRepairService.hpp
 * @brief Asks the model to rewrite a malformed reply as strict JSON.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/CompletionService.hpp"

namespace smartcook::application {

/**
 * @class JsonRepairService
 * @brief Best-effort second pass: one deterministic completion call whose
 * output goes back through JsonExtractor. Transport failures yield nullopt.
 */
class JsonRepairService {
public:
    static constexpr double kRepairTemperature = 0.0;
    static constexpr int kDefaultMaxTokens = 900;

    explicit JsonRepairService(std::shared_ptr<domain::CompletionService> completion,
                               int maxTokens = kDefaultMaxTokens);

    std::optional<nlohmann::ordered_json> repair(const std::string& rawText) const;

    static std::string BuildSystemPrompt();

    /** @brief Embeds the failed reply verbatim between separators. */
    static std::string BuildUserPrompt(const std::string& rawText);

private:
    std::shared_ptr<domain::CompletionService> m_completion;
    int m_maxTokens;
};

} // namespace smartcook::application
