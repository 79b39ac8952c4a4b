/**
 * @file JsonRepairService.cpp
 * @brief Implementation of JsonRepairService.
 */

#include "application/JsonRepairService.hpp"
#include "application/JsonExtractor.hpp"
#include <iostream>

namespace smartcook::application {

JsonRepairService::JsonRepairService(std::shared_ptr<domain::CompletionService> completion, int maxTokens)
    : m_completion(std::move(completion)), m_maxTokens(maxTokens) {}

std::string JsonRepairService::BuildSystemPrompt() {
    return "You are a JSON fixer. You always output VALID JSON only.";
}

std::string JsonRepairService::BuildUserPrompt(const std::string& rawText) {
    return
        "Your previous response was not valid JSON.\n"
        "Here is the content:\n"
        "----------------\n"
        + rawText + "\n"
        "----------------\n\n"
        "Now respond with ONLY valid JSON. No explanations, no comments, no markdown.";
}

std::optional<nlohmann::ordered_json> JsonRepairService::repair(const std::string& rawText) const {
    if (!m_completion) return std::nullopt;

    std::string fixed;
    try {
        fixed = m_completion->complete(BuildSystemPrompt(), BuildUserPrompt(rawText),
                                       kRepairTemperature, m_maxTokens);
    } catch (const std::exception& e) {
        std::cerr << "[JsonRepairService] Repair call failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    std::cout << "[JsonRepairService] Repaired response (" << fixed.size() << " bytes):\n"
              << fixed << std::endl;

    auto parsed = JsonExtractor::Extract(fixed);
    if (!parsed) {
        std::cerr << "[JsonRepairService] Repaired response is still not valid JSON." << std::endl;
    }
    return parsed;
}

} // namespace smartcook::application
