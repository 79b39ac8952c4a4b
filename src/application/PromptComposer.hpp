/**
 * @file PromptComposer.hpp
 * @brief Builds the system contract and the per-attempt user instruction.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/Inventory.hpp"

namespace smartcook::application {

/**
 * @struct PromptContext
 * @brief Everything the user instruction is rendered from.
 */
struct PromptContext {
    std::string userMessage;
    std::optional<std::string> previousRecipeTitle; ///< Set -> continuation framing.
    std::vector<domain::InventoryItem> inventory;   ///< Already filtered.
    domain::UserPreferences preferences;             ///< Dietary tags already normalized.
    std::vector<std::string> spices;
    std::string ratingSummary;
    int recipeCount = 3;
};

/**
 * @struct Prompt
 * @brief One rendered request for the completion service.
 */
struct Prompt {
    std::string system;
    std::string user;
    double temperature = 0.4;
};

class PromptComposer {
public:
    static constexpr double kDefaultTemperature = 0.4;
    static constexpr double kCreativeTemperature = 0.7;

    /** @brief Renders system + user blocks and picks the temperature. */
    static Prompt Compose(const PromptContext& context);

    /** @brief Attempt-invariant output contract with the schema example. */
    static std::string BuildSystemPrompt();

    static std::string BuildUserPrompt(const PromptContext& context);

    /** @brief "dietary restrictions: ...; allergies: ..." or "no special preferences". */
    static std::string BuildPreferenceSummary(const domain::UserPreferences& preferences);

    /** @brief Comma-joined inventory ("2 kg rice, onion"). */
    static std::string RenderInventory(const std::vector<domain::InventoryItem>& inventory);

    /** @brief 0.7 when the message asks for "surprise" or "different" (any case), else 0.4. */
    static double SelectTemperature(const std::string& userMessage);
};

} // namespace smartcook::application
