/**
 * @file RecipeGenerationService.hpp
 * @brief Drives prompt -> completion -> extraction (-> repair) -> normalization
 * under a bounded attempt budget.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/JsonRepairService.hpp"
#include "application/PromptComposer.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/CompletionService.hpp"
#include "domain/GenerationResult.hpp"
#include "domain/Inventory.hpp"
#include "domain/RecipeCollaborators.hpp"

namespace smartcook::application {

/**
 * @struct GenerationRequest
 * @brief Input of one generation call.
 */
struct GenerationRequest {
    std::int64_t userId = 0;
    std::vector<domain::InventoryItem> inventory;
    std::string userMessage;
    domain::UserPreferences preferences;
    std::optional<nlohmann::json> previousRecipe; ///< Non-empty -> continuation framing.
    int recipeCount = 3;

    /** @brief Parses {"user_id", "inventory", "message", "preferences", "previous_recipe", "recipe_count"}. */
    static GenerationRequest FromJson(const nlohmann::json& j);
};

/**
 * @enum GenerationState
 * @brief States of the attempt loop.
 */
enum class GenerationState {
    Attempting,
    Success,
    Exhausted
};

/**
 * @struct AttemptOutcome
 * @brief Result of a single attempt. `error` is None on success.
 */
struct AttemptOutcome {
    domain::ErrorKind error = domain::ErrorKind::None;
    std::string message;
    std::vector<domain::Recipe> recipes;
};

/**
 * @struct GenerationSettings
 * @brief Token limits for the two kinds of completion calls.
 */
struct GenerationSettings {
    int maxTokens = 1100;
    int repairMaxTokens = JsonRepairService::kDefaultMaxTokens;
};

/**
 * @class RecipeGenerationService
 * @brief Entry point of the recovery pipeline. Never throws for pipeline
 * failures: callers inspect GenerationResult::error instead.
 *
 * Holds no per-request mutable state, so one instance may serve concurrent
 * requests as long as the injected collaborators are thread-safe.
 */
class RecipeGenerationService {
public:
    RecipeGenerationService(std::shared_ptr<domain::CompletionService> completion,
                            std::shared_ptr<domain::UnitNormalizer> unitNormalizer,
                            std::shared_ptr<domain::SpiceProvider> spices,
                            std::shared_ptr<domain::RatingSummarizer> ratings,
                            GenerationSettings settings = {},
                            RetryPolicy::Sleeper sleeper = RetryPolicy::ThreadSleeper());

    domain::GenerationResult generate(std::int64_t userId,
                                      const std::vector<domain::InventoryItem>& inventory,
                                      const std::string& userMessage,
                                      const domain::UserPreferences& preferences,
                                      const std::optional<nlohmann::json>& previousRecipe = std::nullopt,
                                      int recipeCount = 3) const;

    domain::GenerationResult generate(const GenerationRequest& request) const;

    /** @brief Label of the stage an error kind belongs to, used in the exhaustion message. */
    static std::string StageLabel(domain::ErrorKind kind);

private:
    AttemptOutcome runAttempt(int attempt, const PromptContext& context) const;

    std::shared_ptr<domain::CompletionService> m_completion;
    std::shared_ptr<domain::UnitNormalizer> m_unitNormalizer;
    std::shared_ptr<domain::SpiceProvider> m_spices;
    std::shared_ptr<domain::RatingSummarizer> m_ratings;
    JsonRepairService m_repair;
    GenerationSettings m_settings;
    RetryPolicy::Sleeper m_sleeper;
};

} // namespace smartcook::application
