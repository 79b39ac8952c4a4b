/**
 * @file RecipeGenerationService.cpp
 * @brief Implementation of RecipeGenerationService.
 */

#include "application/RecipeGenerationService.hpp"
#include "application/JsonExtractor.hpp"
#include "application/RecipeNormalizer.hpp"
#include "domain/DietaryPolicy.hpp"

#include <algorithm>
#include <iostream>
#include <random>

namespace smartcook::application {

using domain::ErrorKind;
using domain::GenerationResult;

namespace {

const char* const kNoSafeIngredients = "No safe ingredients available.";

std::optional<std::string> PreviousRecipeTitle(const std::optional<nlohmann::json>& previousRecipe) {
    if (!previousRecipe || previousRecipe->is_null() || previousRecipe->empty()) {
        return std::nullopt;
    }
    if (previousRecipe->is_object()) {
        auto it = previousRecipe->find("title");
        if (it != previousRecipe->end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::string("Unnamed");
}

std::string InventoryForLog(const std::vector<domain::InventoryItem>& inventory) {
    std::string out = "[";
    for (size_t i = 0; i < inventory.size(); ++i) {
        if (i > 0) out += ", ";
        out += inventory[i].describe();
    }
    return out + "]";
}

} // namespace

GenerationRequest GenerationRequest::FromJson(const nlohmann::json& j) {
    GenerationRequest request;
    if (!j.is_object()) return request;

    request.userId = j.value("user_id", static_cast<std::int64_t>(0));
    request.userMessage = j.value("message", std::string());
    request.recipeCount = j.value("recipe_count", 3);

    if (j.contains("inventory") && j["inventory"].is_array()) {
        for (const auto& item : j["inventory"]) {
            if (auto parsed = domain::InventoryItem::FromJson(item)) {
                request.inventory.push_back(std::move(*parsed));
            }
        }
    }
    if (j.contains("preferences")) {
        request.preferences = domain::UserPreferences::FromJson(j["preferences"]);
    }
    if (j.contains("previous_recipe") && !j["previous_recipe"].is_null()) {
        request.previousRecipe = j["previous_recipe"];
    }
    return request;
}

RecipeGenerationService::RecipeGenerationService(std::shared_ptr<domain::CompletionService> completion,
                                                 std::shared_ptr<domain::UnitNormalizer> unitNormalizer,
                                                 std::shared_ptr<domain::SpiceProvider> spices,
                                                 std::shared_ptr<domain::RatingSummarizer> ratings,
                                                 GenerationSettings settings,
                                                 RetryPolicy::Sleeper sleeper)
    : m_completion(std::move(completion)),
      m_unitNormalizer(std::move(unitNormalizer)),
      m_spices(std::move(spices)),
      m_ratings(std::move(ratings)),
      m_repair(m_completion, settings.repairMaxTokens),
      m_settings(settings),
      m_sleeper(std::move(sleeper)) {}

std::string RecipeGenerationService::StageLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ModelCallError: return "Model call";
        case ErrorKind::InvalidJSON: return "JSON extraction";
        case ErrorKind::NoValidRecipes: return "Recipe normalization";
        default: break;
    }
    return "Recipe generation";
}

GenerationResult RecipeGenerationService::generate(const GenerationRequest& request) const {
    return generate(request.userId, request.inventory, request.userMessage,
                    request.preferences, request.previousRecipe, request.recipeCount);
}

GenerationResult RecipeGenerationService::generate(std::int64_t userId,
                                                   const std::vector<domain::InventoryItem>& inventory,
                                                   const std::string& userMessage,
                                                   const domain::UserPreferences& preferences,
                                                   const std::optional<nlohmann::json>& previousRecipe,
                                                   int recipeCount) const {
    const int requested = std::max(1, recipeCount);

    PromptContext context;
    context.userMessage = userMessage;
    context.previousRecipeTitle = PreviousRecipeTitle(previousRecipe);
    context.preferences.dietary = domain::DietaryPolicy::NormalizeTags(preferences.dietary);
    context.preferences.allergies = preferences.allergies;
    context.inventory = domain::DietaryPolicy::FilterInventory(inventory, context.preferences.dietary);
    context.recipeCount = requested;

    if (context.inventory.empty()) {
        std::cerr << "[RecipeGenerationService] " << kNoSafeIngredients << std::endl;
        return GenerationResult::Failure(ErrorKind::NoSafeIngredients, kNoSafeIngredients);
    }
    std::cout << "[RecipeGenerationService] Inventory for model: " << InventoryForLog(context.inventory) << std::endl;

    if (m_spices) context.spices = m_spices->getSpicesForUser(userId);
    if (m_ratings) context.ratingSummary = m_ratings->summarizeRatingsForPrompt(userId);
    std::cout << "[RecipeGenerationService] Spices:";
    if (context.spices.empty()) std::cout << " none";
    for (size_t i = 0; i < context.spices.size(); ++i) {
        std::cout << (i > 0 ? ", " : " ") << context.spices[i];
    }
    std::cout << std::endl;

    std::mt19937 rng(std::random_device{}());
    GenerationState state = GenerationState::Attempting;
    int attempt = 1;
    AttemptOutcome outcome;

    while (state == GenerationState::Attempting) {
        outcome = runAttempt(attempt, context);
        if (outcome.error == ErrorKind::None) {
            state = GenerationState::Success;
        } else if (attempt < RetryPolicy::kMaxAttempts) {
            auto delay = RetryPolicy::JitteredBackoff(rng);
            std::cerr << "[RecipeGenerationService] Attempt " << attempt << " failed: " << outcome.message
                      << ". Retrying in " << delay.count() << " ms." << std::endl;
            if (m_sleeper) m_sleeper(delay);
            ++attempt;
        } else {
            state = GenerationState::Exhausted;
        }
    }

    if (state == GenerationState::Exhausted) {
        std::string message = StageLabel(outcome.error) + " failed after " +
                              std::to_string(RetryPolicy::kMaxAttempts) + " attempts: " + outcome.message;
        std::cerr << "[RecipeGenerationService] " << message << std::endl;
        auto result = GenerationResult::Failure(ErrorKind::ExhaustedRetries, message, attempt);
        result.lastErrorKind = outcome.error;
        return result;
    }

    std::vector<domain::Recipe> recipes = std::move(outcome.recipes);
    if (static_cast<int>(recipes.size()) > requested) {
        recipes.resize(static_cast<size_t>(requested));
    }
    if (m_unitNormalizer) {
        recipes = m_unitNormalizer->normalizeUnits(std::move(recipes), userId);
    }

    std::cout << "[RecipeGenerationService] Recipes generated by " << m_completion->providerName() << ":" << std::endl;
    for (size_t i = 0; i < recipes.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << recipes[i].title
                  << " (" << recipes[i].extraString("difficulty", "Unknown") << ")" << std::endl;
    }

    return GenerationResult::Success(userId, std::move(recipes), attempt);
}

AttemptOutcome RecipeGenerationService::runAttempt(int attempt, const PromptContext& context) const {
    AttemptOutcome outcome;
    const std::string provider = m_completion ? m_completion->providerName() : "Model";
    std::cout << "[RecipeGenerationService] Attempt " << attempt << " contacting " << provider << "..." << std::endl;

    if (!m_completion) {
        outcome.error = ErrorKind::ModelCallError;
        outcome.message = "No completion service configured";
        return outcome;
    }

    const Prompt prompt = PromptComposer::Compose(context);

    std::string raw;
    try {
        raw = m_completion->complete(prompt.system, prompt.user, prompt.temperature, m_settings.maxTokens);
    } catch (const std::exception& e) {
        outcome.error = ErrorKind::ModelCallError;
        outcome.message = provider + " API error (" + e.what() + ")";
        return outcome;
    }
    std::cout << "[RecipeGenerationService] Raw response (" << raw.size() << " bytes):\n" << raw << std::endl;

    auto parsed = JsonExtractor::Extract(raw);
    if (!parsed) {
        std::cerr << "[RecipeGenerationService] Invalid JSON returned from " << provider
                  << " - trying JSON repair..." << std::endl;
        parsed = m_repair.repair(raw);
    }
    if (!parsed) {
        outcome.error = ErrorKind::InvalidJSON;
        outcome.message = "Invalid JSON returned from " + provider;
        return outcome;
    }

    outcome.recipes = RecipeNormalizer::Normalize(*parsed);
    if (outcome.recipes.empty()) {
        outcome.error = ErrorKind::NoValidRecipes;
        outcome.message = "No valid recipes returned";
    }
    return outcome;
}

} // namespace smartcook::application
