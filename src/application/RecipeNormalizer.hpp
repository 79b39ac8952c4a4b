/**
 * @file RecipeNormalizer.hpp
 * @brief Coerces the shapes models actually emit into the canonical recipe schema.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Recipe.hpp"

namespace smartcook::application {

/**
 * @class RecipeNormalizer
 * @brief Converts a parsed payload into domain::Recipe values. Raw variant
 * forms (recipe vs recipes, mapping vs list ingredients, string vs list
 * instructions) do not leave this class.
 */
class RecipeNormalizer {
public:
    static constexpr const char* kUntitledRecipe = "Untitled recipe";
    static constexpr const char* kNoInstructions = "No instructions provided.";

    /** @brief Full pipeline: shape disambiguation, then one Recipe per usable entry. */
    static std::vector<domain::Recipe> Normalize(const nlohmann::ordered_json& payload);

    /**
     * @brief Returns the list of raw recipe candidates.
     * {"recipe": {...}} -> [that object]; no list under "recipes" -> [payload].
     */
    static nlohmann::ordered_json DisambiguateShape(const nlohmann::ordered_json& payload);

    /** @brief nullopt for non-object entries. */
    static std::optional<domain::Recipe> NormalizeRecipe(const nlohmann::ordered_json& raw);

    /** @brief First truthy of title / name / recipe_name, else "Untitled recipe". */
    static std::string ResolveTitle(const nlohmann::ordered_json& raw);

    /** @brief First truthy of instructions / steps, stringified. Never empty. */
    static std::vector<std::string> ResolveInstructions(const nlohmann::ordered_json& raw);

    /**
     * @brief List -> kept entry by entry with every field the model sent,
     * entries without a usable name dropped; mapping name -> "200 grams" ->
     * split into quantity/unit; anything else -> empty.
     */
    static std::vector<domain::IngredientEntry> NormalizeIngredients(const nlohmann::ordered_json& ingredients);

    /** @brief Python-style truthiness: null, false, 0, "", [] and {} are false. */
    static bool IsTruthy(const nlohmann::ordered_json& value);

    /** @brief Strings as-is, everything else as compact JSON. */
    static std::string Stringify(const nlohmann::ordered_json& value);

    /** @brief Parses a whole token as a finite decimal number. */
    static std::optional<double> ParseNumber(const std::string& token);
};

} // namespace smartcook::application
