/**
 * @file GenerationResult.hpp
 * @brief Outcome of one recipe generation request.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Recipe.hpp"

namespace smartcook::domain {

/**
 * @enum ErrorKind
 * @brief Failure categories of the generation pipeline.
 */
enum class ErrorKind {
    None,
    NoSafeIngredients, ///< Dietary filter emptied the inventory. Not retried.
    ModelCallError,    ///< Transport or service failure. Retryable.
    InvalidJSON,       ///< Extraction and repair both failed. Retryable.
    NoValidRecipes,    ///< JSON parsed but normalization produced no recipe. Retryable.
    ExhaustedRetries   ///< Attempt budget spent; message wraps the last retryable error.
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::NoSafeIngredients: return "NoSafeIngredients";
        case ErrorKind::ModelCallError: return "ModelCallError";
        case ErrorKind::InvalidJSON: return "InvalidJSON";
        case ErrorKind::NoValidRecipes: return "NoValidRecipes";
        case ErrorKind::ExhaustedRetries: return "ExhaustedRetries";
    }
    return "None";
}

/**
 * @struct GenerationResult
 * @brief Either {user_id, recipes} or {error, recipes: []}.
 */
struct GenerationResult {
    std::int64_t userId = 0;
    std::vector<Recipe> recipes;
    ErrorKind errorKind = ErrorKind::None;
    ErrorKind lastErrorKind = ErrorKind::None; ///< Retryable error behind ExhaustedRetries.
    std::string error;
    int attempts = 0;

    bool ok() const { return errorKind == ErrorKind::None; }

    static GenerationResult Success(std::int64_t userId, std::vector<Recipe> recipes, int attempts) {
        GenerationResult r;
        r.userId = userId;
        r.recipes = std::move(recipes);
        r.attempts = attempts;
        return r;
    }

    static GenerationResult Failure(ErrorKind kind, std::string message, int attempts = 0) {
        GenerationResult r;
        r.errorKind = kind;
        r.error = std::move(message);
        r.attempts = attempts;
        return r;
    }

    nlohmann::ordered_json toJson() const {
        nlohmann::ordered_json j;
        nlohmann::ordered_json list = nlohmann::ordered_json::array();
        if (ok()) {
            j["user_id"] = userId;
            for (const auto& recipe : recipes) list.push_back(recipe.toJson());
        } else {
            j["error"] = error;
        }
        j["recipes"] = std::move(list);
        return j;
    }
};

} // namespace smartcook::domain
