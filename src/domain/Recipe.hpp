/**
 * @file Recipe.hpp
 * @brief Canonical recipe schema produced by the recovery pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace smartcook::domain {

/// Ingredient amount: either a number or free text such as "to taste".
using Quantity = std::variant<double, std::string>;

/** @brief Renders a quantity the way it appears in prompts ("200", "1.5", "to taste"). */
std::string FormatQuantity(const Quantity& quantity);

/**
 * @struct IngredientEntry
 * @brief One ingredient line of a canonical recipe. `name` is never empty.
 *
 * `source` holds the entry exactly as the model sent it when it came as an
 * object (notes, optional flags, ...). It is empty for entries built from a
 * name -> quantity mapping.
 */
struct IngredientEntry {
    std::string name;
    std::optional<Quantity> quantity;
    std::optional<std::string> unit;
    nlohmann::ordered_json source = nlohmann::ordered_json::object();

    /**
     * @brief The source object with the canonical fields written over it.
     * A source quantity numerically equal to `quantity` keeps its spelling (200 stays 200).
     */
    nlohmann::ordered_json toJson() const;

    /// Entries are equal when they serialize identically.
    bool operator==(const IngredientEntry& other) const {
        return toJson() == other.toJson();
    }
};

/**
 * @struct Recipe
 * @brief Canonical recipe: title, ordered ingredients, non-empty instruction list,
 * plus whatever extra fields the model attached (difficulty, time, ...).
 */
struct Recipe {
    std::string title;
    std::vector<IngredientEntry> ingredients;
    std::vector<std::string> instructions;
    nlohmann::ordered_json extras = nlohmann::ordered_json::object(); ///< Never contains the canonical keys.

    /** @brief Extras first, canonical fields last (canonical wins on collision). */
    nlohmann::ordered_json toJson() const;

    /** @brief Looks up a passthrough string field, e.g. "difficulty". */
    std::string extraString(const std::string& key, const std::string& fallback) const;

    bool operator==(const Recipe& other) const {
        return title == other.title && ingredients == other.ingredients &&
               instructions == other.instructions && extras == other.extras;
    }
};

} // namespace smartcook::domain
