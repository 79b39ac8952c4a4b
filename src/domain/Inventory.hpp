/**
 * @file Inventory.hpp
 * @brief Pantry items and user preferences supplied with a generation request.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Recipe.hpp"

namespace smartcook::domain {

/**
 * @struct InventoryItem
 * @brief A pantry entry. The plain form ("rice") only carries a name; the
 * structured form may add quantity and unit.
 */
struct InventoryItem {
    std::string name;
    std::optional<Quantity> quantity;
    std::optional<std::string> unit;

    /** @brief Lowercased name, used for identity and restriction matching. */
    std::string key() const;

    /** @brief Human-readable form used in prompts: "2 kg rice" or "rice". */
    std::string describe() const;

    /** @brief Accepts either a JSON string or an object with a "name" field. */
    static std::optional<InventoryItem> FromJson(const nlohmann::json& j);
};

/**
 * @struct UserPreferences
 * @brief Dietary tags and allergies as provided by the caller.
 */
struct UserPreferences {
    std::vector<std::string> dietary;
    std::vector<std::string> allergies;

    static UserPreferences FromJson(const nlohmann::json& j);
};

} // namespace smartcook::domain
