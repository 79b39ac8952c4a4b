/**
 * @file DietaryPolicy.hpp
 * @brief Dietary restriction table, inventory filtering and prompt notes.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "domain/Inventory.hpp"

namespace smartcook::domain {

/// Diet tag -> banned ingredient names (lowercase).
using RestrictionSet = std::map<std::string, std::set<std::string>>;

/**
 * @class DietaryPolicy
 * @brief Only vegetarian, vegan and gluten free ban ingredients outright.
 * Kosher, halal, keto and paleo are expressed through prompt notes.
 */
class DietaryPolicy {
public:
    /** @brief The fixed restriction table. */
    static const RestrictionSet& Restrictions();

    /** @brief Trims, lowercases and maps '-' / '_' to spaces ("Gluten-Free" -> "gluten free"). */
    static std::string NormalizeTag(const std::string& tag);

    /** @brief Normalizes every tag, dropping empty ones. Order is preserved. */
    static std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags);

    /** @brief Union of the banned names of all tags. Unknown tags contribute nothing. */
    static std::set<std::string> BannedIngredients(const std::vector<std::string>& dietary);

    /**
     * @brief Removes every item whose lowercased name is banned by any tag.
     * @return Remaining items in their original order.
     */
    static std::vector<InventoryItem> FilterInventory(const std::vector<InventoryItem>& inventory,
                                                      const std::vector<std::string>& dietary);

    /** @brief Space-joined restriction notes in fixed order. Vegan suppresses the vegetarian note. */
    static std::string BuildRestrictionNote(const std::vector<std::string>& dietary);
};

} // namespace smartcook::domain
