/**
 * @file DietaryPolicy.cpp
 * @brief Implementation of DietaryPolicy.
 */

#include "domain/DietaryPolicy.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace smartcook::domain {

const RestrictionSet& DietaryPolicy::Restrictions() {
    static const RestrictionSet table = {
        {"vegetarian", {"beef", "pork", "chicken", "turkey", "fish", "shrimp", "lamb", "bacon"}},
        {"vegan", {"beef", "pork", "chicken", "turkey", "fish", "shrimp", "lamb",
                   "milk", "cheese", "butter", "yogurt", "cream", "egg", "honey"}},
        {"gluten free", {"wheat", "barley", "rye", "bread", "pasta", "flour",
                         "spaghetti", "noodles", "bulgur", "couscous", "semolina"}},
    };
    return table;
}

std::string DietaryPolicy::NormalizeTag(const std::string& tag) {
    size_t start = 0;
    size_t end = tag.size();
    while (start < end && std::isspace(static_cast<unsigned char>(tag[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(tag[end - 1]))) --end;

    std::string out;
    out.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        char ch = tag[i];
        if (ch == '-' || ch == '_') {
            out.push_back(' ');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    return out;
}

std::vector<std::string> DietaryPolicy::NormalizeTags(const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    for (const auto& tag : tags) {
        std::string normalized = NormalizeTag(tag);
        if (!normalized.empty()) out.push_back(std::move(normalized));
    }
    return out;
}

std::set<std::string> DietaryPolicy::BannedIngredients(const std::vector<std::string>& dietary) {
    std::set<std::string> banned;
    const auto& table = Restrictions();
    for (const auto& tag : dietary) {
        auto it = table.find(NormalizeTag(tag));
        if (it != table.end()) {
            banned.insert(it->second.begin(), it->second.end());
        }
    }
    return banned;
}

std::vector<InventoryItem> DietaryPolicy::FilterInventory(const std::vector<InventoryItem>& inventory,
                                                          const std::vector<std::string>& dietary) {
    const auto banned = BannedIngredients(dietary);
    if (banned.empty()) return inventory;

    std::vector<InventoryItem> safe;
    std::copy_if(inventory.begin(), inventory.end(), std::back_inserter(safe),
                 [&banned](const InventoryItem& item) { return banned.count(item.key()) == 0; });
    return safe;
}

std::string DietaryPolicy::BuildRestrictionNote(const std::vector<std::string>& dietary) {
    std::set<std::string> tags;
    for (const auto& tag : dietary) tags.insert(NormalizeTag(tag));

    std::vector<std::string> notes;
    if (tags.count("vegan")) {
        notes.push_back("IMPORTANT: 100 % plant-based - no meat, fish, dairy or eggs. Use tofu/legumes instead.");
    } else if (tags.count("vegetarian")) {
        notes.push_back("IMPORTANT: No meat or fish. Use plant-based substitutes.");
    }
    if (tags.count("gluten free")) {
        notes.push_back("IMPORTANT: Must be 100 % gluten-free - no wheat, barley, rye or derivatives.");
    }
    if (tags.count("kosher")) {
        notes.push_back("IMPORTANT: Keep recipe kosher - no pork/shellfish; do not mix meat with dairy.");
    }
    if (tags.count("halal")) {
        notes.push_back("IMPORTANT: Keep recipe halal - no pork or alcohol.");
    }
    if (tags.count("keto")) {
        notes.push_back("IMPORTANT: Keep net carbs very low (< 20 g per serving); moderate protein, high fat.");
    }
    if (tags.count("paleo")) {
        notes.push_back("IMPORTANT: Paleo - no grains, legumes or processed sugar; focus on meat, fish, vegetables, fruit, nuts.");
    }

    std::string joined;
    for (const auto& note : notes) {
        if (!joined.empty()) joined += " ";
        joined += note;
    }
    return joined;
}

} // namespace smartcook::domain
