#include "infrastructure/BasicUnitNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace smartcook::infrastructure {

std::optional<std::string> BasicUnitNormalizer::CanonicalUnit(const std::string& unit) {
    static const std::map<std::string, std::string> aliases = {
        {"g", "grams"}, {"gr", "grams"}, {"gram", "grams"}, {"grams", "grams"}, {"gramme", "grams"}, {"grammes", "grams"},
        {"kg", "kg"}, {"kgs", "kg"}, {"kilo", "kg"}, {"kilos", "kg"}, {"kilogram", "kg"}, {"kilograms", "kg"},
        {"ml", "ml"}, {"milliliter", "ml"}, {"milliliters", "ml"}, {"millilitre", "ml"}, {"millilitres", "ml"},
        {"l", "l"}, {"liter", "l"}, {"liters", "l"}, {"litre", "l"}, {"litres", "l"},
        {"piece", "pieces"}, {"pieces", "pieces"}, {"pc", "pieces"}, {"pcs", "pieces"},
        {"unit", "pieces"}, {"units", "pieces"}
    };

    std::string key = unit;
    key.erase(std::remove_if(key.begin(), key.end(), [](unsigned char c){ return std::isspace(c) || c == '.'; }), key.end());
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return std::tolower(c); });

    auto it = aliases.find(key);
    if (it == aliases.end()) return std::nullopt;
    return it->second;
}

std::vector<domain::Recipe> BasicUnitNormalizer::normalizeUnits(std::vector<domain::Recipe> recipes,
                                                                std::int64_t /*userId*/) const {
    for (auto& recipe : recipes) {
        for (auto& ingredient : recipe.ingredients) {
            if (!ingredient.unit) continue;
            if (auto canonical = CanonicalUnit(*ingredient.unit)) {
                ingredient.unit = *canonical;
            }
        }
    }
    return recipes;
}

} // namespace smartcook::infrastructure
