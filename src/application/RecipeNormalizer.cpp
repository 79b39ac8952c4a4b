/**
 * @file RecipeNormalizer.cpp
 * @brief Implementation of RecipeNormalizer.
 */

#include "application/RecipeNormalizer.hpp"
#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace smartcook::application {

using ordered_json = nlohmann::ordered_json;

namespace {

const char* const kCanonicalKeys[] = {"title", "ingredients", "instructions"};

bool IsCanonicalKey(const std::string& key) {
    for (const char* canonical : kCanonicalKeys) {
        if (key == canonical) return true;
    }
    return false;
}

std::optional<domain::Quantity> QuantityFromJson(const ordered_json& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_number()) return domain::Quantity(value.get<double>());
    return domain::Quantity(RecipeNormalizer::Stringify(value));
}

std::optional<domain::IngredientEntry> EntryFromListItem(const ordered_json& item) {
    domain::IngredientEntry entry;
    if (item.is_string()) {
        entry.name = item.get<std::string>();
        if (entry.name.empty()) return std::nullopt;
        return entry;
    }
    if (!item.is_object()) return std::nullopt;

    auto nameIt = item.find("name");
    if (nameIt == item.end() || !RecipeNormalizer::IsTruthy(*nameIt)) return std::nullopt;
    entry.name = RecipeNormalizer::Stringify(*nameIt);

    auto quantityIt = item.find("quantity");
    if (quantityIt != item.end()) {
        entry.quantity = QuantityFromJson(*quantityIt);
    }
    auto unitIt = item.find("unit");
    if (unitIt != item.end() && !unitIt->is_null()) {
        entry.unit = RecipeNormalizer::Stringify(*unitIt);
    }
    entry.source = item;
    return entry;
}

domain::IngredientEntry EntryFromMapping(const std::string& name, const ordered_json& rawQuantity) {
    domain::IngredientEntry entry;
    entry.name = name;

    if (rawQuantity.is_string()) {
        const std::string text = rawQuantity.get<std::string>();
        std::istringstream tokens(text);
        std::string amount;
        std::string unit;
        tokens >> amount >> unit;

        auto number = RecipeNormalizer::ParseNumber(amount);
        if (number && !unit.empty()) {
            entry.quantity = *number;
            entry.unit = unit;
        } else {
            // Left for the unit normalizer ("to taste", "1/2 cup", ...).
            entry.quantity = text;
        }
        return entry;
    }

    entry.quantity = QuantityFromJson(rawQuantity);
    return entry;
}

} // namespace

bool RecipeNormalizer::IsTruthy(const ordered_json& value) {
    switch (value.type()) {
        case ordered_json::value_t::null:
        case ordered_json::value_t::discarded:
            return false;
        case ordered_json::value_t::boolean:
            return value.get<bool>();
        case ordered_json::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case ordered_json::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case ordered_json::value_t::number_float:
            return value.get<double>() != 0.0;
        case ordered_json::value_t::string:
        case ordered_json::value_t::array:
        case ordered_json::value_t::object:
        case ordered_json::value_t::binary:
            return !value.empty();
    }
    return false;
}

std::string RecipeNormalizer::Stringify(const ordered_json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::optional<double> RecipeNormalizer::ParseNumber(const std::string& token) {
    // strtod also reads hexadecimal ("0x10"), which is not a quantity.
    if (token.empty() || token.find_first_of("xX") != std::string::npos) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

ordered_json RecipeNormalizer::DisambiguateShape(const ordered_json& payload) {
    if (payload.is_object()) {
        auto single = payload.find("recipe");
        if (single != payload.end() && single->is_object()) {
            return ordered_json::array({*single});
        }
        auto list = payload.find("recipes");
        if (list != payload.end() && list->is_array()) {
            return *list;
        }
    }
    return ordered_json::array({payload});
}

std::string RecipeNormalizer::ResolveTitle(const ordered_json& raw) {
    for (const char* key : {"title", "name", "recipe_name"}) {
        auto it = raw.find(key);
        if (it != raw.end() && IsTruthy(*it)) {
            return Stringify(*it);
        }
    }
    return kUntitledRecipe;
}

std::vector<std::string> RecipeNormalizer::ResolveInstructions(const ordered_json& raw) {
    ordered_json source = ordered_json::array();
    for (const char* key : {"instructions", "steps"}) {
        auto it = raw.find(key);
        if (it != raw.end() && IsTruthy(*it)) {
            source = *it;
            break;
        }
    }

    std::vector<std::string> steps;
    if (source.is_string()) {
        steps.push_back(source.get<std::string>());
    } else if (source.is_array()) {
        for (const auto& step : source) {
            steps.push_back(Stringify(step));
        }
    } else {
        steps.push_back(Stringify(source));
    }

    if (steps.empty()) {
        steps.push_back(kNoInstructions);
    }
    return steps;
}

std::vector<domain::IngredientEntry> RecipeNormalizer::NormalizeIngredients(const ordered_json& ingredients) {
    std::vector<domain::IngredientEntry> out;
    if (ingredients.is_array()) {
        for (const auto& item : ingredients) {
            if (auto entry = EntryFromListItem(item)) {
                out.push_back(std::move(*entry));
            }
        }
    } else if (ingredients.is_object()) {
        for (const auto& [name, rawQuantity] : ingredients.items()) {
            if (name.empty()) continue;
            out.push_back(EntryFromMapping(name, rawQuantity));
        }
    }
    return out;
}

std::optional<domain::Recipe> RecipeNormalizer::NormalizeRecipe(const ordered_json& raw) {
    if (!raw.is_object()) return std::nullopt;

    domain::Recipe recipe;
    recipe.title = ResolveTitle(raw);
    recipe.instructions = ResolveInstructions(raw);

    auto ingredientsIt = raw.find("ingredients");
    if (ingredientsIt != raw.end()) {
        recipe.ingredients = NormalizeIngredients(*ingredientsIt);
    }

    for (const auto& [key, value] : raw.items()) {
        if (!IsCanonicalKey(key)) {
            recipe.extras[key] = value;
        }
    }
    return recipe;
}

std::vector<domain::Recipe> RecipeNormalizer::Normalize(const ordered_json& payload) {
    std::vector<domain::Recipe> recipes;
    for (const auto& candidate : DisambiguateShape(payload)) {
        if (auto recipe = NormalizeRecipe(candidate)) {
            recipes.push_back(std::move(*recipe));
        }
    }
    return recipes;
}

} // namespace smartcook::application
