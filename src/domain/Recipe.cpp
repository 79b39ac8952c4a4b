/**
 * @file Recipe.cpp
 * @brief Serialization helpers for the canonical recipe schema.
 */

#include "domain/Recipe.hpp"
#include <sstream>

namespace smartcook::domain {

std::string FormatQuantity(const Quantity& quantity) {
    if (const auto* text = std::get_if<std::string>(&quantity)) {
        return *text;
    }
    std::ostringstream oss;
    oss << std::get<double>(quantity);
    return oss.str();
}

nlohmann::ordered_json IngredientEntry::toJson() const {
    nlohmann::ordered_json j = source.is_object() ? source : nlohmann::ordered_json::object();
    j["name"] = name;

    if (quantity) {
        nlohmann::ordered_json canonical;
        if (const auto* number = std::get_if<double>(&*quantity)) {
            canonical = *number;
        } else {
            canonical = std::get<std::string>(*quantity);
        }
        auto it = j.find("quantity");
        if (it == j.end() || *it != canonical) {
            j["quantity"] = std::move(canonical);
        }
    } else if (j.contains("quantity") && !j["quantity"].is_null()) {
        j.erase("quantity");
    }

    if (unit) {
        j["unit"] = *unit;
    } else if (j.contains("unit") && !j["unit"].is_null()) {
        j.erase("unit");
    }
    return j;
}

nlohmann::ordered_json Recipe::toJson() const {
    nlohmann::ordered_json j = extras.is_object() ? extras : nlohmann::ordered_json::object();

    nlohmann::ordered_json ingredientsJson = nlohmann::ordered_json::array();
    for (const auto& ingredient : ingredients) {
        ingredientsJson.push_back(ingredient.toJson());
    }

    j["title"] = title;
    j["ingredients"] = std::move(ingredientsJson);
    j["instructions"] = instructions;
    return j;
}

std::string Recipe::extraString(const std::string& key, const std::string& fallback) const {
    if (!extras.is_object()) return fallback;
    auto it = extras.find(key);
    if (it == extras.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

} // namespace smartcook::domain
