#include "domain/Inventory.hpp"
#include <algorithm>
#include <cctype>

namespace smartcook::domain {

namespace {

std::vector<std::string> StringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object() || !j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::string InventoryItem::key() const {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c){ return std::tolower(c); });
    return lowered;
}

std::string InventoryItem::describe() const {
    if (quantity && unit && !unit->empty()) {
        std::string amount = FormatQuantity(*quantity);
        bool nonZero = !(std::holds_alternative<double>(*quantity) && std::get<double>(*quantity) == 0.0);
        if (!amount.empty() && nonZero) {
            return amount + " " + *unit + " " + name;
        }
    }
    return name;
}

std::optional<InventoryItem> InventoryItem::FromJson(const nlohmann::json& j) {
    InventoryItem item;
    if (j.is_string()) {
        item.name = j.get<std::string>();
        return item;
    }
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return std::nullopt;
    }
    item.name = j["name"].get<std::string>();
    if (j.contains("quantity")) {
        const auto& q = j["quantity"];
        if (q.is_number()) item.quantity = q.get<double>();
        else if (q.is_string()) item.quantity = q.get<std::string>();
    }
    if (j.contains("unit") && j["unit"].is_string()) {
        item.unit = j["unit"].get<std::string>();
    }
    return item;
}

UserPreferences UserPreferences::FromJson(const nlohmann::json& j) {
    UserPreferences prefs;
    prefs.dietary = StringList(j, "dietary");
    prefs.allergies = StringList(j, "allergies");
    return prefs;
}

} // namespace smartcook::domain
