/**
 * @file PromptComposer.cpp
 * @brief Implementation of PromptComposer.
 */

#include "application/PromptComposer.hpp"
#include "domain/DietaryPolicy.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace smartcook::application {

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

} // namespace

Prompt PromptComposer::Compose(const PromptContext& context) {
    Prompt prompt;
    prompt.system = BuildSystemPrompt();
    prompt.user = BuildUserPrompt(context);
    prompt.temperature = SelectTemperature(context.userMessage);
    return prompt;
}

std::string PromptComposer::BuildSystemPrompt() {
    return
        "You are a helpful cooking assistant.\n"
        "You MUST reply with ONE VALID JSON object only.\n"
        "Rules:\n"
        "- Never output text before or after the JSON.\n"
        "- Never wrap JSON with ```json or any markdown.\n"
        "- Never use comments like // or /* */ inside JSON.\n"
        "- Allowed units: grams, kg, ml, l, pieces.\n"
        "- Use ONLY ingredients from the provided inventory.\n"
        "- Schema example:\n"
        "{\n"
        "  \"recipes\": [\n"
        "    {\n"
        "      \"title\": \"string\",\n"
        "      \"ingredients\": [ {\"name\": \"string\", \"quantity\": 100, \"unit\": \"grams\"} ],\n"
        "      \"instructions\": [\"step 1\", \"step 2\"]\n"
        "    }\n"
        "  ]\n"
        "}\n";
}

std::string PromptComposer::BuildUserPrompt(const PromptContext& context) {
    const std::string inventoryText = RenderInventory(context.inventory);
    const std::string preferenceText = BuildPreferenceSummary(context.preferences);
    const std::string spicesText = context.spices.empty()
        ? "no specific spices available"
        : Join(context.spices, ", ");

    std::ostringstream ss;
    if (context.previousRecipeTitle) {
        ss << "User previously received this recipe: " << *context.previousRecipeTitle << ".\n"
           << "User now says: " << context.userMessage << "\n";
    } else {
        ss << "User message: " << context.userMessage << "\n";
    }
    ss << "Available ingredients: " << inventoryText << "\n"
       << "User preferences: " << preferenceText << ".\n"
       << "Available spices: " << spicesText << "\n"
       << domain::DietaryPolicy::BuildRestrictionNote(context.preferences.dietary) << "\n"
       << context.ratingSummary << "\n"
       << "Please return up to " << context.recipeCount << " recipes in the JSON schema described.";
    return ss.str();
}

std::string PromptComposer::BuildPreferenceSummary(const domain::UserPreferences& preferences) {
    std::vector<std::string> parts;
    if (!preferences.dietary.empty()) {
        parts.push_back("dietary restrictions: " + Join(preferences.dietary, ", "));
    }
    if (!preferences.allergies.empty()) {
        parts.push_back("allergies: " + Join(preferences.allergies, ", "));
    }
    if (parts.empty()) return "no special preferences";
    return Join(parts, "; ");
}

std::string PromptComposer::RenderInventory(const std::vector<domain::InventoryItem>& inventory) {
    std::vector<std::string> lines;
    lines.reserve(inventory.size());
    for (const auto& item : inventory) {
        lines.push_back(item.describe());
    }
    return Join(lines, ", ");
}

double PromptComposer::SelectTemperature(const std::string& userMessage) {
    const std::string lowered = ToLower(userMessage);
    if (lowered.find("surprise") != std::string::npos || lowered.find("different") != std::string::npos) {
        return kCreativeTemperature;
    }
    return kDefaultTemperature;
}

} // namespace smartcook::application
