#include <cassert>
#include <iostream>

#include "application/PromptComposer.hpp"

using namespace smartcook;
using application::PromptComposer;
using application::PromptContext;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

PromptContext BaseContext() {
    PromptContext context;
    context.userMessage = "Something quick for dinner";
    domain::InventoryItem rice;
    rice.name = "rice";
    rice.quantity = 2.0;
    rice.unit = "kg";
    domain::InventoryItem onion;
    onion.name = "onion";
    context.inventory = {rice, onion};
    context.recipeCount = 2;
    return context;
}

void TestSystemContract() {
    const std::string system = PromptComposer::BuildSystemPrompt();
    assert(Contains(system, "ONE VALID JSON object only"));
    assert(Contains(system, "Never output text before or after the JSON."));
    assert(Contains(system, "Never wrap JSON with ```json"));
    assert(Contains(system, "Never use comments"));
    assert(Contains(system, "Allowed units: grams, kg, ml, l, pieces."));
    assert(Contains(system, "Use ONLY ingredients from the provided inventory."));
    assert(Contains(system, "\"recipes\""));
    assert(Contains(system, "\"instructions\""));

    // Attempt-invariant.
    assert(system == PromptComposer::BuildSystemPrompt());
}

void TestFreshFraming() {
    PromptContext context = BaseContext();
    const std::string user = PromptComposer::BuildUserPrompt(context);
    assert(user.rfind("User message: Something quick for dinner\n", 0) == 0);
    assert(Contains(user, "Available ingredients: 2 kg rice, onion\n"));
    assert(Contains(user, "User preferences: no special preferences.\n"));
    assert(Contains(user, "Available spices: no specific spices available\n"));
    assert(Contains(user, "Please return up to 2 recipes in the JSON schema described."));
    assert(!Contains(user, "previously received"));
}

void TestContinuationFraming() {
    PromptContext context = BaseContext();
    context.previousRecipeTitle = "Fried Rice";
    context.userMessage = "make it spicier";
    const std::string user = PromptComposer::BuildUserPrompt(context);
    assert(user.rfind("User previously received this recipe: Fried Rice.\nUser now says: make it spicier\n", 0) == 0);
    assert(!Contains(user, "User message:"));
}

void TestPreferencesSpicesNotesAndRatings() {
    PromptContext context = BaseContext();
    context.preferences.dietary = {"vegan", "gluten free"};
    context.preferences.allergies = {"peanuts", "sesame"};
    context.spices = {"cumin", "paprika"};
    context.ratingSummary = "User loved spicy curries.";
    const std::string user = PromptComposer::BuildUserPrompt(context);

    assert(Contains(user, "User preferences: dietary restrictions: vegan, gluten free; allergies: peanuts, sesame.\n"));
    assert(Contains(user, "Available spices: cumin, paprika\n"));
    assert(Contains(user, "plant-based"));
    assert(Contains(user, "gluten-free"));
    assert(Contains(user, "User loved spicy curries.\n"));

    domain::UserPreferences allergiesOnly;
    allergiesOnly.allergies = {"shellfish"};
    assert(PromptComposer::BuildPreferenceSummary(allergiesOnly) == "allergies: shellfish");
}

void TestTemperature() {
    assert(PromptComposer::SelectTemperature("Surprise me!") == 0.7);
    assert(PromptComposer::SelectTemperature("something DIFFERENT please") == 0.7);
    assert(PromptComposer::SelectTemperature("pasta again") == 0.4);

    PromptContext context = BaseContext();
    context.userMessage = "surprise";
    auto prompt = PromptComposer::Compose(context);
    assert(prompt.temperature == PromptComposer::kCreativeTemperature);
    assert(prompt.system == PromptComposer::BuildSystemPrompt());
    assert(Contains(prompt.user, "User message: surprise"));
}

} // namespace

int main() {
    std::cout << "[Test] Starting PromptComposer Test..." << std::endl;

    TestSystemContract();
    TestFreshFraming();
    TestContinuationFraming();
    TestPreferencesSpicesNotesAndRatings();
    TestTemperature();

    std::cout << "[PASS] PromptComposer Test." << std::endl;
    return 0;
}
