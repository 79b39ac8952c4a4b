/**
 * @file BasicUnitNormalizer.hpp
 * @brief Maps unit spellings onto the allowed set {grams, kg, ml, l, pieces}.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/RecipeCollaborators.hpp"

namespace smartcook::infrastructure {

class BasicUnitNormalizer : public domain::UnitNormalizer {
public:
    /** @brief Rewrites known unit aliases in place. Titles and instructions are untouched. */
    std::vector<domain::Recipe> normalizeUnits(std::vector<domain::Recipe> recipes, std::int64_t userId) const override;

    /** @brief Canonical unit for an alias ("g" -> "grams"); nullopt when unknown. */
    static std::optional<std::string> CanonicalUnit(const std::string& unit);
};

} // namespace smartcook::infrastructure
