/**
 * @file RecipeCollaborators.hpp
 * @brief Services the generation pipeline consumes but does not own.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "domain/Recipe.hpp"

namespace smartcook::domain {

/**
 * @class UnitNormalizer
 * @brief Post-processes quantities and units. Must keep recipe count, titles
 * and instructions unchanged.
 */
class UnitNormalizer {
public:
    virtual ~UnitNormalizer() = default;
    virtual std::vector<Recipe> normalizeUnits(std::vector<Recipe> recipes, std::int64_t userId) const = 0;
};

/**
 * @class SpiceProvider
 * @brief Spices the user keeps at home. May be empty.
 */
class SpiceProvider {
public:
    virtual ~SpiceProvider() = default;
    virtual std::vector<std::string> getSpicesForUser(std::int64_t userId) const = 0;
};

/**
 * @class RatingSummarizer
 * @brief Free-text digest of the user's past recipe ratings. May be empty.
 */
class RatingSummarizer {
public:
    virtual ~RatingSummarizer() = default;
    virtual std::string summarizeRatingsForPrompt(std::int64_t userId) const = 0;
};

} // namespace smartcook::domain
