/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/RecipeGenerationService.hpp"
#include "domain/CompletionService.hpp"
#include "domain/RecipeCollaborators.hpp"

namespace smartcook::application {

struct AppServices {
    std::shared_ptr<domain::CompletionService> completion;
    std::shared_ptr<domain::UnitNormalizer> unitNormalizer;
    std::shared_ptr<domain::SpiceProvider> spices;
    std::shared_ptr<domain::RatingSummarizer> ratings;
    std::unique_ptr<RecipeGenerationService> generationService;
};

} // namespace smartcook::application
