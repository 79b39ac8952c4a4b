/**
 * @file ProfileRepository.hpp
 * @brief Read-only, file-backed user profiles: spice cabinet and rating digest.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/RecipeCollaborators.hpp"

namespace smartcook::infrastructure {

/**
 * @class ProfileRepository
 * @brief Loads {"<user_id>": {"spices": [...], "rating_summary": "..."}} once.
 * Unknown users yield no spices and an empty summary. Immutable after
 * construction, so it can be shared between concurrent requests.
 */
class ProfileRepository : public domain::SpiceProvider, public domain::RatingSummarizer {
public:
    struct Profile {
        std::vector<std::string> spices;
        std::string ratingSummary;
    };

    /** @brief A missing or unreadable file produces an empty repository. */
    explicit ProfileRepository(const std::string& path);

    explicit ProfileRepository(const nlohmann::json& profiles);

    std::vector<std::string> getSpicesForUser(std::int64_t userId) const override;
    std::string summarizeRatingsForPrompt(std::int64_t userId) const override;

    size_t size() const { return m_profiles.size(); }

private:
    void loadFromJson(const nlohmann::json& profiles);

    std::map<std::string, Profile> m_profiles;
};

} // namespace smartcook::infrastructure
