#include "infrastructure/ProfileRepository.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace smartcook::infrastructure {

ProfileRepository::ProfileRepository(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ProfileRepository] No profile file at " << path << ", profiles are empty." << std::endl;
        return;
    }
    std::ifstream f(path);
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[ProfileRepository] Error reading " << path << ": not valid JSON." << std::endl;
        return;
    }
    loadFromJson(j);
    std::cout << "[ProfileRepository] Loaded " << m_profiles.size() << " profile(s) from " << path << std::endl;
}

ProfileRepository::ProfileRepository(const nlohmann::json& profiles) {
    loadFromJson(profiles);
}

void ProfileRepository::loadFromJson(const nlohmann::json& profiles) {
    if (!profiles.is_object()) return;
    for (const auto& [userKey, entry] : profiles.items()) {
        if (!entry.is_object()) continue;
        Profile profile;
        if (entry.contains("spices") && entry["spices"].is_array()) {
            for (const auto& spice : entry["spices"]) {
                if (spice.is_string()) profile.spices.push_back(spice.get<std::string>());
            }
        }
        if (entry.contains("rating_summary") && entry["rating_summary"].is_string()) {
            profile.ratingSummary = entry["rating_summary"].get<std::string>();
        }
        m_profiles[userKey] = std::move(profile);
    }
}

std::vector<std::string> ProfileRepository::getSpicesForUser(std::int64_t userId) const {
    auto it = m_profiles.find(std::to_string(userId));
    if (it == m_profiles.end()) return {};
    return it->second.spices;
}

std::string ProfileRepository::summarizeRatingsForPrompt(std::int64_t userId) const {
    auto it = m_profiles.find(std::to_string(userId));
    if (it == m_profiles.end()) return "";
    return it->second.ratingSummary;
}

} // namespace smartcook::infrastructure
