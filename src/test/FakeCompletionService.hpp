// Scripted completion service shared by the pipeline tests.
#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "application/JsonRepairService.hpp"
#include "domain/CompletionService.hpp"
#include "domain/RecipeCollaborators.hpp"

namespace smartcook::test {

class FakeCompletionService : public domain::CompletionService {
public:
    /// Receives the user prompt and the 1-based index of the call of that kind.
    using Responder = std::function<std::string(const std::string& userText, int callIndex)>;

    explicit FakeCompletionService(Responder primary, Responder repair = nullptr)
        : m_primary(std::move(primary)), m_repair(std::move(repair)) {}

    std::string complete(const std::string& systemText,
                         const std::string& userText,
                         double temperature,
                         int maxTokens) const override {
        if (systemText == application::JsonRepairService::BuildSystemPrompt()) {
            int n = ++m_repairCalls;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_repairTemperatures.push_back(temperature);
            }
            if (!m_repair) return "still not json";
            return m_repair(userText, n);
        }

        int n = ++m_primaryCalls;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastSystem = systemText;
            m_lastUser = userText;
            m_lastTemperature = temperature;
            m_lastMaxTokens = maxTokens;
        }
        return m_primary(userText, n);
    }

    std::string providerName() const override { return "Fake"; }
    std::string modelName() const override { return "fake-model"; }

    int primaryCalls() const { return m_primaryCalls.load(); }
    int repairCalls() const { return m_repairCalls.load(); }

    std::string lastUser() const { std::lock_guard<std::mutex> lock(m_mutex); return m_lastUser; }
    std::string lastSystem() const { std::lock_guard<std::mutex> lock(m_mutex); return m_lastSystem; }
    double lastTemperature() const { std::lock_guard<std::mutex> lock(m_mutex); return m_lastTemperature; }
    int lastMaxTokens() const { std::lock_guard<std::mutex> lock(m_mutex); return m_lastMaxTokens; }
    std::vector<double> repairTemperatures() const { std::lock_guard<std::mutex> lock(m_mutex); return m_repairTemperatures; }

private:
    Responder m_primary;
    Responder m_repair;
    mutable std::atomic<int> m_primaryCalls{0};
    mutable std::atomic<int> m_repairCalls{0};
    mutable std::mutex m_mutex;
    mutable std::string m_lastSystem;
    mutable std::string m_lastUser;
    mutable double m_lastTemperature = -1.0;
    mutable int m_lastMaxTokens = 0;
    mutable std::vector<double> m_repairTemperatures;
};

class FixedSpices : public domain::SpiceProvider {
public:
    explicit FixedSpices(std::vector<std::string> spices) : m_spices(std::move(spices)) {}
    std::vector<std::string> getSpicesForUser(std::int64_t) const override { return m_spices; }
private:
    std::vector<std::string> m_spices;
};

class FixedRatings : public domain::RatingSummarizer {
public:
    explicit FixedRatings(std::string summary) : m_summary(std::move(summary)) {}
    std::string summarizeRatingsForPrompt(std::int64_t) const override { return m_summary; }
private:
    std::string m_summary;
};

/// Passes recipes through and records which user they were normalized for.
class RecordingUnitNormalizer : public domain::UnitNormalizer {
public:
    std::vector<domain::Recipe> normalizeUnits(std::vector<domain::Recipe> recipes, std::int64_t userId) const override {
        m_lastUserId = userId;
        ++m_calls;
        return recipes;
    }
    mutable std::atomic<std::int64_t> m_lastUserId{-1};
    mutable std::atomic<int> m_calls{0};
};

} // namespace smartcook::test
