/**
 * @file ModelSelector.hpp
 * @brief Picks the local model used for recipe generation.
 */

#pragma once
#include <string>
#include <vector>

namespace smartcook::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from client I/O.
 *
 * Ollama names models "<family>:<tag>" (e.g. "llama3.1:8b"). The configured
 * model wins when installed; otherwise the installed model whose family ranks
 * best for instruction-following JSON output is used.
 */
class ModelSelector {
public:
    static std::string SelectBest(const std::vector<std::string>& availableModels,
                                  const std::string& configured = "llama3") {
        if (availableModels.empty()) {
            return configured;
        }

        const std::string configuredFamily = Family(configured);
        for (const auto& model : availableModels) {
            if (model == configured) return model;
        }
        // "llama3" in settings also accepts "llama3:latest" or "llama3:8b".
        if (configured.find(':') == std::string::npos) {
            for (const auto& model : availableModels) {
                if (Family(model) == configuredFamily) return model;
            }
        }

        const std::string* best = nullptr;
        size_t bestRank = kFamilyRanking.size();
        for (const auto& model : availableModels) {
            size_t rank = Rank(Family(model));
            if (rank < bestRank) {
                bestRank = rank;
                best = &model;
            }
        }
        return best ? *best : availableModels.front();
    }

    /** @brief "qwen2.5:7b" -> "qwen2.5" */
    static std::string Family(const std::string& model) {
        return model.substr(0, model.find(':'));
    }

private:
    inline static const std::vector<std::string> kFamilyRanking = {
        "llama3.1",
        "llama3",
        "qwen2.5",
        "mistral",
        "gemma"
    };

    static size_t Rank(const std::string& family) {
        for (size_t i = 0; i < kFamilyRanking.size(); ++i) {
            if (family == kFamilyRanking[i]) return i;
        }
        return kFamilyRanking.size();
    }
};

} // namespace smartcook::infrastructure
