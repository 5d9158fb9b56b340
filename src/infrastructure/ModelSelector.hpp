/**
 * @file ModelSelector.hpp
 * @brief Picks the chat model a run should use from what the server has installed.
 */

#pragma once
#include <string>
#include <vector>

namespace deepresearch::infrastructure {

/**
 * @class ModelSelector
 * @brief Keeps model policy out of the provider's I/O code.
 */
class ModelSelector {
public:
    /**
     * @brief Returns the configured model when installed, else the first installed model
     * matching the priority list, else the first installed model.
     * With nothing installed the configured model is returned unchanged.
     */
    static std::string SelectBest(const std::vector<std::string>& availableModels,
                                  const std::string& configured = "qwen2.5:7b") {
        if (availableModels.empty()) {
            return configured;
        }

        for (const auto& model : availableModels) {
            if (model == configured) {
                return configured;
            }
        }

        // Families known to follow JSON-schema formats reliably.
        for (const auto& family : PreferredFamilies()) {
            for (const auto& model : availableModels) {
                if (model.find(family) != std::string::npos) {
                    return model;
                }
            }
        }

        return availableModels.front();
    }

    static const std::vector<std::string>& PreferredFamilies() {
        static const std::vector<std::string> families = {
            "qwen2.5:7b",
            "qwen2.5",
            "llama3.1",
            "llama3",
            "mistral",
            "gemma2"
        };
        return families;
    }
};

} // namespace deepresearch::infrastructure
