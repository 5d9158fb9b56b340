/**
 * @file OllamaCompletionProvider.hpp
 * @brief CompletionProvider backed by a local Ollama server.
 */

#pragma once
#include "domain/CompletionProvider.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <mutex>
#include <string>

namespace deepresearch::infrastructure {

/**
 * @class OllamaCompletionProvider
 * @brief Implements CompletionProvider with Ollama's structured-output chat endpoint.
 *
 * Object shapes are sent as a JSON schema in the request's `format` field, so the model
 * is constrained to emit exactly the declared fields.
 */
class OllamaCompletionProvider : public domain::CompletionProvider {
public:
    OllamaCompletionProvider(const std::string& host = "localhost",
                             int port = 11434,
                             const std::string& model = "qwen2.5:7b",
                             int timeoutSeconds = 600);

    /** @brief Queries /api/tags and switches to the best installed model. */
    void initialize() override;

    nlohmann::json invoke(const std::string& instructions,
                          const std::string& context,
                          const domain::OutputShape& shape) override;

    std::string getCurrentModel() const override;

private:
    OllamaClient m_client;
    mutable std::mutex m_modelMutex;
    std::string m_model; ///< Target model name.
};

} // namespace deepresearch::infrastructure
