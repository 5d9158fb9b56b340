/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace deepresearch::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 600);

    /**
     * @brief Sends a POST request to /api/chat.
     * @param format Either null (free text), the string "json", or a JSON schema object.
     * @return The assistant message content.
     * @throws domain::ProviderError on connection, HTTP or parse failure.
     */
    std::string chat(const std::string& model,
                     const nlohmann::json& messages,
                     const nlohmann::json& format = nullptr);

    /** @brief Fetches available models from /api/tags. Empty on failure. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace deepresearch::infrastructure
