#include "infrastructure/OllamaClient.hpp"
#include "domain/ResearchErrors.hpp"
#include <httplib.h>
#include <iostream>

namespace deepresearch::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

std::string OllamaClient::chat(const std::string& model,
                               const nlohmann::json& messages,
                               const nlohmann::json& format) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (!format.is_null()) {
        requestData["format"] = format;
    }

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        std::string error = "Ollama connection failed: " + httplib::to_string(res.error());
        std::cerr << "[OllamaClient] " << error << std::endl;
        throw domain::ProviderError(error);
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw domain::ProviderError("Ollama HTTP error " + std::to_string(res->status));
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].contains("content")) {
            return body["message"]["content"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
        throw domain::ProviderError(std::string("unparsable Ollama response: ") + e.what());
    }
    std::cerr << "[OllamaClient] Response JSON missing 'message.content': " << res->body << std::endl;
    throw domain::ProviderError("Ollama response has no message content");
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Error parsing model list: " << e.what() << std::endl;
        }
    } else {
        std::cerr << "[OllamaClient] Failed to list models. Is Ollama running?" << std::endl;
    }
    return models;
}

} // namespace deepresearch::infrastructure
