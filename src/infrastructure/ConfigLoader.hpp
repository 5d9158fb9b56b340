/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the research settings (settings.json).
 *
 * Keeps JSON parsing of configuration in one place; every other component
 * receives plain structs.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace deepresearch::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int timeoutSeconds = 600;
};

struct SearchSettings {
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/search";
    std::size_t maxResults = 5;
};

struct NotifierSettings {
    bool enabled = false;
    std::string host = "localhost";
    int port = 8025;
    std::string path = "/notify";
};

struct PipelineSettings {
    std::size_t questionCount = 3;
    std::size_t planSize = 5;
};

/**
 * @struct ResearchSettings
 * @brief Everything settings.json can configure. Defaults apply to absent keys.
 */
struct ResearchSettings {
    OllamaSettings ollama;
    SearchSettings search;
    NotifierSettings notifier;
    PipelineSettings pipeline;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param path Path of settings.json.
     * @return Defaults when the file is missing or malformed (the error is logged).
     */
    static ResearchSettings Load(const std::string& path);

    /**
     * @brief Applies the keys present in a parsed settings document on top of defaults.
     * Keys with the wrong type are logged and ignored.
     */
    static ResearchSettings FromJson(const nlohmann::json& document);
};

} // namespace deepresearch::infrastructure
