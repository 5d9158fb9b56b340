/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace deepresearch::infrastructure {

using json = nlohmann::json;

namespace {

void ReadString(const json& section, const char* key, std::string& target) {
    if (!section.contains(key)) return;
    if (section[key].is_string()) {
        target = section[key].get<std::string>();
    } else {
        std::cerr << "[ConfigLoader] '" << key << "' must be a string; keeping " << target << std::endl;
    }
}

void ReadInt(const json& section, const char* key, int& target) {
    if (!section.contains(key)) return;
    if (section[key].is_number_integer()) {
        target = section[key].get<int>();
    } else {
        std::cerr << "[ConfigLoader] '" << key << "' must be an integer; keeping " << target << std::endl;
    }
}

void ReadCount(const json& section, const char* key, std::size_t& target) {
    if (!section.contains(key)) return;
    if (section[key].is_number_integer() && section[key].get<long long>() > 0) {
        target = section[key].get<std::size_t>();
    } else {
        std::cerr << "[ConfigLoader] '" << key << "' must be a positive integer; keeping " << target << std::endl;
    }
}

void ReadBool(const json& section, const char* key, bool& target) {
    if (!section.contains(key)) return;
    if (section[key].is_boolean()) {
        target = section[key].get<bool>();
    } else {
        std::cerr << "[ConfigLoader] '" << key << "' must be true or false" << std::endl;
    }
}

const json* Section(const json& document, const char* name) {
    if (!document.contains(name)) return nullptr;
    if (!document[name].is_object()) {
        std::cerr << "[ConfigLoader] Section '" << name << "' is not an object; using defaults" << std::endl;
        return nullptr;
    }
    return &document[name];
}

} // namespace

ResearchSettings ConfigLoader::FromJson(const json& document) {
    ResearchSettings settings;
    if (!document.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object; using defaults" << std::endl;
        return settings;
    }

    if (const json* ollama = Section(document, "ollama")) {
        ReadString(*ollama, "host", settings.ollama.host);
        ReadInt(*ollama, "port", settings.ollama.port);
        ReadString(*ollama, "model", settings.ollama.model);
        ReadInt(*ollama, "timeout_seconds", settings.ollama.timeoutSeconds);
    }
    if (const json* search = Section(document, "search")) {
        ReadString(*search, "host", settings.search.host);
        ReadInt(*search, "port", settings.search.port);
        ReadString(*search, "path", settings.search.path);
        ReadCount(*search, "max_results", settings.search.maxResults);
    }
    if (const json* notifier = Section(document, "notifier")) {
        ReadBool(*notifier, "enabled", settings.notifier.enabled);
        ReadString(*notifier, "host", settings.notifier.host);
        ReadInt(*notifier, "port", settings.notifier.port);
        ReadString(*notifier, "path", settings.notifier.path);
    }
    if (const json* pipeline = Section(document, "pipeline")) {
        ReadCount(*pipeline, "question_count", settings.pipeline.questionCount);
        ReadCount(*pipeline, "plan_size", settings.pipeline.planSize);
    }
    return settings;
}

ResearchSettings ConfigLoader::Load(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << path << " not found; using defaults" << std::endl;
        return ResearchSettings{};
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return ResearchSettings{};
}

} // namespace deepresearch::infrastructure
