/**
 * @file OllamaCompletionProvider.cpp
 * @brief Implementation of the OllamaCompletionProvider class.
 */
#include "infrastructure/OllamaCompletionProvider.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "domain/ResearchErrors.hpp"
#include <iostream>

using json = nlohmann::json;

namespace deepresearch::infrastructure {

namespace {

// Models sometimes wrap JSON in a markdown fence even with a format constraint.
std::string StripCodeFence(const std::string& content) {
    auto start = content.find("```");
    if (start == std::string::npos) return content;
    auto bodyStart = content.find('\n', start);
    auto end = content.rfind("```");
    if (bodyStart == std::string::npos || end <= bodyStart) return content;
    return content.substr(bodyStart + 1, end - bodyStart - 1);
}

} // namespace

OllamaCompletionProvider::OllamaCompletionProvider(const std::string& host, int port,
                                                   const std::string& model, int timeoutSeconds)
    : m_client(host, port, timeoutSeconds), m_model(model) {}

void OllamaCompletionProvider::initialize() {
    auto available = m_client.getAvailableModels();
    std::lock_guard<std::mutex> lock(m_modelMutex);
    std::string selected = ModelSelector::SelectBest(available, m_model);
    if (selected != m_model) {
        std::cout << "[OllamaCompletionProvider] Configured model " << m_model
                  << " not installed. Auto-selected: " << selected << std::endl;
        m_model = selected;
    } else {
        std::cout << "[OllamaCompletionProvider] Using model: " << m_model << std::endl;
    }
}

json OllamaCompletionProvider::invoke(const std::string& instructions,
                                      const std::string& context,
                                      const domain::OutputShape& shape) {
    json messages = json::array({
        {{"role", "system"}, {"content", instructions}},
        {{"role", "user"}, {"content", context}}
    });

    json format = shape.isText() ? json(nullptr) : shape.toJsonSchema();
    std::cout << "[OllamaCompletionProvider] " << shape.name() << ": sending "
              << (instructions.size() + context.size()) << " chars" << std::endl;

    std::string content = m_client.chat(getCurrentModel(), messages, format);
    if (shape.isText()) {
        return json(content);
    }

    try {
        return json::parse(StripCodeFence(content));
    } catch (const json::parse_error& e) {
        std::cerr << "[OllamaCompletionProvider] " << shape.name() << " is not valid JSON: " << e.what() << std::endl;
        throw domain::ProviderError("model returned invalid JSON for " + shape.name());
    }
}

std::string OllamaCompletionProvider::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace deepresearch::infrastructure
