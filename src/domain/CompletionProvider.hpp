/**
 * @file CompletionProvider.hpp
 * @brief Interface for the model that performs every reasoning step of a run.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "OutputShape.hpp"

namespace deepresearch::domain {

/**
 * @class CompletionProvider
 * @brief Abstract interface for services that answer a prompt with a value of a declared shape.
 */
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Runs one completion.
     * @param instructions Role instructions (system prompt).
     * @param context Task-specific content (user prompt).
     * @param shape Expected output: a JSON string for text shapes, a JSON object otherwise.
     * @return The provider's answer. Conformance is checked by the caller.
     * @throws ProviderError on timeout, transport or provider-side failure.
     */
    virtual nlohmann::json invoke(const std::string& instructions,
                                  const std::string& context,
                                  const OutputShape& shape) = 0;

    /** @brief Name of the model in use, for logging. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace deepresearch::domain
