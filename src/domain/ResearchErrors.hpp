/**
 * @file ResearchErrors.hpp
 * @brief Exception taxonomy for the research pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace deepresearch::domain {

class ResearchError : public std::runtime_error {
public:
    explicit ResearchError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A completion or search provider failed (timeout, malformed output, HTTP error). */
class ProviderError : public ResearchError {
public:
    explicit ProviderError(const std::string& message) : ResearchError(message) {}
};

/** @brief The notifier could not deliver the report. Never fatal to a run. */
class DeliveryError : public ResearchError {
public:
    explicit DeliveryError(const std::string& message) : ResearchError(message) {}
};

/** @brief The operation is not valid in the run's current stage. */
class InvalidTransition : public ResearchError {
public:
    explicit InvalidTransition(const std::string& message) : ResearchError(message) {}
};

/** @brief Supplied answers do not match the pending questions one to one. */
class AnswerMismatch : public ResearchError {
public:
    explicit AnswerMismatch(const std::string& message) : ResearchError(message) {}
};

} // namespace deepresearch::domain
