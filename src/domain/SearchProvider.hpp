/**
 * @file SearchProvider.hpp
 * @brief Interface for web search backends.
 */

#pragma once

#include <string>

namespace deepresearch::domain {

class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    /**
     * @brief Searches the web for a term.
     * @return Raw result text (snippets, titles, links).
     * @throws ProviderError when the backend fails or finds nothing.
     */
    virtual std::string search(const std::string& term) = 0;
};

} // namespace deepresearch::domain
