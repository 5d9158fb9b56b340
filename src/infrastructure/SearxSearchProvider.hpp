/**
 * @file SearxSearchProvider.hpp
 * @brief SearchProvider backed by a SearXNG instance's JSON API.
 */

#pragma once
#include "domain/SearchProvider.hpp"
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace deepresearch::infrastructure {

class SearxSearchProvider : public domain::SearchProvider {
public:
    SearxSearchProvider(const std::string& host = "localhost",
                        int port = 8080,
                        const std::string& path = "/search",
                        std::size_t maxResults = 5);

    /** @throws domain::ProviderError on HTTP failure or when nothing was found. */
    std::string search(const std::string& term) override;

    /**
     * @brief Renders the first maxResults entries of a SearXNG response as text blocks.
     * @return Empty string when the response holds no usable result.
     */
    static std::string RenderResults(const nlohmann::json& response, std::size_t maxResults);

private:
    std::string m_host;
    int m_port;
    std::string m_path;
    std::size_t m_maxResults;
};

} // namespace deepresearch::infrastructure
