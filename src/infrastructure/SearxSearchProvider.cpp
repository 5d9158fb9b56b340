#include "infrastructure/SearxSearchProvider.hpp"
#include "domain/ResearchErrors.hpp"
#include <httplib.h>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace deepresearch::infrastructure {

SearxSearchProvider::SearxSearchProvider(const std::string& host, int port,
                                         const std::string& path, std::size_t maxResults)
    : m_host(host), m_port(port), m_path(path), m_maxResults(maxResults) {}

std::string SearxSearchProvider::search(const std::string& term) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(30);

    httplib::Params params = {{"q", term}, {"format", "json"}};
    httplib::Headers headers = {{"Accept", "application/json"}};
    auto res = cli.Get(m_path, params, headers);
    if (!res) {
        std::string error = "search backend unreachable: " + httplib::to_string(res.error());
        std::cerr << "[SearxSearchProvider] " << error << std::endl;
        throw domain::ProviderError(error);
    }
    if (res->status != 200) {
        std::cerr << "[SearxSearchProvider] HTTP Error " << res->status << " for '" << term << "'" << std::endl;
        throw domain::ProviderError("search HTTP error " + std::to_string(res->status));
    }

    json body;
    try {
        body = json::parse(res->body);
    } catch (const json::parse_error& e) {
        std::cerr << "[SearxSearchProvider] JSON Parse Error: " << e.what() << std::endl;
        throw domain::ProviderError("unparsable search response");
    }

    std::string rendered = RenderResults(body, m_maxResults);
    if (rendered.empty()) {
        throw domain::ProviderError("no results for '" + term + "'");
    }
    return rendered;
}

std::string SearxSearchProvider::RenderResults(const json& response, std::size_t maxResults) {
    if (!response.contains("results") || !response["results"].is_array()) {
        return "";
    }

    std::ostringstream out;
    std::size_t rendered = 0;
    for (const auto& item : response["results"]) {
        if (rendered >= maxResults) break;
        if (!item.is_object()) continue;
        std::string title = item.value("title", "");
        std::string url = item.value("url", "");
        std::string content = item.value("content", "");
        if (title.empty() && content.empty()) continue;

        if (rendered > 0) out << "\n";
        out << "Title: " << title << "\n";
        if (!url.empty()) out << "URL: " << url << "\n";
        if (!content.empty()) out << content << "\n";
        ++rendered;
    }
    return out.str();
}

} // namespace deepresearch::infrastructure
