#include "infrastructure/WebhookNotifier.hpp"
#include "domain/ResearchErrors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace deepresearch::infrastructure {

WebhookNotifier::WebhookNotifier(const std::string& host, int port, const std::string& path)
    : m_host(host), m_port(port), m_path(path) {}

void WebhookNotifier::deliver(const std::string& subject, const std::string& body) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(30);

    nlohmann::json payload = {
        {"subject", subject},
        {"body", body},
        {"format", "markdown"}
    };

    auto res = cli.Post(m_path, payload.dump(), "application/json");
    if (!res) {
        std::string error = "notifier unreachable: " + httplib::to_string(res.error());
        std::cerr << "[WebhookNotifier] " << error << std::endl;
        throw domain::DeliveryError(error);
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[WebhookNotifier] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw domain::DeliveryError("notifier HTTP error " + std::to_string(res->status));
    }
    std::cout << "[WebhookNotifier] Delivered '" << subject << "' (" << body.size() << " chars)" << std::endl;
}

} // namespace deepresearch::infrastructure
