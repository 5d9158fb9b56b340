/**
 * @file WebhookNotifier.hpp
 * @brief Notifier that POSTs the report to an HTTP endpoint (mail relay, chat hook).
 */

#pragma once
#include "domain/Notifier.hpp"
#include <string>

namespace deepresearch::infrastructure {

class WebhookNotifier : public domain::Notifier {
public:
    WebhookNotifier(const std::string& host, int port, const std::string& path = "/notify");

    /** @throws domain::DeliveryError on connection failure or a non-2xx status. */
    void deliver(const std::string& subject, const std::string& body) override;

private:
    std::string m_host;
    int m_port;
    std::string m_path;
};

} // namespace deepresearch::infrastructure
