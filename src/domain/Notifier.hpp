/**
 * @file Notifier.hpp
 * @brief Interface for delivering a finished report (e-mail, webhook, ...).
 */

#pragma once

#include <string>

namespace deepresearch::domain {

class Notifier {
public:
    virtual ~Notifier() = default;

    /**
     * @brief Delivers a document. Returning normally is the acknowledgement.
     * @throws DeliveryError when the document could not be delivered.
     */
    virtual void deliver(const std::string& subject, const std::string& body) = 0;
};

} // namespace deepresearch::domain
