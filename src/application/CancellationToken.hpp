/**
 * @file CancellationToken.hpp
 * @brief Shared, one-shot cancellation flag with wake-up callbacks.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace deepresearch::application {

/**
 * @class CancellationToken
 * @brief Copies share one flag. Cancelling is idempotent and runs every registered callback once.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel() const;
    bool isCancelled() const;

    /**
     * @brief Registers a callback run on cancellation.
     *
     * Runs the callback immediately (and returns 0) when already cancelled.
     * @return Registration id for removeCallback.
     */
    std::size_t onCancel(Callback callback) const;

    void removeCallback(std::size_t id) const;

private:
    struct State {
        std::mutex mutex;
        std::atomic<bool> cancelled{false};
        std::map<std::size_t, Callback> callbacks;
        std::size_t nextId = 1;
    };

    std::shared_ptr<State> m_state;
};

/**
 * @class CancellationRegistration
 * @brief Removes a callback registration when it goes out of scope.
 */
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, CancellationToken::Callback callback)
        : m_token(token), m_id(token.onCancel(std::move(callback))) {}

    ~CancellationRegistration() {
        if (m_id != 0) m_token.removeCallback(m_id);
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken m_token;
    std::size_t m_id;
};

} // namespace deepresearch::application
