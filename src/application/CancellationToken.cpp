/**
 * @file CancellationToken.cpp
 * @brief Implementation of CancellationToken.
 */

#include "application/CancellationToken.hpp"
#include <vector>

namespace deepresearch::application {

CancellationToken::CancellationToken() : m_state(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
    std::vector<Callback> toRun;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->cancelled) return;
        m_state->cancelled = true;
        for (auto& entry : m_state->callbacks) {
            toRun.push_back(std::move(entry.second));
        }
        m_state->callbacks.clear();
    }
    // Callbacks take their own locks; run them outside ours.
    for (auto& callback : toRun) {
        callback();
    }
}

bool CancellationToken::isCancelled() const {
    return m_state->cancelled.load();
}

std::size_t CancellationToken::onCancel(Callback callback) const {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_state->cancelled) {
            std::size_t id = m_state->nextId++;
            m_state->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::removeCallback(std::size_t id) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->callbacks.erase(id);
}

} // namespace deepresearch::application
