/**
 * @file EventStream.cpp
 * @brief Implementation of EventStream.
 */

#include "application/EventStream.hpp"

namespace deepresearch::application {

bool EventStream::pushLocked(domain::ProgressEvent& event) {
    if (m_closed) return false;
    event.index = m_nextIndex++;
    event.timestamp = std::chrono::system_clock::now();
    m_queue.push_back(std::move(event));
    return true;
}

std::optional<domain::ProgressEvent> EventStream::popLocked() {
    if (m_queue.empty()) return std::nullopt;
    domain::ProgressEvent event = std::move(m_queue.front());
    m_queue.pop_front();
    return event;
}

bool EventStream::publish(domain::ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!pushLocked(event)) return false;
    }
    m_cv.notify_one();
    return true;
}

bool EventStream::publishAndClose(domain::ProgressEvent event) {
    bool accepted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        accepted = pushLocked(event);
        m_closed = true;
    }
    m_cv.notify_all();
    return accepted;
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

std::optional<domain::ProgressEvent> EventStream::next() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_queue.empty() || m_closed; });
    return popLocked();
}

std::optional<domain::ProgressEvent> EventStream::nextFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_closed; });
    return popLocked();
}

std::optional<domain::ProgressEvent> EventStream::tryNext() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return popLocked();
}

bool EventStream::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

bool EventStream::isExhausted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed && m_queue.empty();
}

std::size_t EventStream::publishedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nextIndex;
}

} // namespace deepresearch::application
