/**
 * @file EventStream.hpp
 * @brief Ordered, finite, non-restartable stream of progress events for one run.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "domain/ProgressEvent.hpp"

namespace deepresearch::application {

/**
 * @class EventStream
 * @brief Multi-producer, single-consumer queue of ProgressEvents.
 *
 * Producers publish from any thread; indices are assigned under the lock, so they are
 * strictly increasing and contiguous from 0. Once closed, further publications are
 * dropped and the consumer drains what is left. Consumed events are gone.
 */
class EventStream {
public:
    EventStream() = default;

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /**
     * @brief Appends an event, stamping its index and timestamp.
     * @return False if the stream is closed and the event was dropped.
     */
    bool publish(domain::ProgressEvent event);

    /**
     * @brief Publishes a final event and closes the stream in one step.
     * @return False if the stream was already closed.
     */
    bool publishAndClose(domain::ProgressEvent event);

    /** @brief Stops accepting events. The consumer still receives the queued ones. */
    void close();

    /** @brief Blocks until an event is available; nullopt once closed and drained. */
    std::optional<domain::ProgressEvent> next();

    /** @brief Like next(), but gives up after timeout (nullopt). */
    std::optional<domain::ProgressEvent> nextFor(std::chrono::milliseconds timeout);

    /** @brief Non-blocking poll. */
    std::optional<domain::ProgressEvent> tryNext();

    bool isClosed() const;

    /** @brief True when closed and every event was consumed. */
    bool isExhausted() const;

    /** @brief Number of events accepted so far. */
    std::size_t publishedCount() const;

private:
    bool pushLocked(domain::ProgressEvent& event);
    std::optional<domain::ProgressEvent> popLocked();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<domain::ProgressEvent> m_queue;
    std::size_t m_nextIndex = 0;
    bool m_closed = false;
};

} // namespace deepresearch::application
