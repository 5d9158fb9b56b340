/**
 * @file ConsoleTraceSink.hpp
 * @brief TraceSink that writes span boundaries and durations to a stream.
 */

#pragma once
#include "domain/TraceSink.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

namespace deepresearch::infrastructure {

class ConsoleTraceSink : public domain::TraceSink {
public:
    explicit ConsoleTraceSink(std::ostream& out = std::cout) : m_out(out) {}

    domain::SpanHandle startSpan(const std::string& traceId, const std::string& name) override;

    /** @brief Unknown or already ended handles are ignored. */
    void endSpan(domain::SpanHandle handle) override;

    std::size_t openSpans() const;

private:
    struct OpenSpan {
        std::string traceId;
        std::string name;
        std::chrono::steady_clock::time_point start;
    };

    std::ostream& m_out;
    std::atomic<domain::SpanHandle> m_nextHandle{1};
    mutable std::mutex m_mutex;
    std::map<domain::SpanHandle, OpenSpan> m_open;
};

} // namespace deepresearch::infrastructure
