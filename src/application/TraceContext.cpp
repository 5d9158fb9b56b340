/**
 * @file TraceContext.cpp
 * @brief Implementation of TraceContext and TraceSpan.
 */

#include "application/TraceContext.hpp"
#include <iostream>
#include <random>

namespace deepresearch::application {

TraceSpan::TraceSpan(std::shared_ptr<domain::TraceSink> sink, domain::SpanHandle handle)
    : m_sink(std::move(sink)), m_handle(handle) {}

TraceSpan::~TraceSpan() {
    end();
}

TraceSpan::TraceSpan(TraceSpan&& other) noexcept
    : m_sink(std::move(other.m_sink)), m_handle(other.m_handle) {
    other.m_sink.reset();
}

TraceSpan& TraceSpan::operator=(TraceSpan&& other) noexcept {
    if (this != &other) {
        end();
        m_sink = std::move(other.m_sink);
        m_handle = other.m_handle;
        other.m_sink.reset();
    }
    return *this;
}

void TraceSpan::end() {
    if (!m_sink) return;
    auto sink = std::move(m_sink);
    m_sink.reset();
    try {
        sink->endSpan(m_handle);
    } catch (const std::exception& e) {
        std::cerr << "[TraceContext] Failed to end span: " << e.what() << std::endl;
    }
}

TraceContext::TraceContext(std::shared_ptr<domain::TraceSink> sink, std::string traceId)
    : m_sink(std::move(sink)), m_traceId(std::move(traceId)) {}

std::string TraceContext::GenerateTraceId() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string id = "trace_";
    id.reserve(id.size() + 32);
    for (int i = 0; i < 32; ++i) {
        id += hex[digit(engine)];
    }
    return id;
}

TraceSpan TraceContext::span(const std::string& name) const {
    if (!m_sink) return TraceSpan();
    try {
        return TraceSpan(m_sink, m_sink->startSpan(m_traceId, name));
    } catch (const std::exception& e) {
        std::cerr << "[TraceContext] Failed to start span '" << name << "': " << e.what() << std::endl;
        return TraceSpan();
    }
}

} // namespace deepresearch::application
