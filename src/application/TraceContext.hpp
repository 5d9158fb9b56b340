/**
 * @file TraceContext.hpp
 * @brief Explicit trace handle passed through every call of a run.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/TraceSink.hpp"

namespace deepresearch::application {

/**
 * @class TraceSpan
 * @brief Open span; ends when destroyed or when end() is called.
 */
class TraceSpan {
public:
    TraceSpan() = default;
    TraceSpan(std::shared_ptr<domain::TraceSink> sink, domain::SpanHandle handle);
    ~TraceSpan();

    TraceSpan(TraceSpan&& other) noexcept;
    TraceSpan& operator=(TraceSpan&& other) noexcept;
    TraceSpan(const TraceSpan&) = delete;
    TraceSpan& operator=(const TraceSpan&) = delete;

    void end();

private:
    std::shared_ptr<domain::TraceSink> m_sink;
    domain::SpanHandle m_handle = 0;
};

/**
 * @class TraceContext
 * @brief Trace id of a run plus the sink spans go to. Cheap to copy.
 *
 * A context without a sink hands out no-op spans.
 */
class TraceContext {
public:
    TraceContext() = default;
    TraceContext(std::shared_ptr<domain::TraceSink> sink, std::string traceId);

    /** @brief Generates an id of the form "trace_" + 32 hex digits. */
    static std::string GenerateTraceId();

    const std::string& traceId() const { return m_traceId; }

    TraceSpan span(const std::string& name) const;

private:
    std::shared_ptr<domain::TraceSink> m_sink;
    std::string m_traceId;
};

} // namespace deepresearch::application
