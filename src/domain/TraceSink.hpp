/**
 * @file TraceSink.hpp
 * @brief Interface for external observability of runs.
 */

#pragma once

#include <cstdint>
#include <string>

namespace deepresearch::domain {

using SpanHandle = std::uint64_t;

/**
 * @class TraceSink
 * @brief Records spans; all spans of one run share the run's trace id.
 */
class TraceSink {
public:
    virtual ~TraceSink() = default;

    virtual SpanHandle startSpan(const std::string& traceId, const std::string& name) = 0;
    virtual void endSpan(SpanHandle handle) = 0;
};

} // namespace deepresearch::domain
