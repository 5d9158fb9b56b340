#include "infrastructure/ConsoleTraceSink.hpp"

namespace deepresearch::infrastructure {

domain::SpanHandle ConsoleTraceSink::startSpan(const std::string& traceId, const std::string& name) {
    domain::SpanHandle handle = m_nextHandle++;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open[handle] = OpenSpan{traceId, name, std::chrono::steady_clock::now()};
    m_out << "[Trace] " << traceId << " start #" << handle << " " << name << std::endl;
    return handle;
}

void ConsoleTraceSink::endSpan(domain::SpanHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_open.find(handle);
    if (it == m_open.end()) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second.start).count();
    m_out << "[Trace] " << it->second.traceId << " end #" << handle << " " << it->second.name
          << " (" << elapsed << " ms)" << std::endl;
    m_open.erase(it);
}

std::size_t ConsoleTraceSink::openSpans() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open.size();
}

} // namespace deepresearch::infrastructure
