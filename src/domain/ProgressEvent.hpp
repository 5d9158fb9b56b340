/**
 * @file ProgressEvent.hpp
 * @brief Observable status updates emitted while a run advances.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "RunStage.hpp"
#include "ResearchTypes.hpp"

namespace deepresearch::domain {

/**
 * @enum EventKind
 * @brief What happened.
 */
enum class EventKind {
    Trace,          ///< Run correlation id is available.
    StageStarted,   ///< A step began working towards the next stage.
    StageCompleted, ///< A stage was committed to the run state.
    SearchSettled,  ///< One search task finished (success or failure).
    NeedAnswers,    ///< The run is suspended until answers are supplied.
    Warning,        ///< Non-fatal problem; the run continues.
    Done,           ///< Terminal: finished with a report.
    Failed,         ///< Terminal: a required stage failed.
    Cancelled       ///< Terminal: cancelled by the caller.
};

enum class EventLevel {
    Info,
    Warning,
    Error
};

inline std::string EventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::Trace: return "Trace";
        case EventKind::StageStarted: return "StageStarted";
        case EventKind::StageCompleted: return "StageCompleted";
        case EventKind::SearchSettled: return "SearchSettled";
        case EventKind::NeedAnswers: return "NeedAnswers";
        case EventKind::Warning: return "Warning";
        case EventKind::Done: return "Done";
        case EventKind::Failed: return "Failed";
        case EventKind::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

inline bool IsTerminalEvent(EventKind kind) {
    return kind == EventKind::Done || kind == EventKind::Failed || kind == EventKind::Cancelled;
}

/**
 * @struct ProgressEvent
 * @brief One entry of a run's event stream. The index is assigned by the stream.
 */
struct ProgressEvent {
    std::size_t index = 0;
    RunStage stage = RunStage::Start;
    EventKind kind = EventKind::StageStarted;
    EventLevel level = EventLevel::Info;
    std::string message;
    std::string detail;                        ///< Trace id, report markdown, failure cause.
    std::vector<ClarifyingQuestion> questions; ///< Only set on NeedAnswers.
    std::chrono::system_clock::time_point timestamp;

    static ProgressEvent Make(RunStage stage, EventKind kind, EventLevel level, std::string message) {
        ProgressEvent event;
        event.stage = stage;
        event.kind = kind;
        event.level = level;
        event.message = std::move(message);
        return event;
    }
};

} // namespace deepresearch::domain
