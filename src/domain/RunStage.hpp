/**
 * @file RunStage.hpp
 * @brief Lifecycle stages of a research run and the pipeline steps that move between them.
 */

#pragma once

#include <string>

namespace deepresearch::domain {

/**
 * @enum RunStage
 * @brief Where a run currently is. Stages only move forward.
 */
enum class RunStage {
    Start,          ///< Run created, nothing produced yet.
    Optimized,      ///< OptimizedQuery available.
    QuestionsReady, ///< Clarifying questions produced; waiting for answers.
    Enriched,       ///< Answers folded into the EnrichedQuery.
    Planned,        ///< Search plan available.
    Searched,       ///< All search tasks settled.
    Written,        ///< Report available.
    Delivered,      ///< Report handed to the notifier.
    Done,           ///< Finished successfully.
    Failed,         ///< A required stage failed.
    Cancelled       ///< Cancelled by the caller.
};

/**
 * @enum PipelineStep
 * @brief The work that produces a stage; used to name where a run failed.
 */
enum class PipelineStep {
    Optimize,
    Clarify,
    Enrich,
    Plan,
    Search,
    Write,
    Deliver
};

inline std::string StageToString(RunStage stage) {
    switch (stage) {
        case RunStage::Start: return "Start";
        case RunStage::Optimized: return "Optimized";
        case RunStage::QuestionsReady: return "QuestionsReady";
        case RunStage::Enriched: return "Enriched";
        case RunStage::Planned: return "Planned";
        case RunStage::Searched: return "Searched";
        case RunStage::Written: return "Written";
        case RunStage::Delivered: return "Delivered";
        case RunStage::Done: return "Done";
        case RunStage::Failed: return "Failed";
        case RunStage::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

inline std::string StepToString(PipelineStep step) {
    switch (step) {
        case PipelineStep::Optimize: return "optimize";
        case PipelineStep::Clarify: return "clarify";
        case PipelineStep::Enrich: return "enrich";
        case PipelineStep::Plan: return "plan";
        case PipelineStep::Search: return "search";
        case PipelineStep::Write: return "write";
        case PipelineStep::Deliver: return "deliver";
        default: return "unknown";
    }
}

/**
 * @brief Returns the next stage in the canonical sequence.
 */
inline RunStage NextStage(RunStage stage) {
    switch (stage) {
        case RunStage::Start: return RunStage::Optimized;
        case RunStage::Optimized: return RunStage::QuestionsReady;
        case RunStage::QuestionsReady: return RunStage::Enriched;
        case RunStage::Enriched: return RunStage::Planned;
        case RunStage::Planned: return RunStage::Searched;
        case RunStage::Searched: return RunStage::Written;
        case RunStage::Written: return RunStage::Delivered;
        case RunStage::Delivered: return RunStage::Done;
        default: return stage;
    }
}

inline bool IsTerminal(RunStage stage) {
    return stage == RunStage::Done || stage == RunStage::Failed || stage == RunStage::Cancelled;
}

/**
 * @brief Checks if a run may move from current to target.
 *
 * Written may skip Delivered when delivery was not requested or did not happen.
 * Failed and Cancelled are reachable from every non-terminal stage.
 */
inline bool CanAdvance(RunStage current, RunStage target) {
    if (IsTerminal(current)) return false;
    if (target == RunStage::Failed || target == RunStage::Cancelled) return true;
    if (current == RunStage::Written && target == RunStage::Done) return true;
    return target == NextStage(current);
}

} // namespace deepresearch::domain
