/**
 * @file RunState.hpp
 * @brief Everything a run has produced so far, as seen by external inspection.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ResearchTypes.hpp"
#include "RunStage.hpp"

namespace deepresearch::domain {

/**
 * @struct RunState
 * @brief Accumulated artifacts of one run. Snapshots handed to callers are copies.
 */
struct RunState {
    std::string runId;
    std::string traceId;
    RunStage stage = RunStage::Start;
    bool deliveryRequested = false;

    RawQuery rawQuery;
    std::optional<OptimizedQuery> optimizedQuery;
    std::vector<ClarifyingQuestion> questions;
    std::vector<Answer> answers;
    std::optional<EnrichedQuery> enrichedQuery;
    std::vector<SearchPlanItem> plan;
    SearchResultSet results;
    std::optional<Report> report;

    std::optional<PipelineStep> failedStep;
    std::string error;
    std::vector<std::string> warnings;

    bool isTerminal() const { return IsTerminal(stage); }
};

} // namespace deepresearch::domain
