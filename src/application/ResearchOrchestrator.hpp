/**
 * @file ResearchOrchestrator.hpp
 * @brief Public surface of the research pipeline: start, resume, cancel and inspect runs.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/EventStream.hpp"
#include "application/ResearchRun.hpp"
#include "domain/CompletionProvider.hpp"
#include "domain/Notifier.hpp"
#include "domain/RunState.hpp"
#include "domain/SearchProvider.hpp"
#include "domain/TraceSink.hpp"

namespace deepresearch::application {

/**
 * @struct PipelineConfig
 * @brief Fixed sizes of a run.
 */
struct PipelineConfig {
    std::size_t questionCount = 3; ///< N clarifying questions per run.
    std::size_t planSize = 5;      ///< M planned searches per run.
};

/**
 * @struct ResearchCollaborators
 * @brief External systems the pipeline talks to. Notifier and trace sink are optional.
 */
struct ResearchCollaborators {
    std::shared_ptr<domain::CompletionProvider> completion;
    std::shared_ptr<domain::SearchProvider> search;
    std::shared_ptr<domain::Notifier> notifier;
    std::shared_ptr<domain::TraceSink> traceSink;
};

struct RunOptions {
    bool deliver = false; ///< Hand the report to the notifier once written.
};

/**
 * @struct RunHandle
 * @brief What start() gives back: the run id and its event stream.
 */
struct RunHandle {
    std::string runId;
    std::string traceId;
    std::shared_ptr<EventStream> events;
};

struct PipelineServices;

/**
 * @class ResearchOrchestrator
 * @brief Drives runs through optimize, clarify, enrich, plan, search, write and deliver.
 *
 * Work runs on background tasks. A run suspends after producing its questions without
 * holding any thread; supplyAnswers() resumes it. Runs are independent of each other.
 */
class ResearchOrchestrator {
public:
    explicit ResearchOrchestrator(ResearchCollaborators collaborators, PipelineConfig config = {});

    /** @brief Cancels every run that has not finished yet. */
    ~ResearchOrchestrator();

    ResearchOrchestrator(const ResearchOrchestrator&) = delete;
    ResearchOrchestrator& operator=(const ResearchOrchestrator&) = delete;

    /**
     * @brief Begins a run in the background.
     * @throws std::invalid_argument when the query is blank.
     */
    RunHandle start(const std::string& rawQuery, RunOptions options = {});

    /**
     * @brief Resumes a run waiting for answers.
     * @throws domain::InvalidTransition when the run is not waiting for answers.
     * @throws domain::AnswerMismatch when the answers do not match the pending questions.
     * @throws std::out_of_range for an unknown run id.
     */
    void supplyAnswers(const std::string& runId, const std::vector<domain::Answer>& answers);

    /**
     * @brief Best-effort cancellation.
     * @return False when the run had already finished, failed or been cancelled.
     */
    bool cancel(const std::string& runId);

    /** @brief Read-only snapshot. @throws std::out_of_range for an unknown run id. */
    domain::RunState currentState(const std::string& runId) const;

    /** @brief Ids of runs that have not reached a terminal stage. */
    std::vector<std::string> activeRuns() const;

    /** @brief Drops the bookkeeping of a terminated run. @return False if unknown or still active. */
    bool forget(const std::string& runId);

    const PipelineConfig& config() const { return m_config; }
    std::shared_ptr<AsyncTaskManager> taskManager() const { return m_taskManager; }

private:
    std::shared_ptr<ResearchRun> findRun(const std::string& runId) const;

    PipelineConfig m_config;
    std::shared_ptr<domain::TraceSink> m_traceSink;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    std::shared_ptr<const PipelineServices> m_services;

    mutable std::mutex m_runsMutex;
    std::map<std::string, std::shared_ptr<ResearchRun>> m_runs;
    std::atomic<unsigned long> m_runCounter{0};
};

} // namespace deepresearch::application
