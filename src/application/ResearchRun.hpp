/**
 * @file ResearchRun.hpp
 * @brief State machine and exclusive owner of one run's state.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/CancellationToken.hpp"
#include "application/EventStream.hpp"
#include "application/TraceContext.hpp"
#include "domain/RunState.hpp"

namespace deepresearch::application {

/**
 * @class ResearchRun
 * @brief Guards a RunState behind one mutex and emits the events of its transitions.
 *
 * Stage artifacts enter the state only through commit(), which refuses once the run
 * is terminal; a stage that was still working when the run failed or was cancelled
 * therefore leaves no trace. Settled search outcomes are the exception: they are
 * recorded one by one and survive a cancellation. Terminal transitions close the
 * event stream.
 */
class ResearchRun {
public:
    ResearchRun(std::string runId, domain::RawQuery query, bool deliveryRequested, TraceContext trace);

    ResearchRun(const ResearchRun&) = delete;
    ResearchRun& operator=(const ResearchRun&) = delete;

    const std::string& id() const { return m_id; }
    const TraceContext& trace() const { return m_trace; }
    const std::shared_ptr<EventStream>& events() const { return m_events; }
    const CancellationToken& cancellation() const { return m_cancellation; }

    /** @brief Copy of the current state. */
    domain::RunState snapshot() const;
    domain::RunStage stage() const;
    bool isTerminal() const;

    /** @brief Publishes an informational event tagged with the current stage. */
    void announce(domain::EventKind kind, const std::string& message, const std::string& detail = {});

    /** @brief Publishes the StageStarted event of a step. */
    void startStep(domain::PipelineStep step, const std::string& message);

    /**
     * @brief Applies a stage's artifacts and advances to target.
     * @return False (and nothing applied) when the run is already terminal.
     */
    bool commit(domain::RunStage target,
                const std::function<void(domain::RunState&)>& apply,
                const std::string& message);

    /** @brief Commits QuestionsReady and emits NeedAnswers; the run then waits for supplyAnswers. */
    bool awaitAnswers(const std::vector<domain::ClarifyingQuestion>& questions);

    /**
     * @brief Validates answers and commits the EnrichedQuery, in the caller's thread.
     * @throws domain::InvalidTransition when the run is not awaiting answers.
     * @throws domain::AnswerMismatch when ids do not match the pending questions.
     */
    void acceptAnswers(const std::vector<domain::Answer>& answers);

    /**
     * @brief Appends one settled search outcome while the run is searching.
     *
     * Also accepted once the run was cancelled from Planned, so outcomes that
     * completed before the cancellation are kept.
     */
    void recordOutcome(const domain::SearchOutcome& outcome);

    /** @brief Records a non-fatal problem and emits a Warning event. */
    void warn(const std::string& message);

    /** @brief Terminal: Failed(step) with the cause. */
    bool fail(domain::PipelineStep step, const std::string& cause);

    /** @brief Terminal: Done. The event carries the report markdown. */
    bool finish();

    /** @brief Terminal: Cancelled. Fires the cancellation token for in-flight work. */
    bool cancel();

private:
    /** @brief Switches to a terminal stage and hands the run span to the caller to end unlocked. */
    bool terminateLocked(domain::RunStage stage, TraceSpan& runSpan);
    void closeWith(TraceSpan runSpan, domain::ProgressEvent event);

    const std::string m_id;
    const TraceContext m_trace;
    std::shared_ptr<EventStream> m_events;
    CancellationToken m_cancellation;
    TraceSpan m_runSpan;

    mutable std::mutex m_mutex;
    domain::RunState m_state;
};

} // namespace deepresearch::application
