/**
 * @file ResearchRun.cpp
 * @brief Implementation of ResearchRun.
 */

#include "application/ResearchRun.hpp"
#include "application/Clarification.hpp"
#include "domain/ResearchErrors.hpp"
#include <iostream>

namespace deepresearch::application {

using domain::EventKind;
using domain::EventLevel;
using domain::ProgressEvent;
using domain::RunStage;

ResearchRun::ResearchRun(std::string runId, domain::RawQuery query, bool deliveryRequested, TraceContext trace)
    : m_id(std::move(runId)),
      m_trace(std::move(trace)),
      m_events(std::make_shared<EventStream>()) {
    m_runSpan = m_trace.span("research_run");
    m_state.runId = m_id;
    m_state.traceId = m_trace.traceId();
    m_state.rawQuery = std::move(query);
    m_state.deliveryRequested = deliveryRequested;
}

domain::RunState ResearchRun::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

RunStage ResearchRun::stage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.stage;
}

bool ResearchRun::isTerminal() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.isTerminal();
}

void ResearchRun::announce(EventKind kind, const std::string& message, const std::string& detail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.isTerminal()) return;
    auto event = ProgressEvent::Make(m_state.stage, kind, EventLevel::Info, message);
    event.detail = detail;
    m_events->publish(std::move(event));
}

void ResearchRun::startStep(domain::PipelineStep step, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.isTerminal()) return;
    auto event = ProgressEvent::Make(m_state.stage, EventKind::StageStarted, EventLevel::Info, message);
    event.detail = domain::StepToString(step);
    m_events->publish(std::move(event));
}

bool ResearchRun::commit(RunStage target,
                         const std::function<void(domain::RunState&)>& apply,
                         const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!domain::CanAdvance(m_state.stage, target)) {
        if (!m_state.isTerminal()) {
            std::cerr << "[ResearchRun] " << m_id << ": refused transition "
                      << domain::StageToString(m_state.stage) << " -> " << domain::StageToString(target) << std::endl;
        }
        return false;
    }
    if (apply) apply(m_state);
    m_state.stage = target;
    m_events->publish(ProgressEvent::Make(target, EventKind::StageCompleted, EventLevel::Info, message));
    return true;
}

bool ResearchRun::awaitAnswers(const std::vector<domain::ClarifyingQuestion>& questions) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!domain::CanAdvance(m_state.stage, RunStage::QuestionsReady)) return false;

    m_state.questions = questions;
    m_state.stage = RunStage::QuestionsReady;
    m_events->publish(ProgressEvent::Make(RunStage::QuestionsReady, EventKind::StageCompleted, EventLevel::Info,
                                          std::to_string(questions.size()) + " clarifying questions ready"));

    auto event = ProgressEvent::Make(RunStage::QuestionsReady, EventKind::NeedAnswers, EventLevel::Info,
                                     "Please answer the clarifying questions");
    event.questions = questions;
    m_events->publish(std::move(event));
    return true;
}

void ResearchRun::acceptAnswers(const std::vector<domain::Answer>& answers) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.stage != RunStage::QuestionsReady) {
        throw domain::InvalidTransition("Run " + m_id + " is in stage " + domain::StageToString(m_state.stage) +
                                        " and is not awaiting answers.");
    }
    MatchAnswers(m_state.questions, answers);

    auto started = ProgressEvent::Make(m_state.stage, EventKind::StageStarted, EventLevel::Info,
                                       "Composing query with " + std::to_string(answers.size()) + " answers...");
    started.detail = domain::StepToString(domain::PipelineStep::Enrich);
    m_events->publish(std::move(started));

    // optimizedQuery is always set once QuestionsReady was reached.
    auto enriched = ComposeEnrichedQuery(*m_state.optimizedQuery, m_state.questions, answers);
    m_state.answers = answers;
    m_state.enrichedQuery = std::move(enriched);
    m_state.stage = RunStage::Enriched;
    m_events->publish(ProgressEvent::Make(RunStage::Enriched, EventKind::StageCompleted, EventLevel::Info,
                                          "Answers received; query enriched"));
}

void ResearchRun::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.isTerminal()) return;
    m_state.warnings.push_back(message);
    m_events->publish(ProgressEvent::Make(m_state.stage, EventKind::Warning, EventLevel::Warning, message));
    std::cout << "[ResearchRun] " << m_id << " warning: " << message << std::endl;
}

void ResearchRun::recordOutcome(const domain::SearchOutcome& outcome) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.stage != RunStage::Planned && m_state.stage != RunStage::Cancelled) return;
    m_state.results.push_back(outcome);
}

bool ResearchRun::terminateLocked(RunStage stage, TraceSpan& runSpan) {
    if (!domain::CanAdvance(m_state.stage, stage)) return false;
    m_state.stage = stage;
    runSpan = std::move(m_runSpan);
    return true;
}

// Runs without the state mutex; the stage is already terminal, so no other
// transition can publish in between.
void ResearchRun::closeWith(TraceSpan runSpan, ProgressEvent event) {
    runSpan.end();
    m_events->publishAndClose(std::move(event));
}

bool ResearchRun::fail(domain::PipelineStep step, const std::string& cause) {
    TraceSpan runSpan;
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.isTerminal()) return false;

        m_state.failedStep = step;
        m_state.error = cause;
        event = ProgressEvent::Make(RunStage::Failed, EventKind::Failed, EventLevel::Error,
                                    "Stage '" + domain::StepToString(step) + "' failed: " + cause);
        event.detail = cause;
        if (!terminateLocked(RunStage::Failed, runSpan)) return false;
    }
    std::cerr << "[ResearchRun] " << m_id << ": " << event.message << std::endl;
    closeWith(std::move(runSpan), std::move(event));
    return true;
}

bool ResearchRun::finish() {
    TraceSpan runSpan;
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string message = m_state.warnings.empty()
            ? "Research complete"
            : "Research complete with " + std::to_string(m_state.warnings.size()) + " warning(s)";
        event = ProgressEvent::Make(RunStage::Done, EventKind::Done, EventLevel::Info, message);
        if (m_state.report) event.detail = m_state.report->markdown;
        if (!terminateLocked(RunStage::Done, runSpan)) return false;
    }
    closeWith(std::move(runSpan), std::move(event));
    return true;
}

bool ResearchRun::cancel() {
    TraceSpan runSpan;
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.isTerminal()) return false;
        event = ProgressEvent::Make(RunStage::Cancelled, EventKind::Cancelled, EventLevel::Warning,
                                    "Run cancelled during " + domain::StageToString(m_state.stage));
        if (!terminateLocked(RunStage::Cancelled, runSpan)) return false;
    }
    closeWith(std::move(runSpan), std::move(event));
    m_cancellation.cancel();
    return true;
}

} // namespace deepresearch::application
