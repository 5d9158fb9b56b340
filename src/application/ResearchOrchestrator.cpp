/**
 * @file ResearchOrchestrator.cpp
 * @brief Implementation of ResearchOrchestrator and the two background phases of a run.
 */

#include "application/ResearchOrchestrator.hpp"
#include "application/CompletionGateway.hpp"
#include "application/SearchFanOutCoordinator.hpp"
#include "domain/ResearchErrors.hpp"
#include <cctype>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace deepresearch::application {

using domain::EventKind;
using domain::PipelineStep;
using domain::RunStage;
using domain::RunState;

/**
 * @struct PipelineServices
 * @brief Stateless services shared by the background phases; kept alive by the tasks.
 */
struct PipelineServices {
    std::shared_ptr<CompletionGateway> gateway;
    std::shared_ptr<SearchFanOutCoordinator> coordinator;
    std::shared_ptr<domain::Notifier> notifier;
    PipelineConfig config;
};

namespace {

bool IsBlank(const std::string& text) {
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) return false;
    }
    return true;
}

/**
 * Runs the external work of a required step. Any exception fails the run at that step.
 */
template <typename F>
auto Attempt(ResearchRun& run, PipelineStep step, const std::string& message, F&& work)
    -> std::optional<decltype(work())> {
    if (run.isTerminal()) return std::nullopt;
    run.startStep(step, message);
    try {
        return work();
    } catch (const std::exception& e) {
        run.fail(step, e.what());
    } catch (...) {
        run.fail(step, "unknown error");
    }
    return std::nullopt;
}

// Start -> Optimized -> QuestionsReady, then suspend.
void RunOpeningPhase(const PipelineServices& services, const std::shared_ptr<ResearchRun>& run) {
    const TraceContext& trace = run->trace();
    const domain::RawQuery rawQuery = run->snapshot().rawQuery;

    auto optimized = Attempt(*run, PipelineStep::Optimize, "Optimizing query...", [&] {
        return services.gateway->optimizeQuery(rawQuery, trace);
    });
    if (!optimized) return;
    if (!run->commit(RunStage::Optimized,
                     [&](RunState& s) { s.optimizedQuery = *optimized; },
                     "Query optimized: " + optimized->text)) {
        return;
    }

    const std::size_t expected = services.config.questionCount;
    auto questions = Attempt(*run, PipelineStep::Clarify, "Generating clarifying questions...", [&] {
        auto generated = services.gateway->generateQuestions(*optimized, expected, trace);
        if (generated.size() < expected) {
            throw domain::ProviderError("expected " + std::to_string(expected) + " questions, got " +
                                        std::to_string(generated.size()));
        }
        return generated;
    });
    if (!questions) return;
    run->awaitAnswers(*questions);
}

// Enriched -> Planned -> Searched -> Written -> [Delivered] -> Done.
void RunClosingPhase(const PipelineServices& services, const std::shared_ptr<ResearchRun>& run) {
    const TraceContext& trace = run->trace();
    const RunState state = run->snapshot();
    if (!state.enrichedQuery || !state.optimizedQuery) return;
    const domain::EnrichedQuery enriched = *state.enrichedQuery;

    auto plan = Attempt(*run, PipelineStep::Plan, "Planning searches...", [&] {
        auto items = services.gateway->planSearches(enriched, services.config.planSize, trace);
        if (items.empty()) {
            throw domain::ProviderError("search plan is empty");
        }
        return items;
    });
    if (!plan) return;
    if (!run->commit(RunStage::Planned,
                     [&](RunState& s) { s.plan = *plan; },
                     "Searches planned: " + std::to_string(plan->size()) + " searches")) {
        return;
    }
    if (plan->size() < services.config.planSize) {
        run->warn("Planner returned " + std::to_string(plan->size()) + " of " +
                  std::to_string(services.config.planSize) + " searches");
    }

    // Outcomes land in the run state as they settle, so a cancellation keeps them.
    auto results = Attempt(*run, PipelineStep::Search, "Searching...", [&] {
        return services.coordinator->executeAll(*plan, run->events(), run->cancellation(), trace,
                                                [run](const domain::SearchOutcome& outcome) {
                                                    run->recordOutcome(outcome);
                                                });
    });
    if (!results || run->isTerminal()) return;

    const std::size_t succeeded = domain::CountSucceeded(*results);
    if (!run->commit(RunStage::Searched,
                     nullptr,
                     "Searches complete: " + std::to_string(succeeded) + " of " +
                         std::to_string(results->size()) + " succeeded")) {
        return;
    }
    if (succeeded == 0) {
        run->warn("All " + std::to_string(results->size()) +
                  " searches failed; the report is written from an empty result set");
    }

    auto report = Attempt(*run, PipelineStep::Write, "Writing report...", [&] {
        return services.gateway->writeReport(enriched, *results, trace);
    });
    if (!report) return;
    if (!run->commit(RunStage::Written,
                     [&](RunState& s) { s.report = *report; },
                     "Report written: " + report->shortSummary)) {
        return;
    }

    if (state.deliveryRequested) {
        if (!services.notifier) {
            run->warn("Delivery requested but no notifier is configured");
        } else {
            run->startStep(PipelineStep::Deliver, "Sending report...");
            try {
                auto span = trace.span("deliver");
                services.notifier->deliver("Research report: " + state.optimizedQuery->text, report->markdown);
                run->commit(RunStage::Delivered, nullptr, "Report delivered");
            } catch (const std::exception& e) {
                run->warn(std::string("Delivery failed: ") + e.what());
            } catch (...) {
                run->warn("Delivery failed: unknown error");
            }
        }
    }

    run->finish();
}

} // namespace

ResearchOrchestrator::ResearchOrchestrator(ResearchCollaborators collaborators, PipelineConfig config)
    : m_config(config),
      m_traceSink(std::move(collaborators.traceSink)),
      m_taskManager(std::make_shared<AsyncTaskManager>()) {
    if (!collaborators.completion || !collaborators.search) {
        throw std::invalid_argument("ResearchOrchestrator requires a completion and a search provider.");
    }
    if (m_config.questionCount == 0 || m_config.planSize == 0) {
        throw std::invalid_argument("Question count and plan size must be positive.");
    }

    auto services = std::make_shared<PipelineServices>();
    services->gateway = std::make_shared<CompletionGateway>(std::move(collaborators.completion));
    services->coordinator = std::make_shared<SearchFanOutCoordinator>(std::move(collaborators.search),
                                                                      services->gateway, m_taskManager);
    services->notifier = std::move(collaborators.notifier);
    services->config = m_config;
    m_services = std::move(services);
}

ResearchOrchestrator::~ResearchOrchestrator() {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    for (auto& entry : m_runs) {
        entry.second->cancel();
    }
}

RunHandle ResearchOrchestrator::start(const std::string& rawQuery, RunOptions options) {
    if (IsBlank(rawQuery)) {
        throw std::invalid_argument("Research query must not be empty.");
    }

    std::string runId = "run-" + std::to_string(++m_runCounter);
    TraceContext trace(m_traceSink, TraceContext::GenerateTraceId());
    auto run = std::make_shared<ResearchRun>(runId, domain::RawQuery{rawQuery}, options.deliver, trace);
    {
        std::lock_guard<std::mutex> lock(m_runsMutex);
        m_runs[runId] = run;
    }

    std::cout << "[ResearchOrchestrator] Starting " << runId << " (" << trace.traceId() << ")" << std::endl;
    run->announce(EventKind::Trace, "View trace: " + trace.traceId(), trace.traceId());

    auto services = m_services;
    try {
        m_taskManager->SubmitTask(TaskType::Pipeline, runId + ": optimize and clarify",
            [services, run](std::shared_ptr<TaskStatus>) {
                RunOpeningPhase(*services, run);
            });
    } catch (const std::system_error& e) {
        run->fail(PipelineStep::Optimize, std::string("could not launch background task: ") + e.what());
        throw;
    }

    return RunHandle{runId, trace.traceId(), run->events()};
}

void ResearchOrchestrator::supplyAnswers(const std::string& runId, const std::vector<domain::Answer>& answers) {
    auto run = findRun(runId);
    run->acceptAnswers(answers);

    std::cout << "[ResearchOrchestrator] " << runId << " resumed with " << answers.size() << " answers" << std::endl;
    auto services = m_services;
    try {
        m_taskManager->SubmitTask(TaskType::Pipeline, runId + ": plan, search and write",
            [services, run](std::shared_ptr<TaskStatus>) {
                RunClosingPhase(*services, run);
            });
    } catch (const std::system_error& e) {
        run->fail(PipelineStep::Plan, std::string("could not launch background task: ") + e.what());
        throw;
    }
}

bool ResearchOrchestrator::cancel(const std::string& runId) {
    auto run = findRun(runId);
    bool cancelled = run->cancel();
    if (cancelled) {
        std::cout << "[ResearchOrchestrator] " << runId << " cancelled" << std::endl;
    }
    return cancelled;
}

RunState ResearchOrchestrator::currentState(const std::string& runId) const {
    return findRun(runId)->snapshot();
}

std::vector<std::string> ResearchOrchestrator::activeRuns() const {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    std::vector<std::string> ids;
    for (const auto& entry : m_runs) {
        if (!entry.second->isTerminal()) ids.push_back(entry.first);
    }
    return ids;
}

bool ResearchOrchestrator::forget(const std::string& runId) {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    auto it = m_runs.find(runId);
    if (it == m_runs.end() || !it->second->isTerminal()) return false;
    m_runs.erase(it);
    return true;
}

std::shared_ptr<ResearchRun> ResearchOrchestrator::findRun(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    auto it = m_runs.find(runId);
    if (it == m_runs.end()) {
        throw std::out_of_range("Unknown research run: " + runId);
    }
    return it->second;
}

} // namespace deepresearch::application
