/**
 * @file SearchFanOutCoordinator.cpp
 * @brief Implementation of SearchFanOutCoordinator.
 */

#include "application/SearchFanOutCoordinator.hpp"
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace deepresearch::application {

namespace {

/**
 * @struct FanOutState
 * @brief Shared between the waiting caller and the tasks; outlives abandoned tasks.
 */
struct FanOutState {
    std::mutex mutex;
    std::condition_variable settled;
    domain::SearchResultSet results;
    std::size_t total = 0;
    std::size_t pending = 0;
    bool abandoned = false;
};

domain::SearchOutcome RunSearch(const domain::SearchPlanItem& item,
                                domain::SearchProvider& search,
                                const CompletionGateway& gateway,
                                const CancellationToken& cancellation,
                                const TraceContext& trace) {
    auto span = trace.span("search:" + item.term);
    try {
        std::string raw = search.search(item.term);
        if (cancellation.isCancelled()) {
            return domain::SearchOutcome::Failure(item, "cancelled");
        }
        std::string summary = gateway.summarizeSearch(item, raw, trace);
        return domain::SearchOutcome::Success(item, std::move(summary));
    } catch (const std::exception& e) {
        return domain::SearchOutcome::Failure(item, e.what());
    } catch (...) {
        return domain::SearchOutcome::Failure(item, "unknown error");
    }
}

} // namespace

SearchFanOutCoordinator::SearchFanOutCoordinator(std::shared_ptr<domain::SearchProvider> search,
                                                 std::shared_ptr<CompletionGateway> gateway,
                                                 std::shared_ptr<AsyncTaskManager> taskManager)
    : m_search(std::move(search)), m_gateway(std::move(gateway)), m_taskManager(std::move(taskManager)) {
    if (!m_search || !m_gateway || !m_taskManager) {
        throw std::invalid_argument("SearchFanOutCoordinator requires search, gateway and task manager.");
    }
}

domain::SearchResultSet SearchFanOutCoordinator::executeAll(const std::vector<domain::SearchPlanItem>& plan,
                                                            const std::shared_ptr<EventStream>& events,
                                                            const CancellationToken& cancellation,
                                                            const TraceContext& trace,
                                                            OutcomeListener onSettled) const {
    auto state = std::make_shared<FanOutState>();
    state->total = plan.size();
    state->pending = plan.size();
    state->results.reserve(plan.size());
    if (plan.empty() || cancellation.isCancelled()) return {};

    CancellationRegistration wakeOnCancel(cancellation, [state]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->abandoned = true;
        }
        state->settled.notify_all();
    });

    for (const auto& item : plan) {
        m_taskManager->SubmitTask(TaskType::Search, "Searching: " + item.term,
            [state, item, events, cancellation, trace, onSettled, search = m_search, gateway = m_gateway](std::shared_ptr<TaskStatus> status) {
                domain::SearchOutcome outcome = RunSearch(item, *search, *gateway, cancellation, trace);
                if (!outcome.succeeded) {
                    status->failed = true;
                    status->errorMessage = outcome.error;
                }

                bool last = false;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->abandoned) return;

                    state->results.push_back(outcome);
                    if (onSettled) onSettled(outcome);
                    --state->pending;
                    last = (state->pending == 0);

                    std::string progress = " (" + std::to_string(state->results.size()) + "/" +
                                           std::to_string(state->total) + " completed)";
                    auto event = outcome.succeeded
                        ? domain::ProgressEvent::Make(domain::RunStage::Planned, domain::EventKind::SearchSettled,
                                                      domain::EventLevel::Info,
                                                      "Search '" + item.term + "' succeeded" + progress)
                        : domain::ProgressEvent::Make(domain::RunStage::Planned, domain::EventKind::SearchSettled,
                                                      domain::EventLevel::Warning,
                                                      "Search '" + item.term + "' failed: " + outcome.error + progress);
                    // Published under the fan-out lock so event order matches result order.
                    if (events) events->publish(std::move(event));
                }
                if (last) state->settled.notify_all();
            });
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->settled.wait(lock, [&state] { return state->pending == 0 || state->abandoned; });
    if (state->pending != 0) {
        std::cout << "[SearchFanOut] Cancelled with " << state->pending << " of " << state->total
                  << " searches in flight." << std::endl;
    }
    state->abandoned = true;
    return state->results;
}

} // namespace deepresearch::application
