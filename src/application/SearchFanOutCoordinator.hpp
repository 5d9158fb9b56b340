/**
 * @file SearchFanOutCoordinator.hpp
 * @brief Runs every planned search concurrently and gathers the settled outcomes.
 */

#pragma once

#include <functional>
#include <memory>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/CancellationToken.hpp"
#include "application/CompletionGateway.hpp"
#include "application/EventStream.hpp"
#include "application/TraceContext.hpp"
#include "domain/ResearchTypes.hpp"
#include "domain/SearchProvider.hpp"

namespace deepresearch::application {

/**
 * @class SearchFanOutCoordinator
 * @brief Fan-out/fan-in of the search phase.
 *
 * One task per plan item: search, then summarize. A failing task becomes a failed
 * SearchOutcome; it never aborts its siblings or the aggregate call. Outcomes are
 * collected in completion order and each settlement emits one SearchSettled event.
 */
class SearchFanOutCoordinator {
public:
    /** @brief Called once per settled outcome, in settlement order, before its event. */
    using OutcomeListener = std::function<void(const domain::SearchOutcome&)>;

    SearchFanOutCoordinator(std::shared_ptr<domain::SearchProvider> search,
                            std::shared_ptr<CompletionGateway> gateway,
                            std::shared_ptr<AsyncTaskManager> taskManager);

    /**
     * @brief Executes the whole plan and blocks until every task settled.
     *
     * Returns early when the token is cancelled; tasks still in flight are abandoned
     * and contribute neither outcome nor event. Outcomes settled before that point
     * are returned and have already been passed to onSettled.
     * @return Exactly plan.size() outcomes unless cancelled.
     */
    domain::SearchResultSet executeAll(const std::vector<domain::SearchPlanItem>& plan,
                                       const std::shared_ptr<EventStream>& events,
                                       const CancellationToken& cancellation,
                                       const TraceContext& trace,
                                       OutcomeListener onSettled = nullptr) const;

private:
    std::shared_ptr<domain::SearchProvider> m_search;
    std::shared_ptr<CompletionGateway> m_gateway;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
};

} // namespace deepresearch::application
