/**
 * @file CompletionGateway.hpp
 * @brief Typed, shape-checked access to the completion provider for every pipeline stage.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/TraceContext.hpp"
#include "domain/CompletionProvider.hpp"
#include "domain/OutputShape.hpp"
#include "domain/ResearchTypes.hpp"

namespace deepresearch::application {

/**
 * @struct PromptSpec
 * @brief Role instructions plus the task-specific content of one call.
 */
struct PromptSpec {
    std::string instructions;
    std::string context;
};

/**
 * @class CompletionGateway
 * @brief Stateless boundary to the CompletionProvider.
 *
 * Every call opens one trace span, and every result is validated against the declared
 * shape. Any failure surfaces as domain::ProviderError. No retries are performed here.
 * Safe to call concurrently.
 */
class CompletionGateway {
public:
    explicit CompletionGateway(std::shared_ptr<domain::CompletionProvider> provider);

    /**
     * @brief Runs one completion and checks the result against the shape.
     * @throws domain::ProviderError on provider failure or malformed output.
     */
    nlohmann::json complete(const PromptSpec& prompt,
                            const domain::OutputShape& shape,
                            const TraceContext& trace) const;

    domain::OptimizedQuery optimizeQuery(const domain::RawQuery& query, const TraceContext& trace) const;

    /** @brief Returns at most count questions with ids q1..qn; blank questions are dropped. */
    std::vector<domain::ClarifyingQuestion> generateQuestions(const domain::OptimizedQuery& query,
                                                              std::size_t count,
                                                              const TraceContext& trace) const;

    /** @brief Returns at most count plan items; items with a blank term are dropped. */
    std::vector<domain::SearchPlanItem> planSearches(const domain::EnrichedQuery& query,
                                                     std::size_t count,
                                                     const TraceContext& trace) const;

    std::string summarizeSearch(const domain::SearchPlanItem& item,
                                const std::string& rawResults,
                                const TraceContext& trace) const;

    /** @brief Writes the report from the successful outcomes only. */
    domain::Report writeReport(const domain::EnrichedQuery& query,
                               const domain::SearchResultSet& results,
                               const TraceContext& trace) const;

    // Shapes used by the typed operations; also used by providers and test doubles to dispatch.
    static const domain::OutputShape& OptimizedQueryShape();
    static const domain::OutputShape& QuestionsShape();
    static const domain::OutputShape& SearchPlanShape();
    static const domain::OutputShape& SearchSummaryShape();
    static const domain::OutputShape& ReportShape();

private:
    std::shared_ptr<domain::CompletionProvider> m_provider;
};

} // namespace deepresearch::application
