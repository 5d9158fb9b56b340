/**
 * @file ResearchTypes.hpp
 * @brief Value objects exchanged between the stages of a research run.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace deepresearch::domain {

/**
 * @struct RawQuery
 * @brief The topic exactly as the user typed it.
 */
struct RawQuery {
    std::string text;
};

/**
 * @struct OptimizedQuery
 * @brief The topic after the optimization stage rewrote it for searching.
 */
struct OptimizedQuery {
    std::string text;
};

/**
 * @struct ClarifyingQuestion
 * @brief A question the user must answer before planning starts.
 */
struct ClarifyingQuestion {
    std::string id;   ///< Stable within a run ("q1", "q2", ...).
    std::string text;
};

/**
 * @struct Answer
 * @brief The user's response to one ClarifyingQuestion, matched by id.
 */
struct Answer {
    std::string questionId;
    std::string text;
};

/**
 * @struct EnrichedQuery
 * @brief Optimized query plus all question/answer pairs, composed as one prompt.
 */
struct EnrichedQuery {
    std::string text;
};

/**
 * @struct SearchPlanItem
 * @brief One planned web search and why it is useful for the query.
 */
struct SearchPlanItem {
    std::string term;
    std::string rationale;
};

/**
 * @struct SearchOutcome
 * @brief Settled result of one search task. A failed outcome never carries a summary.
 */
struct SearchOutcome {
    SearchPlanItem sourceItem;
    std::optional<std::string> summary;
    bool succeeded = false;
    std::string error; ///< Cause of the failure, empty on success.

    static SearchOutcome Success(SearchPlanItem item, std::string summaryText) {
        SearchOutcome outcome;
        outcome.sourceItem = std::move(item);
        outcome.summary = std::move(summaryText);
        outcome.succeeded = true;
        return outcome;
    }

    static SearchOutcome Failure(SearchPlanItem item, std::string cause) {
        SearchOutcome outcome;
        outcome.sourceItem = std::move(item);
        outcome.error = std::move(cause);
        return outcome;
    }
};

/** @brief Outcomes in the order the tasks settled, not in plan order. */
using SearchResultSet = std::vector<SearchOutcome>;

/** @brief Counts the successful outcomes of a result set. */
inline std::size_t CountSucceeded(const SearchResultSet& results) {
    std::size_t count = 0;
    for (const auto& outcome : results) {
        if (outcome.succeeded) ++count;
    }
    return count;
}

/**
 * @struct Report
 * @brief The synthesized research document.
 */
struct Report {
    std::string shortSummary;
    std::string markdown;
    std::vector<std::string> followUpQuestions;
};

} // namespace deepresearch::domain
