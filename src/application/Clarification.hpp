/**
 * @file Clarification.hpp
 * @brief Matching user answers to clarifying questions and folding them into the query.
 */

#pragma once

#include <vector>
#include "domain/ResearchTypes.hpp"

namespace deepresearch::application {

/**
 * @brief Checks that answers and questions correspond one to one by id.
 * @throws domain::AnswerMismatch on missing, duplicate or unknown question ids.
 */
void MatchAnswers(const std::vector<domain::ClarifyingQuestion>& questions,
                  const std::vector<domain::Answer>& answers);

/**
 * @brief Composes the enriched query. Pairs follow question order, not answer order.
 *
 * Answers must already have passed MatchAnswers.
 */
domain::EnrichedQuery ComposeEnrichedQuery(const domain::OptimizedQuery& query,
                                           const std::vector<domain::ClarifyingQuestion>& questions,
                                           const std::vector<domain::Answer>& answers);

} // namespace deepresearch::application
