/**
 * @file Clarification.cpp
 * @brief Implementation of the clarification helpers.
 */

#include "application/Clarification.hpp"
#include "domain/ResearchErrors.hpp"
#include <map>
#include <set>
#include <sstream>

namespace deepresearch::application {

void MatchAnswers(const std::vector<domain::ClarifyingQuestion>& questions,
                  const std::vector<domain::Answer>& answers) {
    if (answers.size() != questions.size()) {
        throw domain::AnswerMismatch("Expected " + std::to_string(questions.size()) +
                                     " answers, got " + std::to_string(answers.size()) + ".");
    }

    std::set<std::string> pending;
    for (const auto& question : questions) {
        pending.insert(question.id);
    }

    std::set<std::string> seen;
    for (const auto& answer : answers) {
        if (!pending.count(answer.questionId)) {
            throw domain::AnswerMismatch("No pending question with id '" + answer.questionId + "'.");
        }
        if (!seen.insert(answer.questionId).second) {
            throw domain::AnswerMismatch("Question '" + answer.questionId + "' answered twice.");
        }
    }
}

domain::EnrichedQuery ComposeEnrichedQuery(const domain::OptimizedQuery& query,
                                           const std::vector<domain::ClarifyingQuestion>& questions,
                                           const std::vector<domain::Answer>& answers) {
    std::map<std::string, std::string> byId;
    for (const auto& answer : answers) {
        byId[answer.questionId] = answer.text;
    }

    std::ostringstream ss;
    ss << "Main Topic:\n" << query.text << "\n"
       << "Clarifications:\n";
    for (size_t i = 0; i < questions.size(); ++i) {
        ss << "Q" << (i + 1) << ": " << questions[i].text << "\n"
           << "A" << (i + 1) << ": " << byId[questions[i].id] << "\n";
    }
    return domain::EnrichedQuery{ss.str()};
}

} // namespace deepresearch::application
