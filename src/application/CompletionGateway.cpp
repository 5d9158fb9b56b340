/**
 * @file CompletionGateway.cpp
 * @brief Implementation of CompletionGateway.
 */

#include "application/CompletionGateway.hpp"
#include "domain/ResearchErrors.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace deepresearch::application {

using json = nlohmann::json;
using domain::FieldType;
using domain::OutputShape;
using infrastructure::PromptCatalog;

namespace {

std::string Trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

} // namespace

CompletionGateway::CompletionGateway(std::shared_ptr<domain::CompletionProvider> provider)
    : m_provider(std::move(provider)) {
    if (!m_provider) {
        throw std::invalid_argument("CompletionGateway requires a provider.");
    }
}

const OutputShape& CompletionGateway::OptimizedQueryShape() {
    static const OutputShape shape = OutputShape::Object("OptimizedQuery", {
        {"optimized_query", FieldType::String, "The refined research query", {}}
    });
    return shape;
}

const OutputShape& CompletionGateway::QuestionsShape() {
    static const OutputShape shape = OutputShape::Object("ClarifyingQuestions", {
        {"questions", FieldType::ObjectArray, "Questions whose answers will help the research", {
            {"question", FieldType::String, "One clarifying question", {}}
        }}
    });
    return shape;
}

const OutputShape& CompletionGateway::SearchPlanShape() {
    static const OutputShape shape = OutputShape::Object("SearchPlan", {
        {"searches", FieldType::ObjectArray, "Web searches to perform", {
            {"query", FieldType::String, "The search term", {}},
            {"reason", FieldType::String, "Why this search matters for the query", {}}
        }}
    });
    return shape;
}

const OutputShape& CompletionGateway::SearchSummaryShape() {
    static const OutputShape shape = OutputShape::Text("SearchSummary");
    return shape;
}

const OutputShape& CompletionGateway::ReportShape() {
    static const OutputShape shape = OutputShape::Object("ResearchReport", {
        {"short_summary", FieldType::String, "A short 2-3 sentence summary of the findings", {}},
        {"markdown_report", FieldType::String, "The final report", {}},
        {"follow_up_questions", FieldType::StringArray, "Suggested topics to research further", {}}
    });
    return shape;
}

json CompletionGateway::complete(const PromptSpec& prompt,
                                 const OutputShape& shape,
                                 const TraceContext& trace) const {
    auto span = trace.span("completion:" + shape.name());

    json value;
    try {
        value = m_provider->invoke(prompt.instructions, prompt.context, shape);
    } catch (const domain::ProviderError&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::ProviderError(shape.name() + ": " + e.what());
    } catch (...) {
        throw domain::ProviderError(shape.name() + ": unknown provider failure");
    }

    if (auto problem = shape.validate(value)) {
        std::cerr << "[CompletionGateway] Malformed output for " << shape.name() << ": " << *problem << std::endl;
        throw domain::ProviderError("malformed output: " + *problem);
    }
    return value;
}

domain::OptimizedQuery CompletionGateway::optimizeQuery(const domain::RawQuery& query,
                                                        const TraceContext& trace) const {
    PromptSpec prompt{PromptCatalog::GetOptimizerPrompt(), query.text};
    json value = complete(prompt, OptimizedQueryShape(), trace);

    std::string text = Trim(value["optimized_query"].get<std::string>());
    if (text.empty()) {
        throw domain::ProviderError("malformed output: empty optimized query");
    }
    return domain::OptimizedQuery{text};
}

std::vector<domain::ClarifyingQuestion> CompletionGateway::generateQuestions(const domain::OptimizedQuery& query,
                                                                             std::size_t count,
                                                                             const TraceContext& trace) const {
    PromptSpec prompt{PromptCatalog::GetQuestionsPrompt(count), query.text};
    json value = complete(prompt, QuestionsShape(), trace);

    std::vector<domain::ClarifyingQuestion> questions;
    for (const auto& item : value["questions"]) {
        if (questions.size() == count) break;
        std::string text = Trim(item["question"].get<std::string>());
        if (text.empty()) continue;
        questions.push_back({"q" + std::to_string(questions.size() + 1), text});
    }
    return questions;
}

std::vector<domain::SearchPlanItem> CompletionGateway::planSearches(const domain::EnrichedQuery& query,
                                                                    std::size_t count,
                                                                    const TraceContext& trace) const {
    PromptSpec prompt{PromptCatalog::GetPlannerPrompt(count), "Query: " + query.text};
    json value = complete(prompt, SearchPlanShape(), trace);

    std::vector<domain::SearchPlanItem> plan;
    for (const auto& item : value["searches"]) {
        if (plan.size() == count) break;
        std::string term = Trim(item["query"].get<std::string>());
        if (term.empty()) continue;
        plan.push_back({term, Trim(item["reason"].get<std::string>())});
    }
    return plan;
}

std::string CompletionGateway::summarizeSearch(const domain::SearchPlanItem& item,
                                               const std::string& rawResults,
                                               const TraceContext& trace) const {
    std::ostringstream context;
    context << "Search term: " << item.term << "\n"
            << "Reason for searching: " << item.rationale << "\n\n"
            << "Raw results:\n" << rawResults;

    PromptSpec prompt{PromptCatalog::GetSearchSummaryPrompt(), context.str()};
    return complete(prompt, SearchSummaryShape(), trace).get<std::string>();
}

domain::Report CompletionGateway::writeReport(const domain::EnrichedQuery& query,
                                              const domain::SearchResultSet& results,
                                              const TraceContext& trace) const {
    std::ostringstream context;
    context << "Original query: " << query.text << "\n"
            << "Summarized search results:\n";
    for (const auto& outcome : results) {
        if (!outcome.succeeded || !outcome.summary) continue;
        context << "--- " << outcome.sourceItem.term << " ---\n"
                << *outcome.summary << "\n";
    }

    PromptSpec prompt{PromptCatalog::GetWriterPrompt(), context.str()};
    json value = complete(prompt, ReportShape(), trace);

    domain::Report report;
    report.shortSummary = value["short_summary"].get<std::string>();
    report.markdown = value["markdown_report"].get<std::string>();
    report.followUpQuestions = value["follow_up_questions"].get<std::vector<std::string>>();
    return report;
}

} // namespace deepresearch::application
