#include <iostream>
#include <cassert>
#include "application/CompletionGateway.hpp"
#include "domain/ResearchErrors.hpp"
#include "test/Mocks.hpp"

using namespace deepresearch;
using application::CompletionGateway;
using application::TraceContext;

namespace {

struct Fixture {
    std::shared_ptr<testsupport::ScriptedCompletionProvider> provider =
        std::make_shared<testsupport::ScriptedCompletionProvider>();
    std::shared_ptr<testsupport::RecordingTraceSink> sink = std::make_shared<testsupport::RecordingTraceSink>();
    TraceContext trace{sink, "trace_gateway"};
    CompletionGateway gateway{provider};
};

template <typename F>
std::string ExpectProviderError(F&& call) {
    try {
        call();
    } catch (const domain::ProviderError& e) {
        return e.what();
    }
    assert(false && "expected ProviderError");
    return "";
}

void TestTypedOperations() {
    std::cout << "[Test] Typed operations map provider output to value types..." << std::endl;
    Fixture f;
    f.provider->optimized = "  housing and remote work  ";
    f.provider->questions = {"First?", "   ", "Second?", "Third?", "Fourth?"};

    auto optimized = f.gateway.optimizeQuery({"remote work housing"}, f.trace);
    assert(optimized.text == "housing and remote work");

    auto questions = f.gateway.generateQuestions(optimized, 3, f.trace);
    assert(questions.size() == 3);
    assert(questions[0].id == "q1" && questions[0].text == "First?");
    assert(questions[1].id == "q2" && questions[1].text == "Second?");
    assert(questions[2].id == "q3" && questions[2].text == "Third?");

    f.provider->searchTerms = {"a", "", "b", "c", "d", "e", "f"};
    auto plan = f.gateway.planSearches({"Main Topic:\nx\n"}, 5, f.trace);
    assert(plan.size() == 5);
    assert(plan[0].term == "a" && plan[0].rationale == "covers a");
    assert(plan[1].term == "b");
    assert(plan[4].term == "e");

    auto summary = f.gateway.summarizeSearch(plan[0], "raw", f.trace);
    assert(summary == "Summary of a");
    std::cout << "[PASS] Ids assigned in order, blanks dropped, extras ignored." << std::endl;
}

void TestReportUsesSuccessesOnly() {
    std::cout << "[Test] writeReport sees only successful outcomes..." << std::endl;
    Fixture f;
    domain::SearchResultSet results = {
        domain::SearchOutcome::Success({"kept one", "r"}, "summary one"),
        domain::SearchOutcome::Failure({"dropped", "r"}, "timeout"),
        domain::SearchOutcome::Success({"kept two", "r"}, "summary two")
    };
    auto report = f.gateway.writeReport({"enriched"}, results, f.trace);
    assert(report.shortSummary == f.provider->shortSummary);
    assert(report.markdown == f.provider->reportMarkdown);
    assert(report.followUpQuestions.size() == 2);

    auto contexts = f.provider->contexts("ResearchReport");
    assert(contexts.size() == 1);
    assert(contexts[0].find("summary one") != std::string::npos);
    assert(contexts[0].find("summary two") != std::string::npos);
    assert(contexts[0].find("dropped") == std::string::npos);
    assert(contexts[0].find("timeout") == std::string::npos);

    auto empty = f.gateway.writeReport({"enriched"}, {}, f.trace);
    assert(!empty.markdown.empty());
    std::cout << "[PASS] Failed outcomes are not in the writer's context." << std::endl;
}

void TestFailuresSurfaceAsProviderError() {
    std::cout << "[Test] Provider failures and malformed output become ProviderError..." << std::endl;
    Fixture f;

    f.provider->malformed.insert("OptimizedQuery");
    auto malformed = ExpectProviderError([&] { f.gateway.optimizeQuery({"q"}, f.trace); });
    assert(malformed.find("malformed output") != std::string::npos);

    f.provider->malformed.insert("SearchSummary");
    ExpectProviderError([&] { f.gateway.summarizeSearch({"t", "r"}, "raw", f.trace); });

    f.provider->throwRuntimeError.insert("SearchPlan");
    auto wrapped = ExpectProviderError([&] { f.gateway.planSearches({"q"}, 5, f.trace); });
    assert(wrapped.find("SearchPlan crashed") != std::string::npos);

    f.provider->throwNonStandard.insert("ClarifyingQuestions");
    auto unknown = ExpectProviderError([&] { f.gateway.generateQuestions({"q"}, 3, f.trace); });
    assert(unknown == "ClarifyingQuestions: unknown provider failure");

    f.provider->throwProviderError.insert("ResearchReport");
    auto passed = ExpectProviderError([&] { f.gateway.writeReport({"q"}, {}, f.trace); });
    assert(passed == "ResearchReport unavailable");

    f.provider->malformed.clear();
    f.provider->optimized = "   ";
    ExpectProviderError([&] { f.gateway.optimizeQuery({"q"}, f.trace); });

    // An item with a missing field breaks the whole shape, not just the item.
    nlohmann::json item = {{"query", "a"}};
    nlohmann::json partial = {{"searches", nlohmann::json::array({item})}};
    auto problem = CompletionGateway::SearchPlanShape().validate(partial);
    assert(problem && problem->find("reason") != std::string::npos);
    std::cout << "[PASS] Every failure mode surfaced as ProviderError." << std::endl;
}

void TestOneSpanPerCall() {
    std::cout << "[Test] Each gateway call records one span..." << std::endl;
    Fixture f;
    f.gateway.optimizeQuery({"q"}, f.trace);
    f.gateway.generateQuestions({"q"}, 3, f.trace);
    f.provider->throwProviderError.insert("SearchPlan");
    bool threw = false;
    try {
        f.gateway.planSearches({"q"}, 5, f.trace);
    } catch (const domain::ProviderError&) {
        threw = true;
    }
    assert(threw);

    auto spans = f.sink->spans();
    assert(spans.size() == 3);
    assert(spans[0].name == "completion:OptimizedQuery");
    assert(spans[1].name == "completion:ClarifyingQuestions");
    assert(spans[2].name == "completion:SearchPlan");
    for (const auto& span : spans) {
        assert(span.traceId == "trace_gateway");
        assert(span.ended);
    }
    std::cout << "[PASS] Spans closed even when the call failed." << std::endl;
}

void TestShapesDescribeSchema() {
    std::cout << "[Test] Structured shapes publish a JSON schema..." << std::endl;
    auto schema = CompletionGateway::ReportShape().toJsonSchema();
    assert(schema["type"] == "object");
    assert(schema["required"].size() == 3);
    assert(schema["properties"]["follow_up_questions"]["type"] == "array");

    auto plan = CompletionGateway::SearchPlanShape().toJsonSchema();
    assert(plan["properties"]["searches"]["items"]["required"].size() == 2);
    assert(CompletionGateway::SearchSummaryShape().isText());
    std::cout << "[PASS] Schemas list every required field." << std::endl;
}

} // namespace

int main() {
    TestTypedOperations();
    TestReportUsesSuccessesOnly();
    TestFailuresSurfaceAsProviderError();
    TestOneSpanPerCall();
    TestShapesDescribeSchema();
    std::cout << "[PASS] CompletionGatewayTest" << std::endl;
    return 0;
}
