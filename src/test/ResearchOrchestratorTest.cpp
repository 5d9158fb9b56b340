#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <set>
#include <functional>
#include <cassert>
#include "application/ResearchOrchestrator.hpp"
#include "domain/ResearchErrors.hpp"
#include "test/Mocks.hpp"

using namespace deepresearch;
using application::ResearchOrchestrator;
using domain::EventKind;
using domain::RunStage;

namespace {

const char* kScenarioQuery = "impact of remote work on urban housing";

struct Fixture {
    std::shared_ptr<testsupport::ScriptedCompletionProvider> provider =
        std::make_shared<testsupport::ScriptedCompletionProvider>();
    std::shared_ptr<testsupport::ScriptedSearchProvider> search =
        std::make_shared<testsupport::ScriptedSearchProvider>();
    std::shared_ptr<testsupport::RecordingNotifier> notifier = std::make_shared<testsupport::RecordingNotifier>();
    std::shared_ptr<testsupport::RecordingTraceSink> sink = std::make_shared<testsupport::RecordingTraceSink>();

    std::unique_ptr<ResearchOrchestrator> make(bool withNotifier = true) {
        application::ResearchCollaborators collaborators;
        collaborators.completion = provider;
        collaborators.search = search;
        if (withNotifier) collaborators.notifier = notifier;
        collaborators.traceSink = sink;
        return std::make_unique<ResearchOrchestrator>(collaborators);
    }
};

std::vector<domain::Answer> AnswersFor(const std::vector<domain::ClarifyingQuestion>& questions) {
    std::vector<domain::Answer> answers;
    for (const auto& question : questions) {
        answers.push_back({question.id, "answer to " + question.id});
    }
    return answers;
}

// Runs the opening phase and returns the questions of the NeedAnswers event.
std::vector<domain::ClarifyingQuestion> AwaitQuestions(application::EventStream& events,
                                                       std::vector<domain::ProgressEvent>& log) {
    auto seen = testsupport::DrainUntil(events, EventKind::NeedAnswers);
    log.insert(log.end(), seen.begin(), seen.end());
    assert(!seen.empty() && seen.back().kind == EventKind::NeedAnswers);
    return seen.back().questions;
}

void AssertContiguous(const std::vector<domain::ProgressEvent>& log) {
    for (std::size_t i = 0; i < log.size(); ++i) {
        assert(log[i].index == i);
    }
}

std::vector<RunStage> CompletedStages(const std::vector<domain::ProgressEvent>& log) {
    std::vector<RunStage> stages;
    for (const auto& event : log) {
        if (event.kind == EventKind::StageCompleted) stages.push_back(event.stage);
    }
    return stages;
}

void TestScenarioWithPartialSearchFailure() {
    std::cout << "[Test] Scenario: 5 planned searches, 2 fail..." << std::endl;
    Fixture f;
    f.search->failingTerms = {"suburban migration after 2020", "rent trends downtown cores"};
    auto orchestrator = f.make();

    auto handle = orchestrator->start(kScenarioQuery);
    assert(handle.traceId.rfind("trace_", 0) == 0);

    std::vector<domain::ProgressEvent> log;
    auto questions = AwaitQuestions(*handle.events, log);
    assert(questions.size() == 3);
    assert(log.front().kind == EventKind::Trace);
    assert(log.front().message == "View trace: " + handle.traceId);

    auto waiting = orchestrator->currentState(handle.runId);
    assert(waiting.stage == RunStage::QuestionsReady);
    assert(waiting.optimizedQuery && waiting.optimizedQuery->text == f.provider->optimized);
    assert(orchestrator->activeRuns().size() == 1);

    orchestrator->supplyAnswers(handle.runId, AnswersFor(questions));
    auto rest = testsupport::DrainAll(*handle.events);
    log.insert(log.end(), rest.begin(), rest.end());

    AssertContiguous(log);
    assert(log.back().kind == EventKind::Done);
    assert(log.back().detail == f.provider->reportMarkdown);
    assert(testsupport::CountKind(log, EventKind::SearchSettled) == 5);
    assert(testsupport::CountKind(log, EventKind::Warning) == 0);

    std::vector<RunStage> expected = {RunStage::Optimized, RunStage::QuestionsReady, RunStage::Enriched,
                                      RunStage::Planned, RunStage::Searched, RunStage::Written};
    assert(CompletedStages(log) == expected);

    auto state = orchestrator->currentState(handle.runId);
    assert(state.stage == RunStage::Done);
    assert(state.results.size() == 5);
    assert(domain::CountSucceeded(state.results) == 3);
    assert(state.report && state.report->markdown == f.provider->reportMarkdown);
    assert(state.enrichedQuery);
    assert(state.enrichedQuery->text.find("Main Topic:\n" + f.provider->optimized) == 0);
    assert(state.enrichedQuery->text.find("A3: answer to q3") != std::string::npos);

    auto writerContexts = f.provider->contexts("ResearchReport");
    assert(writerContexts.size() == 1);
    assert(writerContexts[0].find("Summary of remote work housing demand") != std::string::npos);
    assert(writerContexts[0].find("Summary of suburban migration after 2020") == std::string::npos);
    assert(writerContexts[0].find("Summary of rent trends downtown cores") == std::string::npos);

    // Every span belongs to this run's trace and was closed.
    for (const auto& span : f.sink->spans()) {
        assert(span.traceId == handle.traceId);
        assert(span.ended);
    }
    assert(f.sink->countNamed("research_run") == 1);
    assert(f.sink->countNamed("search:") == 5);
    assert(f.notifier->attempts() == 0);

    assert(orchestrator->activeRuns().empty());
    assert(orchestrator->forget(handle.runId));
    bool unknown = false;
    try {
        orchestrator->currentState(handle.runId);
    } catch (const std::out_of_range&) {
        unknown = true;
    }
    assert(unknown);
    std::cout << "[PASS] Done with 3 of 5 outcomes in the report." << std::endl;
}

void TestAllSearchesFailWarns() {
    std::cout << "[Test] All searches failing yields a warning and still a report..." << std::endl;
    Fixture f;
    f.search->failingTerms.insert(f.provider->searchTerms.begin(), f.provider->searchTerms.end());
    auto orchestrator = f.make();

    auto handle = orchestrator->start(kScenarioQuery);
    std::vector<domain::ProgressEvent> log;
    orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
    auto rest = testsupport::DrainAll(*handle.events);
    log.insert(log.end(), rest.begin(), rest.end());

    assert(log.back().kind == EventKind::Done);
    assert(testsupport::CountKind(log, EventKind::Warning) == 1);
    auto state = orchestrator->currentState(handle.runId);
    assert(state.results.size() == 5);
    assert(domain::CountSucceeded(state.results) == 0);
    assert(state.warnings.size() == 1);
    assert(state.report);
    assert(f.provider->contexts("ResearchReport")[0].find("Summary of") == std::string::npos);
    std::cout << "[PASS] Report written from an empty result set." << std::endl;
}

void TestDelivery() {
    std::cout << "[Test] Delivery success and failure..." << std::endl;
    {
        Fixture f;
        auto orchestrator = f.make();
        auto handle = orchestrator->start(kScenarioQuery, application::RunOptions{true});
        std::vector<domain::ProgressEvent> log;
        orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
        auto rest = testsupport::DrainAll(*handle.events);
        log.insert(log.end(), rest.begin(), rest.end());

        assert(log.back().kind == EventKind::Done);
        auto stages = CompletedStages(log);
        assert(stages.back() == RunStage::Delivered);
        assert(f.notifier->subjects().size() == 1);
        assert(f.notifier->subjects()[0] == "Research report: " + f.provider->optimized);
        assert(f.notifier->bodies()[0] == f.provider->reportMarkdown);
        assert(f.sink->countNamed("deliver") == 1);
    }
    {
        Fixture f;
        f.notifier->fail = true;
        auto orchestrator = f.make();
        auto handle = orchestrator->start(kScenarioQuery, application::RunOptions{true});
        std::vector<domain::ProgressEvent> log;
        orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
        auto rest = testsupport::DrainAll(*handle.events);
        log.insert(log.end(), rest.begin(), rest.end());

        assert(log.back().kind == EventKind::Done);
        assert(log.back().detail == f.provider->reportMarkdown);
        assert(testsupport::CountKind(log, EventKind::Warning) == 1);
        assert(CompletedStages(log).back() == RunStage::Written);
        auto state = orchestrator->currentState(handle.runId);
        assert(state.stage == RunStage::Done);
        assert(state.warnings.size() == 1);
        assert(state.warnings[0].find("Delivery failed") != std::string::npos);
        assert(state.report->markdown == f.provider->reportMarkdown);
        assert(f.notifier->attempts() == 1);
    }
    {
        Fixture f;
        f.notifier->failOddly = true;
        auto orchestrator = f.make();
        auto handle = orchestrator->start(kScenarioQuery, application::RunOptions{true});
        std::vector<domain::ProgressEvent> log;
        orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
        auto rest = testsupport::DrainAll(*handle.events);

        assert(!rest.empty() && rest.back().kind == EventKind::Done);
        assert(handle.events->isExhausted());
        auto state = orchestrator->currentState(handle.runId);
        assert(state.stage == RunStage::Done);
        assert(state.warnings.size() == 1);
        assert(state.warnings[0] == "Delivery failed: unknown error");
    }
    {
        Fixture f;
        auto orchestrator = f.make(false);
        auto handle = orchestrator->start(kScenarioQuery, application::RunOptions{true});
        std::vector<domain::ProgressEvent> log;
        orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
        auto rest = testsupport::DrainAll(*handle.events);
        assert(rest.back().kind == EventKind::Done);
        assert(testsupport::CountKind(rest, EventKind::Warning) == 1);
    }
    std::cout << "[PASS] Delivery problems are warnings, never failures." << std::endl;
}

void TestRunSpanEndsOutsideRunLock() {
    std::cout << "[Test] Trace sink may read the run while the run span ends..." << std::endl;
    Fixture f;
    auto orchestrator = f.make();
    std::string runId;
    RunStage seenAtEnd = RunStage::Start;
    f.sink->onEnd = [&](const testsupport::RecordingTraceSink::Span& span) {
        if (span.name != "research_run") return;
        seenAtEnd = orchestrator->currentState(runId).stage;
    };

    auto handle = orchestrator->start(kScenarioQuery);
    runId = handle.runId;
    std::vector<domain::ProgressEvent> log;
    orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
    auto rest = testsupport::DrainAll(*handle.events);
    assert(!rest.empty() && rest.back().kind == EventKind::Done);
    assert(seenAtEnd == RunStage::Done);
    f.sink->onEnd = nullptr;
    std::cout << "[PASS] Run span ended after the run lock was released." << std::endl;
}

void TestAnswerValidation() {
    std::cout << "[Test] Mismatched answers and invalid transitions..." << std::endl;
    Fixture f;
    auto orchestrator = f.make();
    auto handle = orchestrator->start(kScenarioQuery);
    std::vector<domain::ProgressEvent> log;
    auto questions = AwaitQuestions(*handle.events, log);

    auto expectMismatch = [&](const std::vector<domain::Answer>& answers) {
        bool threw = false;
        try {
            orchestrator->supplyAnswers(handle.runId, answers);
        } catch (const domain::AnswerMismatch&) {
            threw = true;
        }
        assert(threw);
        auto state = orchestrator->currentState(handle.runId);
        assert(state.stage == RunStage::QuestionsReady);
        assert(state.answers.empty());
        assert(!state.enrichedQuery);
    };

    expectMismatch({{"q1", "a"}, {"q2", "b"}});
    expectMismatch({{"q1", "a"}, {"q2", "b"}, {"q9", "c"}});
    expectMismatch({{"q1", "a"}, {"q1", "b"}, {"q2", "c"}});
    assert(handle.events->publishedCount() == log.size());

    // Answers may come in any order; composition follows question order.
    orchestrator->supplyAnswers(handle.runId, {{"q3", "three"}, {"q1", "one"}, {"q2", "two"}});
    bool invalid = false;
    try {
        orchestrator->supplyAnswers(handle.runId, AnswersFor(questions));
    } catch (const domain::InvalidTransition&) {
        invalid = true;
    }
    assert(invalid);

    auto rest = testsupport::DrainAll(*handle.events);
    assert(rest.back().kind == EventKind::Done);
    auto state = orchestrator->currentState(handle.runId);
    auto enriched = state.enrichedQuery->text;
    assert(enriched.find("A1: one") < enriched.find("A2: two"));
    assert(enriched.find("A2: two") < enriched.find("A3: three"));

    invalid = false;
    try {
        orchestrator->supplyAnswers(handle.runId, AnswersFor(questions));
    } catch (const domain::InvalidTransition&) {
        invalid = true;
    }
    assert(invalid);
    assert(orchestrator->currentState(handle.runId).stage == RunStage::Done);

    bool unknown = false;
    try {
        orchestrator->supplyAnswers("run-404", {});
    } catch (const std::out_of_range&) {
        unknown = true;
    }
    assert(unknown);
    std::cout << "[PASS] RunState unchanged after rejected calls." << std::endl;
}

void TestCancelWhileAwaitingAnswers() {
    std::cout << "[Test] Cancel while waiting for answers..." << std::endl;
    Fixture f;
    auto orchestrator = f.make();
    auto handle = orchestrator->start(kScenarioQuery);
    std::vector<domain::ProgressEvent> log;
    auto questions = AwaitQuestions(*handle.events, log);

    assert(orchestrator->cancel(handle.runId));
    assert(!orchestrator->cancel(handle.runId));
    auto rest = testsupport::DrainAll(*handle.events);
    assert(rest.size() == 1);
    assert(rest[0].kind == EventKind::Cancelled);
    assert(handle.events->isExhausted());

    bool invalid = false;
    try {
        orchestrator->supplyAnswers(handle.runId, AnswersFor(questions));
    } catch (const domain::InvalidTransition&) {
        invalid = true;
    }
    assert(invalid);
    assert(orchestrator->currentState(handle.runId).stage == RunStage::Cancelled);
    assert(orchestrator->activeRuns().empty());
    std::cout << "[PASS] Stream ended with Cancelled." << std::endl;
}

void TestCancelDuringSearch() {
    std::cout << "[Test] Cancel while searches are in flight..." << std::endl;
    Fixture f;
    f.search->gate();
    auto orchestrator = f.make();
    auto handle = orchestrator->start(kScenarioQuery);
    std::vector<domain::ProgressEvent> log;
    orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));

    assert(f.search->waitForWaiting(5));
    assert(orchestrator->cancel(handle.runId));
    f.search->release();

    auto rest = testsupport::DrainAll(*handle.events);
    log.insert(log.end(), rest.begin(), rest.end());
    AssertContiguous(log);
    assert(log.back().kind == EventKind::Cancelled);
    assert(CompletedStages(log).back() == RunStage::Planned);
    assert(testsupport::CountKind(log, EventKind::SearchSettled) == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto state = orchestrator->currentState(handle.runId);
    assert(state.stage == RunStage::Cancelled);
    assert(state.results.empty());
    assert(!state.report);
    assert(f.provider->contexts("ResearchReport").empty());
    std::cout << "[PASS] No transitions after Cancelled." << std::endl;
}

void TestCancelKeepsSettledOutcomes() {
    std::cout << "[Test] Cancel after 3 of 5 searches settled..." << std::endl;
    Fixture f;
    const std::string held1 = f.provider->searchTerms[1];
    const std::string held2 = f.provider->searchTerms[3];
    f.search->gate({held1, held2});
    auto orchestrator = f.make();
    auto handle = orchestrator->start(kScenarioQuery);
    std::vector<domain::ProgressEvent> log;
    orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));

    auto seen = testsupport::DrainUntilCount(*handle.events, EventKind::SearchSettled, 3);
    log.insert(log.end(), seen.begin(), seen.end());
    assert(testsupport::CountKind(log, EventKind::SearchSettled) == 3);
    assert(f.search->waitForWaiting(2));

    assert(orchestrator->cancel(handle.runId));
    f.search->release();
    auto rest = testsupport::DrainAll(*handle.events);
    log.insert(log.end(), rest.begin(), rest.end());
    AssertContiguous(log);
    assert(log.back().kind == EventKind::Cancelled);
    assert(testsupport::CountKind(log, EventKind::SearchSettled) == 3);

    auto state = orchestrator->currentState(handle.runId);
    assert(state.stage == RunStage::Cancelled);
    assert(state.results.size() == 3);
    for (const auto& outcome : state.results) {
        assert(outcome.succeeded);
        assert(outcome.sourceItem.term != held1 && outcome.sourceItem.term != held2);
    }

    // The released searches finish after the cancellation and add nothing.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    state = orchestrator->currentState(handle.runId);
    assert(state.results.size() == 3);
    assert(!state.report);
    assert(f.provider->contexts("ResearchReport").empty());
    std::cout << "[PASS] 3 settled outcomes kept, 2 in-flight searches abandoned." << std::endl;
}

void TestShortPlanWarns() {
    std::cout << "[Test] A plan shorter than requested is used with a warning..." << std::endl;
    Fixture f;
    f.provider->searchTerms = {"remote work housing demand", "", "office vacancy conversions", "home prices exurbs"};
    auto orchestrator = f.make();
    auto handle = orchestrator->start(kScenarioQuery);
    std::vector<domain::ProgressEvent> log;
    orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
    auto rest = testsupport::DrainAll(*handle.events);
    log.insert(log.end(), rest.begin(), rest.end());

    assert(log.back().kind == EventKind::Done);
    assert(testsupport::CountKind(log, EventKind::Warning) == 1);
    assert(testsupport::CountKind(log, EventKind::SearchSettled) == 3);
    auto state = orchestrator->currentState(handle.runId);
    assert(state.plan.size() == 3);
    assert(state.results.size() == 3);
    assert(state.warnings.size() == 1);
    assert(state.warnings[0] == "Planner returned 3 of 5 searches");
    std::cout << "[PASS] 3 of 5 searches run, one warning." << std::endl;
}

void TestRequiredStageFailures() {
    std::cout << "[Test] Required stage failures end the run..." << std::endl;
    struct Case {
        const char* name;
        std::function<void(testsupport::ScriptedCompletionProvider&)> arrange;
        domain::PipelineStep step;
        bool needsAnswers;
        const char* cause;
    };
    std::vector<Case> cases = {
        {"optimize", [](auto& p) { p.throwProviderError.insert("OptimizedQuery"); }, domain::PipelineStep::Optimize, false,
         "unavailable"},
        {"optimize", [](auto& p) { p.throwNonStandard.insert("OptimizedQuery"); }, domain::PipelineStep::Optimize, false,
         "unknown provider failure"},
        {"clarify", [](auto& p) { p.questions = {"Only one?", "And two?"}; }, domain::PipelineStep::Clarify, false,
         "expected 3 questions"},
        {"plan", [](auto& p) { p.searchTerms = {"", "  "}; }, domain::PipelineStep::Plan, true, "empty"},
        {"plan", [](auto& p) { p.throwNonStandard.insert("SearchPlan"); }, domain::PipelineStep::Plan, true,
         "unknown provider failure"},
        {"write", [](auto& p) { p.malformed.insert("ResearchReport"); }, domain::PipelineStep::Write, true, ""},
    };

    for (const auto& c : cases) {
        Fixture f;
        c.arrange(*f.provider);
        auto orchestrator = f.make();
        auto handle = orchestrator->start(kScenarioQuery);

        std::vector<domain::ProgressEvent> log;
        if (c.needsAnswers) {
            orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
        }
        auto rest = testsupport::DrainAll(*handle.events);
        log.insert(log.end(), rest.begin(), rest.end());

        AssertContiguous(log);
        assert(handle.events->isExhausted());
        const auto& last = log.back();
        assert(last.kind == EventKind::Failed);
        assert(last.level == domain::EventLevel::Error);
        assert(last.message.find(std::string("Stage '") + c.name + "' failed") == 0);

        auto state = orchestrator->currentState(handle.runId);
        assert(state.stage == RunStage::Failed);
        assert(state.failedStep && *state.failedStep == c.step);
        assert(!state.error.empty());
        assert(state.error.find(c.cause) != std::string::npos);
        assert(!orchestrator->cancel(handle.runId));
        std::cout << "  [PASS] " << c.name << ": " << state.error << std::endl;
    }
    std::cout << "[PASS] Failed events name the step and the cause." << std::endl;
}

void TestStartValidationAndIndependentRuns() {
    std::cout << "[Test] Blank queries are rejected; runs are independent..." << std::endl;
    Fixture f;
    f.search->delaysMs = {{"remote work housing demand", 20}};
    auto orchestrator = f.make();

    bool rejected = false;
    try {
        orchestrator->start("   \t ");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    std::vector<application::RunHandle> handles;
    for (int i = 0; i < 3; ++i) {
        handles.push_back(orchestrator->start(std::string(kScenarioQuery) + " #" + std::to_string(i)));
    }
    std::set<std::string> traceIds;
    for (auto& handle : handles) {
        traceIds.insert(handle.traceId);
        std::vector<domain::ProgressEvent> log;
        orchestrator->supplyAnswers(handle.runId, AnswersFor(AwaitQuestions(*handle.events, log)));
    }
    for (auto& handle : handles) {
        auto rest = testsupport::DrainAll(*handle.events);
        assert(rest.back().kind == EventKind::Done);
        assert(orchestrator->currentState(handle.runId).results.size() == 5);
    }
    assert(traceIds.size() == 3);
    assert(orchestrator->activeRuns().empty());
    std::cout << "[PASS] 3 concurrent runs finished with separate traces." << std::endl;
}

} // namespace

int main() {
    TestScenarioWithPartialSearchFailure();
    TestAllSearchesFailWarns();
    TestDelivery();
    TestRunSpanEndsOutsideRunLock();
    TestAnswerValidation();
    TestCancelWhileAwaitingAnswers();
    TestCancelDuringSearch();
    TestCancelKeepsSettledOutcomes();
    TestShortPlanWarns();
    TestRequiredStageFailures();
    TestStartValidationAndIndependentRuns();
    std::cout << "[PASS] ResearchOrchestratorTest" << std::endl;
    return 0;
}
