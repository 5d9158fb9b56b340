#include <iostream>
#include <thread>
#include <chrono>
#include <mutex>
#include <set>
#include <cassert>
#include "application/SearchFanOutCoordinator.hpp"
#include "test/Mocks.hpp"

using namespace deepresearch;
using application::SearchFanOutCoordinator;

namespace {

struct Fixture {
    std::shared_ptr<testsupport::ScriptedCompletionProvider> provider =
        std::make_shared<testsupport::ScriptedCompletionProvider>();
    std::shared_ptr<testsupport::ScriptedSearchProvider> search =
        std::make_shared<testsupport::ScriptedSearchProvider>();
    std::shared_ptr<testsupport::RecordingTraceSink> sink = std::make_shared<testsupport::RecordingTraceSink>();
    std::shared_ptr<application::AsyncTaskManager> tasks = std::make_shared<application::AsyncTaskManager>();
    std::shared_ptr<application::CompletionGateway> gateway =
        std::make_shared<application::CompletionGateway>(provider);
    SearchFanOutCoordinator coordinator{search, gateway, tasks};
    application::TraceContext trace{sink, "trace_fanout"};
};

std::vector<domain::SearchPlanItem> Plan(const std::vector<std::string>& terms) {
    std::vector<domain::SearchPlanItem> plan;
    for (const auto& term : terms) plan.push_back({term, "because " + term});
    return plan;
}

void TestPartialFailureKeepsEveryOutcome() {
    std::cout << "[Test] k failing searches still yield M outcomes..." << std::endl;
    Fixture f;
    f.search->failingTerms = {"beta", "delta"};
    auto events = std::make_shared<application::EventStream>();
    application::CancellationToken token;

    auto results = f.coordinator.executeAll(Plan({"alpha", "beta", "gamma", "delta", "epsilon"}), events, token, f.trace);
    assert(results.size() == 5);
    assert(domain::CountSucceeded(results) == 3);

    std::set<std::string> terms;
    for (const auto& outcome : results) {
        terms.insert(outcome.sourceItem.term);
        if (outcome.succeeded) {
            assert(outcome.summary && *outcome.summary == "Summary of " + outcome.sourceItem.term);
            assert(outcome.error.empty());
        } else {
            assert(!outcome.summary);
            assert(outcome.error.find("refused") != std::string::npos);
        }
    }
    assert(terms.size() == 5);

    events->close();
    auto settled = testsupport::DrainAll(*events);
    assert(settled.size() == 5);
    for (std::size_t i = 0; i < settled.size(); ++i) {
        const auto& event = settled[i];
        assert(event.kind == domain::EventKind::SearchSettled);
        assert(event.message.find("(" + std::to_string(i + 1) + "/5 completed)") != std::string::npos);
        bool failed = event.message.find("failed:") != std::string::npos;
        assert(event.level == (failed ? domain::EventLevel::Warning : domain::EventLevel::Info));
    }

    // Only the successful searches reach the summarizer.
    assert(f.provider->contexts("SearchSummary").size() == 3);
    assert(f.sink->countNamed("search:") == 5);
    std::cout << "[PASS] 3 succeeded, 2 failed, 5 settled events." << std::endl;
}

void TestOutcomesInCompletionOrder() {
    std::cout << "[Test] Outcomes are collected in completion order..." << std::endl;
    Fixture f;
    f.search->delaysMs = {{"slow", 150}, {"medium", 60}, {"fast", 0}};
    application::CancellationToken token;

    auto results = f.coordinator.executeAll(Plan({"slow", "medium", "fast"}), nullptr, token, f.trace);
    assert(results.size() == 3);
    assert(results[0].sourceItem.term == "fast");
    assert(results[2].sourceItem.term == "slow");
    std::cout << "[PASS] fast, medium, slow." << std::endl;
}

void TestAllSearchesFailing() {
    std::cout << "[Test] All searches failing is not an error..." << std::endl;
    Fixture f;
    f.search->failingTerms = {"x", "y"};
    f.provider->throwProviderError.insert("SearchSummary");
    application::CancellationToken token;

    auto results = f.coordinator.executeAll(Plan({"x", "y", "z"}), nullptr, token, f.trace);
    assert(results.size() == 3);
    assert(domain::CountSucceeded(results) == 0);
    std::cout << "[PASS] Search and summary failures both became failed outcomes." << std::endl;
}

void TestCancellationKeepsSettledOutcomes() {
    std::cout << "[Test] Cancellation keeps settled outcomes and abandons the rest..." << std::endl;
    Fixture f;
    f.search->gate({"c", "d"});
    auto events = std::make_shared<application::EventStream>();
    application::CancellationToken token;

    std::mutex heardMutex;
    std::vector<std::string> heard;
    auto listener = [&heardMutex, &heard](const domain::SearchOutcome& outcome) {
        std::lock_guard<std::mutex> lock(heardMutex);
        heard.push_back(outcome.sourceItem.term);
    };

    std::thread canceller([&f, &events, token]() {
        f.search->waitForWaiting(2);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (events->publishedCount() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto results = f.coordinator.executeAll(Plan({"a", "b", "c", "d"}), events, token, f.trace, listener);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    assert(results.size() == 2);
    assert(elapsed < std::chrono::seconds(2));
    std::set<std::string> kept;
    for (const auto& outcome : results) {
        assert(outcome.succeeded);
        kept.insert(outcome.sourceItem.term);
    }
    assert((kept == std::set<std::string>{"a", "b"}));

    f.search->release();
    // Abandoned tasks must neither publish, report nor summarize after cancellation.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(events->publishedCount() == 2);
    assert(f.provider->contexts("SearchSummary").size() == 2);
    {
        std::lock_guard<std::mutex> lock(heardMutex);
        assert(heard.size() == 2);
        assert(heard[0] == results[0].sourceItem.term && heard[1] == results[1].sourceItem.term);
    }

    auto none = f.coordinator.executeAll(Plan({"e"}), events, token, f.trace);
    assert(none.empty());
    std::cout << "[PASS] 2 of 4 outcomes kept, the gated 2 abandoned." << std::endl;
}

void TestEmptyPlan() {
    std::cout << "[Test] Empty plan returns immediately..." << std::endl;
    Fixture f;
    application::CancellationToken token;
    auto results = f.coordinator.executeAll({}, nullptr, token, f.trace);
    assert(results.empty());
    assert(f.search->calls() == 0);
    std::cout << "[PASS] No tasks launched." << std::endl;
}

} // namespace

int main() {
    TestPartialFailureKeepsEveryOutcome();
    TestOutcomesInCompletionOrder();
    TestAllSearchesFailing();
    TestCancellationKeepsSettledOutcomes();
    TestEmptyPlan();
    std::cout << "[PASS] SearchFanOutTest" << std::endl;
    return 0;
}
