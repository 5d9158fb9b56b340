/**
 * @file DeepResearchApp.cpp
 * @brief Implementation of the DeepResearchApp class.
 */

#include "app/DeepResearchApp.hpp"
#include "domain/ResearchErrors.hpp"
#include "infrastructure/ConsoleTraceSink.hpp"
#include "infrastructure/OllamaCompletionProvider.hpp"
#include "infrastructure/SearxSearchProvider.hpp"
#include "infrastructure/WebhookNotifier.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace deepresearch::app {

namespace {

std::string Trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

constexpr int kExitDone = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 3;

} // namespace

DeepResearchApp::DeepResearchApp(std::istream& in, std::ostream& out)
    : m_in(in), m_out(out) {}

std::string DeepResearchApp::Usage() {
    return "Usage: deep_research [--config <path>] [--deliver] [--answers a1|a2|a3] <query...>\n";
}

CliOptions DeepResearchApp::ParseArguments(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> words;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--deliver") {
            options.deliver = true;
        } else if (arg == "--config" || arg == "--answers") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            const std::string& value = args[++i];
            if (arg == "--config") {
                options.configPath = value;
            } else {
                options.answers = SplitAnswers(value);
            }
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            words.push_back(arg);
        }
    }

    for (const auto& word : words) {
        if (!options.query.empty()) options.query += " ";
        options.query += word;
    }
    if (!options.showHelp && Trim(options.query).empty()) {
        throw std::invalid_argument("a research query is required");
    }
    return options;
}

std::vector<std::string> DeepResearchApp::SplitAnswers(const std::string& joined) {
    std::vector<std::string> answers;
    std::size_t start = 0;
    while (true) {
        auto bar = joined.find('|', start);
        answers.push_back(Trim(joined.substr(start, bar == std::string::npos ? std::string::npos : bar - start)));
        if (bar == std::string::npos) break;
        start = bar + 1;
    }
    return answers;
}

int DeepResearchApp::Run(int argc, char** argv) {
    CliOptions options;
    try {
        options = ParseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[DeepResearchApp] " << e.what() << "\n" << Usage();
        return kExitUsage;
    }
    if (options.showHelp) {
        m_out << Usage();
        return kExitDone;
    }

    auto settings = infrastructure::ConfigLoader::Load(options.configPath);
    application::PipelineConfig config;
    config.questionCount = settings.pipeline.questionCount;
    config.planSize = settings.pipeline.planSize;

    auto collaborators = BuildCollaborators(settings, options.deliver);
    collaborators.completion->initialize();
    return Execute(options, std::move(collaborators), config);
}

application::ResearchCollaborators DeepResearchApp::BuildCollaborators(const infrastructure::ResearchSettings& settings,
                                                                       bool deliver) {
    application::ResearchCollaborators collaborators;
    collaborators.completion = std::make_shared<infrastructure::OllamaCompletionProvider>(
        settings.ollama.host, settings.ollama.port, settings.ollama.model, settings.ollama.timeoutSeconds);
    collaborators.search = std::make_shared<infrastructure::SearxSearchProvider>(
        settings.search.host, settings.search.port, settings.search.path, settings.search.maxResults);
    if (settings.notifier.enabled) {
        collaborators.notifier = std::make_shared<infrastructure::WebhookNotifier>(
            settings.notifier.host, settings.notifier.port, settings.notifier.path);
    } else if (deliver) {
        std::cerr << "[DeepResearchApp] --deliver given but the notifier is disabled in settings" << std::endl;
    }
    collaborators.traceSink = std::make_shared<infrastructure::ConsoleTraceSink>(std::cerr);
    return collaborators;
}

int DeepResearchApp::Execute(const CliOptions& options,
                             application::ResearchCollaborators collaborators,
                             application::PipelineConfig config) {
    application::ResearchOrchestrator orchestrator(std::move(collaborators), config);

    application::RunOptions runOptions;
    runOptions.deliver = options.deliver;
    auto handle = orchestrator.start(options.query, runOptions);
    m_out << "Research " << handle.runId << " started." << std::endl;

    int exitCode = kExitFailed;
    while (auto event = handle.events->next()) {
        PrintEvent(*event);

        if (event->kind == domain::EventKind::NeedAnswers) {
            auto answers = CollectAnswers(event->questions, options.answers);
            if (!answers) {
                orchestrator.cancel(handle.runId);
                continue;
            }
            try {
                orchestrator.supplyAnswers(handle.runId, *answers);
            } catch (const domain::ResearchError& e) {
                std::cerr << "[DeepResearchApp] Answers rejected: " << e.what() << std::endl;
                orchestrator.cancel(handle.runId);
            }
        } else if (event->kind == domain::EventKind::Done) {
            auto state = orchestrator.currentState(handle.runId);
            m_out << "\n" << event->detail << "\n";
            if (state.report && !state.report->followUpQuestions.empty()) {
                m_out << "\nFollow-up questions:\n";
                for (const auto& question : state.report->followUpQuestions) {
                    m_out << "- " << question << "\n";
                }
            }
            m_out.flush();
            exitCode = kExitDone;
        } else if (event->kind == domain::EventKind::Failed) {
            exitCode = kExitFailed;
        } else if (event->kind == domain::EventKind::Cancelled) {
            exitCode = kExitCancelled;
        }
    }
    return exitCode;
}

std::optional<std::vector<domain::Answer>> DeepResearchApp::CollectAnswers(
    const std::vector<domain::ClarifyingQuestion>& questions,
    const std::optional<std::vector<std::string>>& presets) {
    std::vector<domain::Answer> answers;
    if (presets) {
        if (presets->size() != questions.size()) {
            std::cerr << "[DeepResearchApp] " << presets->size() << " answers given for "
                      << questions.size() << " questions" << std::endl;
            return std::nullopt;
        }
        for (std::size_t i = 0; i < questions.size(); ++i) {
            answers.push_back(domain::Answer{questions[i].id, (*presets)[i]});
        }
        return answers;
    }

    for (const auto& question : questions) {
        m_out << question.text << "\n> " << std::flush;
        std::string line;
        if (!std::getline(m_in, line)) {
            std::cerr << "[DeepResearchApp] Input closed before all questions were answered" << std::endl;
            return std::nullopt;
        }
        answers.push_back(domain::Answer{question.id, Trim(line)});
    }
    return answers;
}

void DeepResearchApp::PrintEvent(const domain::ProgressEvent& event) {
    switch (event.kind) {
        case domain::EventKind::Warning:
            m_out << "[Warning] " << event.message << std::endl;
            break;
        case domain::EventKind::Failed:
            m_out << "[Failed] " << event.message << std::endl;
            break;
        case domain::EventKind::NeedAnswers:
            m_out << "[" << domain::StageToString(event.stage) << "] " << event.message << ":" << std::endl;
            break;
        default:
            m_out << "[" << domain::StageToString(event.stage) << "] " << event.message << std::endl;
            break;
    }
}

} // namespace deepresearch::app
