/**
 * @file DeepResearchApp.hpp
 * @brief Terminal front end: parses the command line, runs one research and prints its progress.
 */

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "application/ResearchOrchestrator.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace deepresearch::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string configPath = "settings.json";
    bool deliver = false;
    std::optional<std::vector<std::string>> answers; ///< Preset answers from --answers.
    std::string query;
    bool showHelp = false;
};

/**
 * @class DeepResearchApp
 * @brief Owns the lifecycle of one CLI invocation.
 */
class DeepResearchApp {
public:
    DeepResearchApp(std::istream& in = std::cin, std::ostream& out = std::cout);

    /**
     * @brief Runs the research described by the arguments.
     * @return 0 when the run is Done, 1 when it Failed, 2 on usage errors, 3 when cancelled.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Runs a research with already-built collaborators.
     * Used by Run() and by tests that plug in scripted providers.
     */
    int Execute(const CliOptions& options,
                application::ResearchCollaborators collaborators,
                application::PipelineConfig config);

    /** @throws std::invalid_argument on unknown flags or missing values. */
    static CliOptions ParseArguments(const std::vector<std::string>& args);

    /** @brief Splits "a1|a2|a3" into trimmed answers. */
    static std::vector<std::string> SplitAnswers(const std::string& joined);

    static std::string Usage();

private:
    application::ResearchCollaborators BuildCollaborators(const infrastructure::ResearchSettings& settings,
                                                          bool deliver);

    /** @brief Collects one answer per question, from presets or the input stream. */
    std::optional<std::vector<domain::Answer>> CollectAnswers(const std::vector<domain::ClarifyingQuestion>& questions,
                                                              const std::optional<std::vector<std::string>>& presets);

    void PrintEvent(const domain::ProgressEvent& event);

    std::istream& m_in;
    std::ostream& m_out;
};

} // namespace deepresearch::app
