/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the instructions of every research stage.
 */

#pragma once

#include <cstddef>
#include <string>

namespace deepresearch::infrastructure {

class PromptCatalog {
public:
    /** @brief Rewrites a raw topic into a focused research query. */
    static std::string GetOptimizerPrompt();

    /** @brief Asks for exactly count clarifying questions. */
    static std::string GetQuestionsPrompt(std::size_t count);

    /** @brief Asks for count web searches, each with a reason. */
    static std::string GetPlannerPrompt(std::size_t count);

    /** @brief Summarizes raw search results for one term. */
    static std::string GetSearchSummaryPrompt();

    /** @brief Writes the final markdown report. */
    static std::string GetWriterPrompt();
};

} // namespace deepresearch::infrastructure
