/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the prompts and response schemas of the analysis stages.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace editalflow::infrastructure {

class PromptCatalog {
public:
    /** @brief Summary and document fields (title, object, contacts...). */
    static std::string GetSummarySystemPrompt();
    static nlohmann::json GetSummarySchema();
    static std::string BuildSummaryPrompt(const std::string& content, const nlohmann::json& metadata);

    /** @brief Relevance of the summary to the target topic. */
    static std::string GetTargetSystemPrompt();
    static nlohmann::json GetTargetSchema();
    static std::string BuildTargetPrompt(const std::string& target, const std::string& summary,
                                         const nlohmann::json& metadata);

    /** @brief Quantity of the target item in one chunk of the document. */
    static std::string GetQuantitySystemPrompt();
    static nlohmann::json GetQuantitySchema();
    static std::string BuildQuantityPrompt(const std::string& target, int threshold, const std::string& chunkText,
                                           std::size_t chunkIndex, std::size_t chunkCount);

    /** @brief Final free-text justification. */
    static std::string GetJustificationSystemPrompt();
    static std::string BuildJustificationPrompt(const std::string& target, bool targetMatch,
                                                const std::string& thresholdMatch, int threshold,
                                                const std::string& summary);
};

} // namespace editalflow::infrastructure
