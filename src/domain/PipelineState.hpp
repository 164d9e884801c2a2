/**
 * @file PipelineState.hpp
 * @brief The record threaded through every stage of one edital analysis.
 */

#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/PipelineStage.hpp"
#include "domain/Quantity.hpp"

namespace editalflow::domain {

/**
 * @struct PipelineState
 * @brief Mutable analysis record owned by a single pipeline run.
 *
 * Once hasError is set the record is terminal: later stages are skipped and nothing
 * clears the flag.
 */
struct PipelineState {
    std::string bundlePath;
    std::string bidNumber = "N/A";
    std::string city;
    nlohmann::json metadata = nlohmann::json::object();
    std::string content; ///< Normalized bundle text; never written to the output record.

    bool targetMatch = false;
    ThresholdStatus thresholdMatch = ThresholdStatus::Inconclusive;
    bool isRelevant = false;
    std::string summary;
    std::string justification;

    bool hasError = false;
    std::string errorMessage;
    std::optional<PipelineStage> failedStage;
};

/**
 * @struct PipelineFault
 * @brief Expected, classified failure returned by a stage.
 */
struct PipelineFault {
    std::string errorMessage;
    std::string justification;
};

} // namespace editalflow::domain
