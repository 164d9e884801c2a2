/**
 * @file PipelineStage.hpp
 * @brief Value Object defining the ordered stages of an edital analysis.
 */

#pragma once

#include <string>

namespace editalflow::domain {

/**
 * @enum PipelineStage
 * @brief Stages of the analysis, in execution order.
 */
enum class PipelineStage {
    ExtractMetadata,        ///< Reads metadata.json (bid number, city).
    ExtractContent,         ///< Turns the bundle into normalized text.
    GenerateSummary,        ///< Model summary and document fields.
    AnalyzeTarget,          ///< Model judgement on the target topic.
    CheckThreshold,         ///< Quantity estimation against the threshold.
    GenerateJustification,  ///< Final explanation and relevance flag.
    Completed               ///< Terminal marker, no work attached.
};

/**
 * @brief Helper to convert stage to string for display/logging.
 */
inline std::string StageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::ExtractMetadata: return "ExtractMetadata";
        case PipelineStage::ExtractContent: return "ExtractContent";
        case PipelineStage::GenerateSummary: return "GenerateSummary";
        case PipelineStage::AnalyzeTarget: return "AnalyzeTarget";
        case PipelineStage::CheckThreshold: return "CheckThreshold";
        case PipelineStage::GenerateJustification: return "GenerateJustification";
        case PipelineStage::Completed: return "Completed";
        default: return "Unknown";
    }
}

/**
 * @brief Returns the next stage in the canonical sequence.
 */
inline PipelineStage NextStage(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::ExtractMetadata: return PipelineStage::ExtractContent;
        case PipelineStage::ExtractContent: return PipelineStage::GenerateSummary;
        case PipelineStage::GenerateSummary: return PipelineStage::AnalyzeTarget;
        case PipelineStage::AnalyzeTarget: return PipelineStage::CheckThreshold;
        case PipelineStage::CheckThreshold: return PipelineStage::GenerateJustification;
        case PipelineStage::GenerateJustification: return PipelineStage::Completed;
        case PipelineStage::Completed: return PipelineStage::Completed;
        default: return PipelineStage::Completed;
    }
}

} // namespace editalflow::domain
