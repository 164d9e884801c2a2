/**
 * @file AnalysisPipeline.hpp
 * @brief Staged analysis of one bidding-document bundle against a target.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "application/DirectoryIngestor.hpp"
#include "domain/AIService.hpp"
#include "domain/AnalysisSettings.hpp"
#include "domain/PipelineStage.hpp"
#include "domain/PipelineState.hpp"

namespace editalflow::application {

/**
 * @class AnalysisPipeline
 * @brief Runs ExtractMetadata → ExtractContent → GenerateSummary → AnalyzeTarget →
 *        CheckThreshold → GenerateJustification on a fresh PipelineState.
 *
 * A stage either succeeds, returns a classified PipelineFault, or throws. Faults and
 * exceptions both end the run in the terminal error state; later stages are skipped.
 * One instance serves one run at a time.
 */
class AnalysisPipeline {
public:
    using StatusCallback = std::function<void(std::string)>;
    using CancellationCheck = std::function<bool()>;

    AnalysisPipeline(domain::AnalysisSettings settings, std::shared_ptr<domain::AIService> aiService);

    /** @brief Same, with an ingestor built by the caller (custom PDF backends, scratch root). */
    AnalysisPipeline(domain::AnalysisSettings settings,
                     std::shared_ptr<domain::AIService> aiService,
                     std::unique_ptr<DirectoryIngestor> ingestor);

    /**
     * @brief Analyzes a bundle.
     * @param bundlePath Bundle directory.
     * @param statusCallback Receives a line as each stage starts.
     * @param isCancelled Checked before every stage; true ends the run as cancelled.
     * @return Completed record, or the terminal error record.
     */
    domain::PipelineState run(const std::string& bundlePath,
                              StatusCallback statusCallback = nullptr,
                              CancellationCheck isCancelled = nullptr);

    /** @brief Local justification used when the model returns blank text. */
    static std::string FallbackJustification(const domain::PipelineState& state, const std::string& target,
                                             int threshold);

private:
    std::optional<domain::PipelineFault> runGuarded(domain::PipelineStage stage, domain::PipelineState& state);
    std::optional<domain::PipelineFault> runStage(domain::PipelineStage stage, domain::PipelineState& state);

    std::optional<domain::PipelineFault> extractMetadata(domain::PipelineState& state);
    std::optional<domain::PipelineFault> extractContent(domain::PipelineState& state);
    std::optional<domain::PipelineFault> generateSummary(domain::PipelineState& state);
    std::optional<domain::PipelineFault> analyzeTarget(domain::PipelineState& state);
    std::optional<domain::PipelineFault> checkThreshold(domain::PipelineState& state);
    std::optional<domain::PipelineFault> generateJustification(domain::PipelineState& state);

    static void ApplyFault(domain::PipelineState& state, domain::PipelineStage stage,
                           const domain::PipelineFault& fault);

    domain::AnalysisSettings m_settings;
    std::shared_ptr<domain::AIService> m_aiService;
    std::unique_ptr<DirectoryIngestor> m_ingestor;
};

} // namespace editalflow::application
