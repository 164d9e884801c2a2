/**
 * @file AnalysisPipeline.cpp
 * @brief Implementation of AnalysisPipeline.
 */

#include "application/AnalysisPipeline.hpp"
#include "application/ChunkSplitter.hpp"
#include "application/ContentSizeGuard.hpp"
#include "application/QuantityReconciler.hpp"
#include "infrastructure/MetadataReader.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace editalflow::application {

namespace {

const char* const kUndeterminedCity = "Não foi possível determinar";

const char* const kSummaryFields[] = {
    "title", "object", "quantities", "specifications", "deadlines", "values", "phone", "website", "email"
};

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

nlohmann::json ParseModelObject(const std::string& raw, const std::string& what) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Resposta JSON inválida do modelo (" + what + "): " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Resposta do modelo (" + what + ") não é um objeto JSON");
    }
    return data;
}

} // namespace

AnalysisPipeline::AnalysisPipeline(domain::AnalysisSettings settings, std::shared_ptr<domain::AIService> aiService)
    : m_settings(std::move(settings)),
      m_aiService(std::move(aiService)) {
    m_ingestor = std::make_unique<DirectoryIngestor>(m_settings.limits);
}

AnalysisPipeline::AnalysisPipeline(domain::AnalysisSettings settings,
                                   std::shared_ptr<domain::AIService> aiService,
                                   std::unique_ptr<DirectoryIngestor> ingestor)
    : m_settings(std::move(settings)),
      m_aiService(std::move(aiService)),
      m_ingestor(std::move(ingestor)) {
    if (!m_ingestor) {
        m_ingestor = std::make_unique<DirectoryIngestor>(m_settings.limits);
    }
}

domain::PipelineState AnalysisPipeline::run(const std::string& bundlePath,
                                            StatusCallback statusCallback,
                                            CancellationCheck isCancelled) {
    domain::PipelineState state;
    state.bundlePath = bundlePath;

    for (auto stage = domain::PipelineStage::ExtractMetadata;
         stage != domain::PipelineStage::Completed;
         stage = domain::NextStage(stage)) {
        if (state.hasError) break;

        if (isCancelled && isCancelled()) {
            ApplyFault(state, stage, {"Erro em " + domain::StageToString(stage) + ": Análise cancelada",
                                      "Análise cancelada antes da conclusão."});
            break;
        }

        if (statusCallback) statusCallback("Etapa: " + domain::StageToString(stage));

        if (auto fault = runGuarded(stage, state)) {
            ApplyFault(state, stage, *fault);
        }
    }

    if (state.hasError) {
        std::cerr << "[AnalysisPipeline] " << state.errorMessage << std::endl;
    } else if (statusCallback) {
        statusCallback("Análise concluída");
    }
    return state;
}

std::optional<domain::PipelineFault> AnalysisPipeline::runGuarded(domain::PipelineStage stage,
                                                                  domain::PipelineState& state) {
    try {
        return runStage(stage, state);
    } catch (const std::exception& e) {
        const std::string message = "Erro em " + domain::StageToString(stage) + ": " + e.what();
        return domain::PipelineFault{message, message};
    }
}

std::optional<domain::PipelineFault> AnalysisPipeline::runStage(domain::PipelineStage stage,
                                                                domain::PipelineState& state) {
    switch (stage) {
        case domain::PipelineStage::ExtractMetadata: return extractMetadata(state);
        case domain::PipelineStage::ExtractContent: return extractContent(state);
        case domain::PipelineStage::GenerateSummary: return generateSummary(state);
        case domain::PipelineStage::AnalyzeTarget: return analyzeTarget(state);
        case domain::PipelineStage::CheckThreshold: return checkThreshold(state);
        case domain::PipelineStage::GenerateJustification: return generateJustification(state);
        case domain::PipelineStage::Completed: return std::nullopt;
    }
    return std::nullopt;
}

std::optional<domain::PipelineFault> AnalysisPipeline::extractMetadata(domain::PipelineState& state) {
    auto metadata = infrastructure::MetadataReader::Read(state.bundlePath);
    state.metadata = metadata.fields;
    state.bidNumber = metadata.bidNumber;
    state.city = metadata.city;
    return std::nullopt;
}

std::optional<domain::PipelineFault> AnalysisPipeline::extractContent(domain::PipelineState& state) {
    auto ingestion = m_ingestor->ingest(state.bundlePath, m_settings.limits.maxContentChars);
    if (ingestion.ok()) {
        state.content = std::move(ingestion.text);
        return std::nullopt;
    }

    const auto& error = *ingestion.error;
    switch (error.kind) {
        case domain::IngestionErrorKind::DocumentTooLarge:
            return domain::PipelineFault{error.message, ContentSizeGuard::Justification(error)};
        case domain::IngestionErrorKind::InsufficientContent:
            return domain::PipelineFault{error.message, "Conteúdo insuficiente para análise: " + error.message};
        case domain::IngestionErrorKind::FileNotFound:
            return domain::PipelineFault{error.message, "Erro ao processar edital: " + error.message};
        default:
            return domain::PipelineFault{"Erro ao extrair conteúdo: " + error.message,
                                         "Erro ao extrair conteúdo: " + error.message};
    }
}

std::optional<domain::PipelineFault> AnalysisPipeline::generateSummary(domain::PipelineState& state) {
    using infrastructure::PromptCatalog;

    auto response = m_aiService->generateJson(PromptCatalog::GetSummarySystemPrompt(),
                                              PromptCatalog::BuildSummaryPrompt(state.content, state.metadata),
                                              PromptCatalog::GetSummarySchema());
    if (!response) {
        throw std::runtime_error("Sem resposta do modelo para o resumo");
    }

    auto data = ParseModelObject(*response, "resumo");
    if (!data.contains("summary") || !data["summary"].is_string()) {
        throw std::runtime_error("Resposta do resumo sem o campo 'summary'");
    }
    state.summary = data["summary"].get<std::string>();

    std::string modelCity;
    if (data.contains("city")) {
        modelCity = Trim(infrastructure::MetadataReader::ScalarToString(data["city"]));
    }
    if (!modelCity.empty()) {
        state.city = modelCity;
    } else if (state.city.empty()) {
        state.city = kUndeterminedCity;
    }

    for (const char* field : kSummaryFields) {
        if (!data.contains(field)) continue;
        std::string value = Trim(infrastructure::MetadataReader::ScalarToString(data[field]));
        if (!value.empty()) {
            state.metadata[field] = value;
        }
    }
    return std::nullopt;
}

std::optional<domain::PipelineFault> AnalysisPipeline::analyzeTarget(domain::PipelineState& state) {
    using infrastructure::PromptCatalog;

    auto response = m_aiService->generateJson(
        PromptCatalog::GetTargetSystemPrompt(),
        PromptCatalog::BuildTargetPrompt(m_settings.target, state.summary, state.metadata),
        PromptCatalog::GetTargetSchema());
    if (!response) {
        throw std::runtime_error("Sem resposta do modelo para a análise do alvo");
    }

    auto data = ParseModelObject(*response, "alvo");
    if (!data.contains("is_relevant") || !data["is_relevant"].is_boolean()) {
        throw std::runtime_error("Resposta da análise do alvo sem o campo booleano 'is_relevant'");
    }
    state.targetMatch = data["is_relevant"].get<bool>();

    if (m_settings.forceMatch) {
        if (!state.targetMatch) {
            std::cout << "[AnalysisPipeline] Correspondência forçada para o alvo '" << m_settings.target << "'" << std::endl;
        }
        state.targetMatch = true;
    }
    return std::nullopt;
}

std::optional<domain::PipelineFault> AnalysisPipeline::checkThreshold(domain::PipelineState& state) {
    using infrastructure::PromptCatalog;

    if (m_settings.threshold <= 0) {
        state.thresholdMatch = domain::ThresholdStatus::True;
        return std::nullopt;
    }
    if (!state.targetMatch) {
        state.thresholdMatch = domain::ThresholdStatus::False;
        return std::nullopt;
    }

    auto chunks = ChunkSplitter::Split(state.content, m_settings.chunking.chunkSize, m_settings.chunking.overlap);
    std::vector<std::string> responses;
    responses.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        auto response = m_aiService->generateJson(
            PromptCatalog::GetQuantitySystemPrompt(),
            PromptCatalog::BuildQuantityPrompt(m_settings.target, m_settings.threshold, chunk.text,
                                               chunk.index, chunks.size()),
            PromptCatalog::GetQuantitySchema());
        if (!response) {
            throw std::runtime_error("Sem resposta do modelo para o trecho " + std::to_string(chunk.index + 1) +
                                     "/" + std::to_string(chunks.size()));
        }
        responses.push_back(*response);
    }

    auto reconciled = QuantityReconciler::ReconcileResponses(responses, m_settings.threshold, state.targetMatch);
    state.thresholdMatch = reconciled.thresholdStatus;

    if (reconciled.unit.empty()) {
        state.metadata["quantities"] = "Erro ao processar quantidades: resposta inválida";
    } else {
        state.metadata["quantities"] = std::to_string(reconciled.totalQuantity) + " " + reconciled.unit +
                                       " - " + reconciled.explanation;
    }
    if (reconciled.anomalies > 0) {
        std::cerr << "[AnalysisPipeline] " << reconciled.anomalies << " de " << responses.size()
                  << " estimativas de quantidade descartadas" << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::PipelineFault> AnalysisPipeline::generateJustification(domain::PipelineState& state) {
    using infrastructure::PromptCatalog;

    auto response = m_aiService->generateText(
        PromptCatalog::GetJustificationSystemPrompt(),
        PromptCatalog::BuildJustificationPrompt(m_settings.target, state.targetMatch,
                                                domain::ThresholdStatusToString(state.thresholdMatch),
                                                m_settings.threshold, state.summary));
    if (!response) {
        throw std::runtime_error("Sem resposta do modelo para a justificativa");
    }

    state.isRelevant = state.targetMatch &&
                       (m_settings.threshold <= 0 || state.thresholdMatch == domain::ThresholdStatus::True);

    std::string justification = Trim(*response);
    if (justification.empty()) {
        justification = FallbackJustification(state, m_settings.target, m_settings.threshold);
    }
    state.justification = justification;
    return std::nullopt;
}

std::string AnalysisPipeline::FallbackJustification(const domain::PipelineState& state, const std::string& target,
                                                    int threshold) {
    const std::string quoted = "'" + target + "'";
    if (!state.targetMatch) {
        return "O edital não menciona itens ou serviços relacionados a " + quoted + ".";
    }
    if (threshold > 0 && state.thresholdMatch == domain::ThresholdStatus::False) {
        return "O edital trata de " + quoted + ", mas a quantidade identificada não atinge o mínimo de " +
               std::to_string(threshold) + ".";
    }
    if (threshold > 0 && state.thresholdMatch == domain::ThresholdStatus::Inconclusive) {
        return "O edital trata de " + quoted + ", mas não foi possível determinar a quantidade para comparar com o mínimo de " +
               std::to_string(threshold) + ".";
    }
    if (threshold > 0) {
        return "O edital trata de " + quoted + " e a quantidade identificada atende ao mínimo de " +
               std::to_string(threshold) + ".";
    }
    return "O edital é relevante para " + quoted + ".";
}

void AnalysisPipeline::ApplyFault(domain::PipelineState& state, domain::PipelineStage stage,
                                  const domain::PipelineFault& fault) {
    state.hasError = true;
    state.errorMessage = fault.errorMessage;
    state.justification = fault.justification.empty() ? fault.errorMessage : fault.justification;
    state.targetMatch = false;
    state.thresholdMatch = domain::ThresholdStatus::Inconclusive;
    state.isRelevant = false;
    state.failedStage = stage;
}

} // namespace editalflow::application
