#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/AnalysisPipeline.hpp"
#include "domain/AIService.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using namespace editalflow;
using editalflow::application::AnalysisPipeline;
using editalflow::domain::PipelineStage;
using editalflow::domain::ThresholdStatus;
using editalflow::test::Contains;

// Mock AI Service: answers by response schema title and counts the calls.
class MockAIService : public domain::AIService {
public:
    std::optional<std::string> summaryResponse = std::string(
        R"({"summary": "Pregão para aquisição de 750 notebooks.", "city": "Curitiba/PR",
            "title": "Pregão Eletrônico 001/2024", "object": "Aquisição de notebooks", "email": "  "})");
    std::optional<std::string> targetResponse = std::string(
        R"({"is_relevant": true, "confidence": 0.9, "matching_terms": ["notebook"], "explanation": "Objeto é notebook."})");
    std::optional<std::string> quantityResponse = std::string(
        R"({"total_quantity": 750, "unit": "notebooks", "explanation": "Item 1 do termo de referência"})");
    std::optional<std::string> justificationResponse = std::string("Edital de notebooks com quantidade suficiente.");

    int summaryCalls = 0;
    int targetCalls = 0;
    int quantityCalls = 0;
    int justificationCalls = 0;
    std::vector<std::string> quantityPrompts;

    std::optional<std::string> generateJson(const std::string&, const std::string& userPrompt,
                                            const nlohmann::json& responseSchema) override {
        const std::string title = responseSchema.value("title", "");
        if (title == "SummaryAnalysis") {
            ++summaryCalls;
            return summaryResponse;
        }
        if (title == "TargetAnalysis") {
            ++targetCalls;
            return targetResponse;
        }
        if (title == "QuantitiesAnalysis") {
            ++quantityCalls;
            quantityPrompts.push_back(userPrompt);
            return quantityResponse;
        }
        return std::nullopt;
    }

    std::optional<std::string> generateText(const std::string&, const std::string&) override {
        ++justificationCalls;
        return justificationResponse;
    }

    std::string getCurrentModel() const override { return "mock"; }
};

namespace {

domain::AnalysisSettings Settings(const std::string& target, int threshold, bool forceMatch = false) {
    domain::AnalysisSettings settings;
    settings.target = target;
    settings.threshold = threshold;
    settings.forceMatch = forceMatch;
    return settings;
}

void AssertTerminalError(const domain::PipelineState& state) {
    assert(state.hasError);
    assert(!state.errorMessage.empty());
    assert(!state.justification.empty());
    assert(!state.targetMatch);
    assert(state.thresholdMatch == ThresholdStatus::Inconclusive);
    assert(!state.isRelevant);
}

} // namespace

int main() {
    std::cout << "[Test] Starting AnalysisPipeline Test..." << std::endl;

    auto root = test::MakeTempDir("editalflow_pipeline");
    auto bundle = root / "edital_001";
    test::WriteFile(bundle / "metadata.json",
                    R"({"bid_number": 1234, "agency": "Prefeitura de Londrina - PR", "target": "x", "threshold": 9})");
    test::WriteFile(bundle / "edital.txt",
                    "PREGÃO ELETRÔNICO 001/2024. Objeto: aquisição de 750 notebooks para as escolas municipais.");

    std::cout << "[Test] Relevant with sufficient quantity..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        std::vector<std::string> stages;
        auto state = pipeline.run(bundle.string(), [&stages](std::string msg) { stages.push_back(msg); });
        assert(!state.hasError);
        assert(state.bidNumber == "1234");
        assert(state.city == "Curitiba/PR" && "City from the model wins.");
        assert(state.targetMatch);
        assert(state.thresholdMatch == ThresholdStatus::True);
        assert(state.isRelevant);
        assert(state.summary == "Pregão para aquisição de 750 notebooks.");
        assert(state.justification == "Edital de notebooks com quantidade suficiente.");
        assert(state.metadata["title"] == "Pregão Eletrônico 001/2024");
        assert(!state.metadata.contains("email") && "Blank model fields are not copied.");
        assert(!state.metadata.contains("threshold"));
        assert(state.metadata["quantities"] == "750 notebooks - Item 1 do termo de referência");
        assert(ai->summaryCalls == 1 && ai->targetCalls == 1 && ai->quantityCalls == 1 && ai->justificationCalls == 1);
        assert(Contains(ai->quantityPrompts[0], "750 notebooks"));
        assert(stages.size() == 7);
        assert(Contains(stages[0], "ExtractMetadata"));
    }

    std::cout << "[Test] Relevant but insufficient quantity..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->justificationResponse = std::string("  \n");
        AnalysisPipeline pipeline(Settings("notebook", 1000), ai);
        auto state = pipeline.run(bundle.string());
        assert(!state.hasError);
        assert(state.targetMatch);
        assert(state.thresholdMatch == ThresholdStatus::False);
        assert(!state.isRelevant);
        assert(!state.justification.empty() && "Blank model justification falls back to a local text.");
        assert(Contains(state.justification, "1000"));
    }

    std::cout << "[Test] Service target without threshold..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        AnalysisPipeline pipeline(Settings("RPA", 0), ai);
        auto state = pipeline.run(bundle.string());
        assert(state.thresholdMatch == ThresholdStatus::True);
        assert(state.isRelevant);
        assert(ai->quantityCalls == 0);
    }

    std::cout << "[Test] Unmatched target skips quantities..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->targetResponse = std::string(R"({"is_relevant": false, "explanation": "Objeto é mobiliário."})");
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        auto state = pipeline.run(bundle.string());
        assert(!state.targetMatch);
        assert(state.thresholdMatch == ThresholdStatus::False);
        assert(!state.isRelevant);
        assert(ai->quantityCalls == 0);
        assert(!state.justification.empty());
    }

    std::cout << "[Test] forceMatch overrides the model..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->targetResponse = std::string(R"({"is_relevant": false, "explanation": "Nada relacionado."})");
        AnalysisPipeline pipeline(Settings("notebook", 0, true), ai);
        auto state = pipeline.run(bundle.string());
        assert(state.targetMatch);
        assert(state.isRelevant);
    }

    std::cout << "[Test] Malformed quantity answers..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->quantityResponse = std::string(R"({"total_quantity": -4, "unit": "", "explanation": "?"})");
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        auto state = pipeline.run(bundle.string());
        assert(!state.hasError && "A malformed estimate is not a pipeline failure.");
        assert(state.thresholdMatch == ThresholdStatus::Inconclusive);
        assert(!state.isRelevant);
        assert(Contains(state.metadata["quantities"].get<std::string>(), "Erro ao processar quantidades"));
    }

    std::cout << "[Test] Summary failure stops the pipeline..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->summaryResponse = std::nullopt;
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        auto state = pipeline.run(bundle.string());
        AssertTerminalError(state);
        assert(state.errorMessage.rfind("Erro em GenerateSummary: ", 0) == 0);
        assert(state.failedStage == PipelineStage::GenerateSummary);
        assert(ai->targetCalls == 0 && ai->quantityCalls == 0 && ai->justificationCalls == 0);
        assert(state.bidNumber == "1234" && "Fields set before the failure survive.");
    }

    std::cout << "[Test] Malformed target JSON..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->targetResponse = std::string("{\"is_relevant\": \"talvez\"}");
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        auto state = pipeline.run(bundle.string());
        AssertTerminalError(state);
        assert(state.errorMessage.rfind("Erro em AnalyzeTarget: ", 0) == 0);
    }

    std::cout << "[Test] City falls back to metadata..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        ai->summaryResponse = std::string(R"({"summary": "Resumo.", "city": ""})");
        AnalysisPipeline pipeline(Settings("notebook", 0), ai);
        auto state = pipeline.run(bundle.string());
        assert(state.city == "Prefeitura de Londrina/PR");
    }

    std::cout << "[Test] Only metadata..." << std::endl;
    {
        auto onlyMetadata = root / "so_metadata";
        test::WriteFile(onlyMetadata / "metadata.json", R"({"bid_number": "55"})");
        auto ai = std::make_shared<MockAIService>();
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        auto state = pipeline.run(onlyMetadata.string());
        AssertTerminalError(state);
        assert(state.bidNumber == "55");
        assert(state.justification.rfind("Conteúdo insuficiente para análise: ", 0) == 0);
        assert(state.failedStage == PipelineStage::ExtractContent);
        assert(ai->summaryCalls == 0);
    }

    std::cout << "[Test] Document too large..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        auto settings = Settings("notebook", 500);
        settings.limits.maxContentChars = 40;
        AnalysisPipeline pipeline(settings, ai);
        auto state = pipeline.run(bundle.string());
        AssertTerminalError(state);
        assert(Contains(state.justification, "muito grande"));
        assert(Contains(state.justification, "limite: 40 caracteres"));
        assert(ai->summaryCalls == 0);
    }

    std::cout << "[Test] Missing bundle..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        auto state = pipeline.run((root / "nao_existe").string());
        AssertTerminalError(state);
        assert(state.bidNumber == "N/A");
        assert(Contains(state.errorMessage, "nao_existe"));
    }

    std::cout << "[Test] Cancellation..." << std::endl;
    {
        auto ai = std::make_shared<MockAIService>();
        AnalysisPipeline pipeline(Settings("notebook", 500), ai);
        int checks = 0;
        auto state = pipeline.run(bundle.string(), nullptr, [&checks]() { return ++checks > 2; });
        AssertTerminalError(state);
        assert(state.errorMessage == "Erro em GenerateSummary: Análise cancelada");
        assert(ai->summaryCalls == 0);
    }

    fs::remove_all(root);
    std::cout << "[PASS] AnalysisPipeline Test passed!" << std::endl;
    return 0;
}
