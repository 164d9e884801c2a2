#include <cassert>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ResultWriter.hpp"
#include "TestSupport.hpp"

using namespace editalflow;
using editalflow::infrastructure::ResultWriter;

int main() {
    std::cout << "[Test] Starting ResultWriter Test..." << std::endl;

    domain::PipelineState state;
    state.bidNumber = "001/2024";
    state.city = "Curitiba/PR";
    state.metadata = {{"title", "Pregão 001"}, {"agency", "Prefeitura"}, {"quantities", "750 notebooks - item 1"}};
    state.content = "texto completo do edital";
    state.targetMatch = true;
    state.thresholdMatch = domain::ThresholdStatus::True;
    state.isRelevant = true;
    state.summary = "Resumo.";
    state.justification = "Quantidade suficiente.";

    auto json = ResultWriter::ToJson(state);
    assert(json["bid_number"] == "001/2024");
    assert(json["threshold_match"] == "true");
    assert(json["metadata"]["title"] == "Pregão 001");
    assert(json["metadata"]["email"] == "");
    assert(!json["metadata"].contains("agency"));
    assert(!json.contains("content") && "The document text is never written out.");
    assert(!json.contains("error"));

    auto dir = test::MakeTempDir("editalflow_writer");
    auto output = dir / "saida" / "llmResponse.json";
    std::string error;
    assert(ResultWriter::Write(state, output.string(), error));
    auto written = nlohmann::json::parse(test::ReadFile(output));
    assert(written["is_relevant"] == true);
    assert(written["justification"] == "Quantidade suficiente.");

    state.hasError = true;
    state.errorMessage = "Erro em GenerateSummary: sem resposta";
    state.thresholdMatch = domain::ThresholdStatus::Inconclusive;
    assert(ResultWriter::Write(state, output.string(), error));
    written = nlohmann::json::parse(test::ReadFile(output));
    assert(written["error"] == "Erro em GenerateSummary: sem resposta");
    assert(written["threshold_match"] == "inconclusive");

    int files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir / "saida")) {
        (void)entry;
        ++files;
    }
    assert(files == 1 && "No temporary file is left behind.");

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] ResultWriter Test passed!" << std::endl;
    return 0;
}
