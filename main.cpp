#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "application/AnalysisPipeline.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ResultWriter.hpp"

namespace fs = std::filesystem;
using namespace editalflow;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) {
    g_interrupted = true;
}

// === OPÇÕES DE LINHA DE COMANDO ===
struct CliOptions {
    std::string bundlePath;
    std::string target;
    std::string outputPath = "llmResponse.json";
    std::string configPath;
    std::string model;
    int threshold = 0;
    bool forceMatch = false;
    bool verbose = false;
};

void PrintUsage(const char* program) {
    std::cerr << "Uso: " << program << " <diretorio_edital> --target <texto> [--threshold N] [--output ARQUIVO]\n"
              << "       [--force-match] [--config settings.json] [--model NOME] [-v]\n\n"
              << "  --target       Tema procurado no edital (obrigatório)\n"
              << "  --threshold    Quantidade mínima do item; 0 desativa a verificação (padrão: 0)\n"
              << "  --output       Arquivo JSON de saída (padrão: llmResponse.json)\n"
              << "  --force-match  Considera o alvo encontrado independentemente do modelo\n"
              << "  --config       Arquivo de configuração (padrão: "
              << infrastructure::PathUtils::GetDefaultSettingsPath().string() << ")\n"
              << "  --model        Modelo Ollama a usar\n"
              << "  -v             Mostra o progresso de cada etapa\n";
}

bool ParseThreshold(const std::string& text, int& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || parsed < 0 || parsed > 1000000000L) return false;
    value = static_cast<int>(parsed);
    return true;
}

bool ParseArguments(int argc, char** argv, CliOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = "Valor ausente para " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--target") {
            if (!requireValue(options.target)) return false;
        } else if (arg == "--threshold") {
            std::string value;
            if (!requireValue(value)) return false;
            if (!ParseThreshold(value, options.threshold)) {
                error = "Threshold inválido: " + value;
                return false;
            }
        } else if (arg == "--output") {
            if (!requireValue(options.outputPath)) return false;
        } else if (arg == "--config") {
            if (!requireValue(options.configPath)) return false;
        } else if (arg == "--model") {
            if (!requireValue(options.model)) return false;
        } else if (arg == "--force-match") {
            options.forceMatch = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Opção desconhecida: " + arg;
            return false;
        } else if (options.bundlePath.empty()) {
            options.bundlePath = arg;
        } else {
            error = "Argumento inesperado: " + arg;
            return false;
        }
    }

    if (options.bundlePath.empty()) {
        error = "Diretório do edital não informado";
        return false;
    }
    if (options.target.empty()) {
        error = "--target é obrigatório";
        return false;
    }
    return true;
}

void PrintSummary(const domain::PipelineState& state, const std::string& outputPath) {
    std::cout << "\n=== Resultado da análise ===\n"
              << "Edital:            " << state.bidNumber << "\n"
              << "Cidade:            " << (state.city.empty() ? "-" : state.city) << "\n"
              << "Alvo encontrado:   " << (state.targetMatch ? "sim" : "não") << "\n"
              << "Quantidade:        " << domain::ThresholdStatusToString(state.thresholdMatch) << "\n"
              << "Relevante:         " << (state.isRelevant ? "sim" : "não") << "\n"
              << "Justificativa:     " << state.justification << "\n";
    if (state.hasError) {
        std::cout << "Erro:              " << state.errorMessage << "\n";
    }
    std::cout << "Resultado salvo em " << outputPath << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[CLI] " << error << "\n\n";
        PrintUsage(argv[0]);
        return 1;
    }

    std::string configPath = options.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultSettingsPath().string()
        : options.configPath;
    domain::AnalysisSettings settings = infrastructure::ConfigLoader::Load(configPath);
    settings.target = options.target;
    settings.threshold = options.threshold;
    settings.forceMatch = options.forceMatch;
    if (!options.model.empty()) {
        settings.ollama.model = options.model;
    }

    std::signal(SIGINT, HandleInterrupt);

    auto ai = std::make_shared<infrastructure::OllamaAdapter>(settings.ollama);
    ai->initialize();

    std::cout << "[CLI] Analisando " << fs::path(options.bundlePath).filename().string()
              << " (alvo: '" << settings.target << "', quantidade mínima: " << settings.threshold
              << ", modelo: " << ai->getCurrentModel() << ")" << std::endl;

    application::AnalysisPipeline pipeline(settings, ai);

    application::AnalysisPipeline::StatusCallback status = nullptr;
    if (options.verbose) {
        status = [](std::string message) { std::cout << "[AnalysisPipeline] " << message << std::endl; };
    }
    auto state = pipeline.run(options.bundlePath, status, []() { return g_interrupted.load(); });

    if (g_interrupted) {
        std::cerr << "[CLI] Análise interrompida" << std::endl;
    }

    if (!infrastructure::ResultWriter::Write(state, options.outputPath, error)) {
        std::cerr << "[ResultWriter] " << error << std::endl;
        return 1;
    }

    PrintSummary(state, options.outputPath);
    return g_interrupted ? 130 : 0;
}
