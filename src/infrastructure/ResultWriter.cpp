/**
 * @file ResultWriter.cpp
 * @brief Implementation of ResultWriter.
 */

#include "infrastructure/ResultWriter.hpp"
#include "infrastructure/MetadataReader.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace editalflow::infrastructure {

namespace {

const char* const kOutputMetadataFields[] = {
    "title", "object", "quantities", "specifications", "deadlines", "values", "phone", "website", "email"
};

} // namespace

nlohmann::ordered_json ResultWriter::ToJson(const domain::PipelineState& state) {
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
    for (const char* field : kOutputMetadataFields) {
        std::string value;
        if (state.metadata.is_object() && state.metadata.contains(field)) {
            value = MetadataReader::ScalarToString(state.metadata[field]);
        }
        metadata[field] = value;
    }

    nlohmann::ordered_json out;
    out["bid_number"] = state.bidNumber;
    out["city"] = state.city;
    out["metadata"] = metadata;
    out["target_match"] = state.targetMatch;
    out["threshold_match"] = domain::ThresholdStatusToString(state.thresholdMatch);
    out["is_relevant"] = state.isRelevant;
    out["summary"] = state.summary;
    out["justification"] = state.justification;
    if (state.hasError) {
        out["error"] = state.errorMessage;
    }
    return out;
}

bool ResultWriter::Write(const domain::PipelineState& state, const std::string& outputPath, std::string& error) {
    fs::path finalPath = outputPath;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            error = "Erro ao criar diretório de saída: " + ec.message();
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            error = "Não foi possível abrir arquivo temporário: " + tempPath.string();
            return false;
        }
        ofs << ToJson(state).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
        ofs.flush();
        if (ofs.fail()) {
            error = "Falha ao gravar " + tempPath.string();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "Falha ao renomear para " + finalPath.string() + ": " + ec.message();
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        return false;
    }
    return true;
}

} // namespace editalflow::infrastructure
