/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

namespace editalflow::infrastructure {

namespace {

template <typename T>
void ReadUnsigned(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<long long>() >= 0)) {
        const unsigned long long parsed = value.get<unsigned long long>();
        if (parsed > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            std::cerr << "[ConfigLoader] Ignoring '" << key << "': value out of range" << std::endl;
            return;
        }
        target = static_cast<T>(parsed);
    } else {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a non-negative integer" << std::endl;
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected an integer" << std::endl;
        return;
    }
    const bool tooLarge = value.is_number_unsigned()
        ? value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())
        : value.get<long long>() > std::numeric_limits<int>::max();
    const bool tooSmall = !value.is_number_unsigned() && value.get<long long>() < std::numeric_limits<int>::min();
    if (tooLarge || tooSmall) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': value out of range" << std::endl;
        return;
    }
    target = static_cast<int>(value.get<long long>());
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    if (value.is_string()) {
        target = value.get<std::string>();
    } else {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a string" << std::endl;
    }
}

} // namespace

void ConfigLoader::Apply(const nlohmann::json& config, domain::AnalysisSettings& settings) {
    if (!config.is_object()) return;

    if (config.contains("ollama") && config["ollama"].is_object()) {
        const auto& ollama = config["ollama"];
        ReadString(ollama, "host", settings.ollama.host);
        ReadInt(ollama, "port", settings.ollama.port);
        ReadString(ollama, "model", settings.ollama.model);
        ReadInt(ollama, "read_timeout_seconds", settings.ollama.readTimeoutSeconds);
    }

    if (config.contains("limits") && config["limits"].is_object()) {
        const auto& limits = config["limits"];
        ReadUnsigned(limits, "max_content_chars", settings.limits.maxContentChars);
        ReadUnsigned(limits, "zip_max_chars", settings.limits.zipMaxChars);
        ReadInt(limits, "zip_max_depth", settings.limits.zipMaxDepth);
        ReadInt(limits, "pdf_max_pages", settings.limits.pdfMaxPages);
        ReadUnsigned(limits, "pdf_min_page_chars", settings.limits.pdfMinPageChars);
    }

    if (config.contains("chunking") && config["chunking"].is_object()) {
        const auto& chunking = config["chunking"];
        ReadUnsigned(chunking, "chunk_size", settings.chunking.chunkSize);
        ReadUnsigned(chunking, "overlap", settings.chunking.overlap);
    }
}

domain::AnalysisSettings ConfigLoader::Load(const std::string& configPath) {
    domain::AnalysisSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        Apply(j, settings);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    return settings;
}

} // namespace editalflow::infrastructure
