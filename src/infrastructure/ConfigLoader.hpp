/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the analysis configuration (settings.json).
 *
 * Keeps JSON parsing of limits, chunking and Ollama settings in one place instead of
 * scattering it through the codebase.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "domain/AnalysisSettings.hpp"

namespace editalflow::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json. Missing file, parse errors and values of the wrong type
     *        leave the defaults in place; problems are logged to stderr.
     * @param configPath Path of the settings file.
     * @return Settings with target/threshold/forceMatch left at their defaults.
     */
    static domain::AnalysisSettings Load(const std::string& configPath);

    /** @brief Applies the keys present in an already parsed settings object. */
    static void Apply(const nlohmann::json& config, domain::AnalysisSettings& settings);
};

} // namespace editalflow::infrastructure
