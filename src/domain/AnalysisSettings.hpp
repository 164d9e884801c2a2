/**
 * @file AnalysisSettings.hpp
 * @brief Configuration handed to the ingestion layer and the analysis pipeline.
 */

#pragma once
#include <cstddef>
#include <string>

namespace editalflow::domain {

/**
 * @struct ExtractionLimits
 * @brief Bounds applied while turning files into text.
 */
struct ExtractionLimits {
    std::size_t maxContentChars = 200000; ///< Ceiling for the whole bundle.
    std::size_t zipMaxChars = 50000;      ///< Ceiling for the text of one archive.
    int zipMaxDepth = 3;
    int pdfMaxPages = 20;
    std::size_t pdfMinPageChars = 50;     ///< Pages at or below this are dropped.
};

struct ChunkingSettings {
    std::size_t chunkSize = 15000;
    std::size_t overlap = 1000;
};

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model;                    ///< Empty: auto-detect from installed models.
    int readTimeoutSeconds = 600;
};

/**
 * @struct AnalysisSettings
 * @brief Everything one analysis run needs besides the bundle path.
 */
struct AnalysisSettings {
    std::string target;
    int threshold = 0;                    ///< 0 disables quantity gating.
    bool forceMatch = false;

    ExtractionLimits limits;
    ChunkingSettings chunking;
    OllamaSettings ollama;
};

} // namespace editalflow::domain
