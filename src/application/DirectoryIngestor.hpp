/**
 * @file DirectoryIngestor.hpp
 * @brief Turns a bundle directory into one normalized, size-checked text.
 */

#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "domain/AnalysisSettings.hpp"
#include "domain/IngestionError.hpp"
#include "domain/SourceArtifact.hpp"
#include "infrastructure/ArchiveExtractor.hpp"
#include "infrastructure/FormatExtractor.hpp"

namespace editalflow::application {

/**
 * @class DirectoryIngestor
 * @brief Walks a bundle, extracts every file and applies the minimum-content rules.
 *
 * metadata.json is extracted with the other files but never counts as content: a
 * bundle needs at least one content file that yields text.
 */
class DirectoryIngestor {
public:
    /**
     * @struct IngestionResult
     * @brief Aggregate text of a bundle, or the error that stopped ingestion.
     */
    struct IngestionResult {
        std::string text;
        std::optional<domain::IngestionError> error;
        std::size_t contentFiles = 0;
        std::size_t processed = 0;
        std::size_t failed = 0;
        std::vector<std::string> failedFiles;

        bool ok() const { return !error.has_value(); }
    };

    explicit DirectoryIngestor(const domain::ExtractionLimits& limits);

    /**
     * @param limits Extraction bounds.
     * @param pdfBackends PDF strategies, in the order they are tried.
     * @param scratchRoot Parent of archive scratch directories; system temp when empty.
     */
    DirectoryIngestor(const domain::ExtractionLimits& limits,
                      std::vector<infrastructure::PdfExtractor::Backend> pdfBackends,
                      std::filesystem::path scratchRoot = {});

    DirectoryIngestor(const DirectoryIngestor&) = delete;
    DirectoryIngestor& operator=(const DirectoryIngestor&) = delete;

    /** @brief Ingests with the configured maxContentChars ceiling. */
    IngestionResult ingest(const std::string& bundlePath) const;

    /**
     * @brief Ingests a bundle.
     * @param bundlePath Bundle directory.
     * @param maxChars Ceiling for the normalized aggregate, in code points.
     * @return Text, or FileNotFound, InsufficientContent or DocumentTooLarge.
     */
    IngestionResult ingest(const std::string& bundlePath, std::size_t maxChars) const;

    /** @brief Extracts one bundle file, ZIPs through ArchiveExtractor. */
    domain::ExtractedUnit extractFile(const domain::BundleFile& file) const;

private:
    domain::ExtractionLimits m_limits;
    infrastructure::FormatExtractor m_formatExtractor;
    infrastructure::ArchiveExtractor m_archiveExtractor;
};

} // namespace editalflow::application
