/**
 * @file FormatExtractor.hpp
 * @brief Utility for extracting text from one bundle file (PDF, Word, text, CSV, JSON).
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/AnalysisSettings.hpp"
#include "domain/SourceArtifact.hpp"
#include "infrastructure/ExtractionResult.hpp"
#include "infrastructure/PdfExtractor.hpp"

namespace editalflow::infrastructure {

/**
 * @class FormatExtractor
 * @brief Dispatches a file to the extractor of its FileKind. ZIP files are not handled here.
 */
class FormatExtractor {
public:
    explicit FormatExtractor(const domain::ExtractionLimits& limits);
    FormatExtractor(const domain::ExtractionLimits& limits, std::vector<PdfExtractor::Backend> pdfBackends);

    /**
     * @brief Extracts the text of one file.
     * @param path File to read.
     * @return Text on success; FileNotFound or ExtractionError otherwise.
     */
    ExtractionResult extract(const std::string& path) const;

    /** @brief Plain text, Markdown and unknown extensions. */
    static ExtractionResult ExtractText(const std::string& path);

    /** @brief Rows with at least one non-blank cell, cells joined by " | ". */
    static ExtractionResult ExtractCsv(const std::string& path);

    /** @brief Pretty-printed JSON; metadata.json loses its "threshold" and "target" keys. */
    static ExtractionResult ExtractJson(const std::string& path);

    /** @brief RFC 4180 parsing: quoted fields, doubled quotes, embedded line breaks. */
    static std::vector<std::vector<std::string>> ParseCsv(const std::string& text);

    /** @brief Removes the analysis parameters a caller may have stored in the metadata. */
    static void StripAnalysisParameters(nlohmann::ordered_json& metadata);

private:
    PdfExtractor m_pdf;
};

} // namespace editalflow::infrastructure
