/**
 * @file DocxExtractor.hpp
 * @brief Text extraction from Office Open XML word documents.
 */

#pragma once
#include <optional>
#include <string>

#include "infrastructure/ExtractionResult.hpp"

namespace editalflow::infrastructure {

/**
 * @class DocxExtractor
 * @brief Reads word/document.xml: body paragraphs in order, then body tables row by row.
 */
class DocxExtractor {
public:
    static ExtractionResult Extract(const std::string& path);

    /**
     * @brief Converts the XML of word/document.xml to plain text.
     * @param error Set to a description when the XML can't be parsed.
     * @return The text, possibly empty, or nullopt on parse failure.
     */
    static std::optional<std::string> TextFromDocumentXml(const std::string& xml, std::string& error);

    /** @brief Reads one member of a ZIP container into memory. */
    static std::optional<std::string> ReadContainerEntry(const std::string& path, const std::string& entryName,
                                                         std::string& error);
};

} // namespace editalflow::infrastructure
