/**
 * @file IngestionError.hpp
 * @brief Typed error values produced while turning a bundle into text.
 */

#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace editalflow::domain {

/**
 * @enum IngestionErrorKind
 * @brief Error taxonomy of the ingestion layer.
 */
enum class IngestionErrorKind {
    FileNotFound,        ///< Bundle path or referenced file missing.
    BadArchive,          ///< ZIP missing or corrupted.
    ExtractionError,     ///< One file produced no usable text.
    EmptyArchive,        ///< No archive member produced usable text.
    InsufficientContent, ///< Bundle has no content files, or all of them failed.
    DocumentTooLarge     ///< Aggregate text is above the character ceiling.
};

inline std::string IngestionErrorKindToString(IngestionErrorKind kind) {
    switch (kind) {
        case IngestionErrorKind::FileNotFound: return "FileNotFound";
        case IngestionErrorKind::BadArchive: return "BadArchive";
        case IngestionErrorKind::ExtractionError: return "ExtractionError";
        case IngestionErrorKind::EmptyArchive: return "EmptyArchive";
        case IngestionErrorKind::InsufficientContent: return "InsufficientContent";
        case IngestionErrorKind::DocumentTooLarge: return "DocumentTooLarge";
    }
    return "Unknown";
}

/**
 * @struct IngestionError
 * @brief Error value carried inside extraction and ingestion results.
 */
struct IngestionError {
    IngestionErrorKind kind = IngestionErrorKind::ExtractionError;
    std::string message;
    std::vector<std::string> failedFiles; ///< InsufficientContent: files that failed extraction.
    std::size_t maxChars = 0;             ///< DocumentTooLarge: configured ceiling.
    std::size_t actualChars = 0;          ///< DocumentTooLarge: measured size.

    static IngestionError Make(IngestionErrorKind kind, std::string message) {
        IngestionError error;
        error.kind = kind;
        error.message = std::move(message);
        return error;
    }
};

} // namespace editalflow::domain
