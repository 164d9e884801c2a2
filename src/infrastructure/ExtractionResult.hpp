/**
 * @file ExtractionResult.hpp
 * @brief Result of extracting text from one file or archive.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/IngestionError.hpp"

namespace editalflow::infrastructure {

struct ExtractionResult {
    std::string content;
    bool success = false;
    std::string method; // "pdftotext", "mutool", "docx-xml", "text-read", "csv", "json", "zip", "zip-depth-limit"
    std::vector<std::string> warnings;
    std::optional<domain::IngestionError> error; ///< Set iff !success.
    bool depthLimited = false; ///< Archive skipped because the nesting limit was reached.

    static ExtractionResult Succeeded(std::string content, std::string method) {
        ExtractionResult result;
        result.content = std::move(content);
        result.success = true;
        result.method = std::move(method);
        return result;
    }

    static ExtractionResult Failed(domain::IngestionErrorKind kind, std::string message) {
        ExtractionResult result;
        result.error = domain::IngestionError::Make(kind, std::move(message));
        return result;
    }
};

} // namespace editalflow::infrastructure
