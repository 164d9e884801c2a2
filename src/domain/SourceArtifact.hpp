/**
 * @file SourceArtifact.hpp
 * @brief Domain types describing one file of a document bundle and its extracted text.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>

#include "domain/IngestionError.hpp"

namespace editalflow::domain {

/**
 * @enum FileKind
 * @brief Closed set of formats the extractors know how to read.
 */
enum class FileKind {
    PDF,
    DOCX,
    Text,
    CSV,
    JSON,
    ZIP,
    Unknown
};

inline std::string FileKindToString(FileKind kind) {
    switch (kind) {
        case FileKind::PDF: return "PDF";
        case FileKind::DOCX: return "DOCX";
        case FileKind::Text: return "Text";
        case FileKind::CSV: return "CSV";
        case FileKind::JSON: return "JSON";
        case FileKind::ZIP: return "ZIP";
        case FileKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

inline std::string LowercaseExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext;
}

/**
 * @brief Resolves the file kind from the (case-insensitive) extension.
 */
inline FileKind ClassifyFile(const std::filesystem::path& path) {
    const std::string ext = LowercaseExtension(path);
    if (ext == ".pdf") return FileKind::PDF;
    if (ext == ".docx" || ext == ".doc") return FileKind::DOCX;
    if (ext == ".md" || ext == ".markdown" || ext == ".txt") return FileKind::Text;
    if (ext == ".csv") return FileKind::CSV;
    if (ext == ".json") return FileKind::JSON;
    if (ext == ".zip") return FileKind::ZIP;
    return FileKind::Unknown;
}

/**
 * @brief True for the bundle's metadata file (matched case-insensitively).
 */
inline bool IsMetadataFile(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });
    return name == "metadata.json";
}

/**
 * @class BundleFile
 * @brief A physical file found while walking a document bundle.
 */
class BundleFile {
public:
    std::string path;          ///< Absolute or caller-relative path.
    std::string relativeName;  ///< Path relative to the bundle root, '/' separated.
    FileKind kind;
    bool isMetadata;           ///< The bundle's metadata.json.
    long long sizeBytes;

    BundleFile() : kind(FileKind::Unknown), isMetadata(false), sizeBytes(0) {}
};

/**
 * @struct ExtractedUnit
 * @brief Text of a single extracted file, or the reason it could not be extracted.
 */
struct ExtractedUnit {
    std::string sourceName;
    std::string text;
    std::optional<IngestionError> error;

    bool ok() const { return !error.has_value(); }
};

} // namespace editalflow::domain
