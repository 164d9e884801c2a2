/**
 * @file ArchiveExtractor.hpp
 * @brief Recursive, depth-bounded text extraction from ZIP archives.
 */

#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "infrastructure/ExtractionResult.hpp"
#include "infrastructure/FormatExtractor.hpp"

namespace editalflow::infrastructure {

/**
 * @class ArchiveExtractor
 * @brief Unpacks a ZIP into a scratch directory and extracts every member.
 *
 * Members are handed to FormatExtractor; nested ZIPs are processed after the plain
 * members, one level deeper, until maxDepth. The scratch directory of each call is
 * removed before the call returns.
 */
class ArchiveExtractor {
public:
    /**
     * @param formatExtractor Extractor for non-archive members. Must outlive this object.
     * @param scratchRoot Parent of the scratch directories; system temp directory when empty.
     */
    explicit ArchiveExtractor(const FormatExtractor& formatExtractor, std::filesystem::path scratchRoot = {});

    /**
     * @brief Extracts the text of a ZIP archive.
     * @param path Archive path.
     * @param maxChars Result is truncated to this many characters, with a marker.
     * @param maxDepth Nesting level at which archives are no longer opened.
     * @param currentDepth Level of this archive (0 for a bundle file).
     * @return Text, a depth-limit marker (depthLimited=true, also when every usable member lies
     *         past maxDepth), or BadArchive/EmptyArchive.
     */
    ExtractionResult extractZip(const std::string& path, std::size_t maxChars,
                                int maxDepth = 3, int currentDepth = 0) const;

    /** @brief Existing file starting with a ZIP signature. */
    static bool IsZipFile(const std::string& path);

    static std::string DepthLimitMarker(int maxDepth);
    static std::string TruncationMarker(std::size_t maxChars);

private:
    bool unpack(const std::string& archivePath, const std::filesystem::path& destination, std::string& error) const;

    const FormatExtractor& m_formatExtractor;
    std::filesystem::path m_scratchRoot;
};

} // namespace editalflow::infrastructure
