/**
 * @file ChunkSplitter.hpp
 * @brief Splits normalized text into overlapping, sentence-aligned windows.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace editalflow::application {

/**
 * @struct TextChunk
 * @brief One window of the text; offsets are byte positions in the source, end exclusive.
 */
struct TextChunk {
    std::size_t index = 0;
    std::string text;
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;
};

class ChunkSplitter {
public:
    static constexpr std::size_t kDefaultChunkSize = 15000;
    static constexpr std::size_t kDefaultOverlap = 1000;

    /**
     * @brief Greedy forward split.
     *
     * A window that does not reach the end of the text ends after the last '.' found
     * past its midpoint, or at the raw boundary otherwise. The next window starts
     * `overlap` characters before the previous end but always after the previous start.
     * Sizes count code points, as ContentSizeGuard does, so boundaries never fall inside
     * a UTF-8 sequence.
     *
     * @param text Text to split.
     * @param chunkSize Maximum window size in characters (0 is treated as 1).
     * @param overlap Characters shared by consecutive windows.
     * @return Chunks in order; empty for empty text.
     */
    static std::vector<TextChunk> Split(const std::string& text,
                                        std::size_t chunkSize = kDefaultChunkSize,
                                        std::size_t overlap = kDefaultOverlap);
};

} // namespace editalflow::application
