/**
 * @file ChunkSplitter.cpp
 * @brief Implementation of ChunkSplitter.
 */

#include "application/ChunkSplitter.hpp"
#include <algorithm>
#include <utility>

namespace editalflow::application {

namespace {

bool IsContinuationByte(const std::string& text, std::size_t pos) {
    return (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80;
}

// Byte offset of every code point, followed by text.size().
std::vector<std::size_t> CodePointOffsets(const std::string& text) {
    std::vector<std::size_t> offsets;
    offsets.reserve(text.size() + 1);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 0 || !IsContinuationByte(text, i)) offsets.push_back(i);
    }
    offsets.push_back(text.size());
    return offsets;
}

} // namespace

std::vector<TextChunk> ChunkSplitter::Split(const std::string& text, std::size_t chunkSize, std::size_t overlap) {
    std::vector<TextChunk> chunks;
    if (text.empty()) return chunks;

    const std::vector<std::size_t> offsets = CodePointOffsets(text);
    const std::size_t size = std::max<std::size_t>(chunkSize, 1);
    const std::size_t count = offsets.size() - 1;
    std::size_t start = 0;

    while (start < count) {
        std::size_t end = std::min(start + size, count);
        if (end < count) {
            const std::size_t midpoint = start + (end - start) / 2;
            const std::size_t period = text.rfind('.', offsets[end] - 1);
            if (period != std::string::npos && period > offsets[midpoint]) {
                // '.' is a single byte, so the position after it is a code point boundary.
                end = static_cast<std::size_t>(
                    std::lower_bound(offsets.begin(), offsets.end(), period + 1) - offsets.begin());
            }
        }

        TextChunk chunk;
        chunk.index = chunks.size();
        chunk.startOffset = offsets[start];
        chunk.endOffset = offsets[end];
        chunk.text = text.substr(chunk.startOffset, chunk.endOffset - chunk.startOffset);
        chunks.push_back(std::move(chunk));

        if (end >= count) break;

        std::size_t next = end > overlap ? end - overlap : 0;
        start = std::max(next, start + 1);
    }
    return chunks;
}

} // namespace editalflow::application
