/**
 * @file TextNormalizer.cpp
 * @brief Implementation of TextNormalizer.
 */

#include "infrastructure/TextNormalizer.hpp"

namespace editalflow::infrastructure {

namespace {

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool IsPunctuation(char c) {
    return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?';
}

// Length of the well-formed UTF-8 sequence starting at pos, or 0 when the bytes there are invalid.
std::size_t Utf8SequenceLength(const std::string& text, std::size_t pos) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;
        if (lead == 0xED) high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;
        if (lead == 0xF4) high = 0x8F;
    } else {
        return 0;
    }
    if (pos + length > text.size()) return 0;
    const unsigned char second = static_cast<unsigned char>(text[pos + 1]);
    if (second < low || second > high) return 0;
    for (std::size_t k = 2; k < length; ++k) {
        if (!IsContinuationByte(static_cast<unsigned char>(text[pos + k]))) return 0;
    }
    return length;
}

// Removes control characters and invalid UTF-8 bytes, and unifies line endings. Tabs
// survive as spaces. Only whole sequences are emitted, so the output is valid UTF-8.
std::string StripControls(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            continue;
        }
        if (c == '\n') {
            out.push_back('\n');
            continue;
        }
        if (c == '\t') {
            out.push_back(' ');
            continue;
        }
        if (c < 0x20 || c == 0x7F) continue;
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            continue;
        }

        const std::size_t length = Utf8SequenceLength(text, i);
        if (length == 0) continue;
        // U+0080..U+009F (C1 controls) and U+00A0 (no-break space) are encoded as C2 xx.
        if (c == 0xC2) {
            const unsigned char next = static_cast<unsigned char>(text[i + 1]);
            if (next <= 0x9F) {
                ++i;
                continue;
            }
            if (next == 0xA0) {
                out.push_back(' ');
                ++i;
                continue;
            }
        }
        out.append(text, i, length);
        i += length - 1;
    }
    return out;
}

void AppendCleanLine(const std::string& line, std::string& out) {
    std::string cleaned;
    cleaned.reserve(line.size());
    for (char ch : line) {
        if (ch == ' ') {
            if (!cleaned.empty() && cleaned.back() != ' ') cleaned.push_back(' ');
            continue;
        }
        if (IsPunctuation(ch) && !cleaned.empty() && cleaned.back() == ' ') {
            cleaned.pop_back();
        }
        cleaned.push_back(ch);
    }
    while (!cleaned.empty() && cleaned.back() == ' ') cleaned.pop_back();
    if (cleaned.empty()) return;

    if (!out.empty()) out.push_back('\n');
    out += cleaned;
}

} // namespace

std::string TextNormalizer::Normalize(const std::string& text) {
    const std::string stripped = StripControls(text);

    std::string out;
    out.reserve(stripped.size());
    std::size_t lineStart = 0;
    while (lineStart <= stripped.size()) {
        std::size_t lineEnd = stripped.find('\n', lineStart);
        if (lineEnd == std::string::npos) lineEnd = stripped.size();
        AppendCleanLine(stripped.substr(lineStart, lineEnd - lineStart), out);
        lineStart = lineEnd + 1;
    }
    return out;
}

std::size_t TextNormalizer::CharacterCount(const std::string& text) {
    std::size_t count = 0;
    for (char ch : text) {
        if (!IsContinuationByte(static_cast<unsigned char>(ch))) ++count;
    }
    return count;
}

std::string TextNormalizer::TruncateToCharacters(const std::string& text, std::size_t maxChars) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsContinuationByte(static_cast<unsigned char>(text[i]))) continue;
        if (seen == maxChars) return text.substr(0, i);
        ++seen;
    }
    return text;
}

} // namespace editalflow::infrastructure
