/**
 * @file EncodingDecoder.cpp
 * @brief Implementation of EncodingDecoder.
 */

#include "infrastructure/EncodingDecoder.hpp"
#include <cctype>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace editalflow::infrastructure {

namespace {

using Decoder = std::optional<std::string> (*)(const std::string&);

struct Candidate {
    const char* name;
    Decoder decode;
};

void AppendCodePoint(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Windows-1252 0x80..0x9F. Zero marks the five undefined bytes.
constexpr std::uint16_t kCp1252High[32] = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000,
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0178
};

std::optional<std::string> DecodeUtf8Sig(const std::string& bytes) {
    if (!EncodingDecoder::IsValidUtf8(bytes)) return std::nullopt;
    if (bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        return bytes.substr(3);
    }
    return bytes;
}

std::optional<std::string> DecodeUtf8(const std::string& bytes) {
    if (!EncodingDecoder::IsValidUtf8(bytes)) return std::nullopt;
    return bytes;
}

std::optional<std::string> DecodeLatin1(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char ch : bytes) {
        AppendCodePoint(ch, out);
    }
    return out;
}

std::optional<std::string> DecodeCp1252(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char ch : bytes) {
        if (ch >= 0x80 && ch <= 0x9F) {
            const std::uint16_t cp = kCp1252High[ch - 0x80];
            if (cp == 0) return std::nullopt;
            AppendCodePoint(cp, out);
        } else {
            AppendCodePoint(ch, out);
        }
    }
    return out;
}

const Candidate kCandidates[] = {
    {"utf-8-sig", &DecodeUtf8Sig},
    {"utf-8", &DecodeUtf8},
    {"latin1", &DecodeLatin1},
    {"cp1252", &DecodeCp1252},
    {"iso-8859-1", &DecodeLatin1},
};

bool HasVisibleText(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

} // namespace

bool EncodingDecoder::IsValidUtf8(const std::string& bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
            cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        i += extra + 1;
    }
    return true;
}

EncodingDecoder::DecodeResult EncodingDecoder::Decode(const std::string& bytes) {
    DecodeResult result;
    for (const auto& candidate : kCandidates) {
        auto decoded = candidate.decode(bytes);
        if (!decoded || !HasVisibleText(*decoded)) continue;
        result.text = std::move(*decoded);
        result.ok = true;
        result.encoding = candidate.name;
        return result;
    }
    return result;
}

EncodingDecoder::DecodeResult EncodingDecoder::DecodeFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return {};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Decode(buffer.str());
}

std::vector<std::string> EncodingDecoder::CandidateNames() {
    std::vector<std::string> names;
    for (const auto& candidate : kCandidates) {
        names.emplace_back(candidate.name);
    }
    return names;
}

} // namespace editalflow::infrastructure
