/**
 * @file EncodingDecoder.hpp
 * @brief Byte-to-UTF-8 decoding with an ordered fallback list of encodings.
 */

#pragma once
#include <string>
#include <vector>

namespace editalflow::infrastructure {

/**
 * @class EncodingDecoder
 * @brief Decodes file bytes trying UTF-8 (with and without BOM), Latin-1, CP1252 and ISO-8859-1.
 */
class EncodingDecoder {
public:
    struct DecodeResult {
        std::string text;     ///< Always valid UTF-8 when ok.
        bool ok = false;
        std::string encoding; ///< Name of the encoding that won.
    };

    /**
     * @brief Decodes raw bytes. Never throws.
     * @return The first candidate that decodes to text with at least one non-space character;
     *         ok=false when none does.
     */
    static DecodeResult Decode(const std::string& bytes);

    /** @brief Reads a whole file as bytes and decodes it. ok=false if the file can't be read. */
    static DecodeResult DecodeFile(const std::string& path);

    /** @brief Candidate names, in the order they are tried. */
    static std::vector<std::string> CandidateNames();

    static bool IsValidUtf8(const std::string& bytes);
};

} // namespace editalflow::infrastructure
