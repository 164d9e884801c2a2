/**
 * @file TextNormalizer.hpp
 * @brief Whitespace and control-character cleanup for extracted text.
 */

#pragma once
#include <cstddef>
#include <string>

namespace editalflow::infrastructure {

/**
 * @class TextNormalizer
 * @brief Stateless cleanup applied to every extracted unit and to the bundle aggregate.
 */
class TextNormalizer {
public:
    /**
     * @brief Cleans extracted text.
     *
     * Drops control characters (keeping line breaks and tabs), unifies line endings,
     * collapses runs of spaces and tabs, removes spaces before punctuation, trims every
     * line and removes blank lines. Normalize(Normalize(x)) == Normalize(x).
     * @param text UTF-8 input.
     * @return Normalized UTF-8 text.
     */
    static std::string Normalize(const std::string& text);

    /** @brief Number of Unicode code points in a UTF-8 string. */
    static std::size_t CharacterCount(const std::string& text);

    /** @brief Longest prefix holding at most maxChars code points. */
    static std::string TruncateToCharacters(const std::string& text, std::size_t maxChars);
};

} // namespace editalflow::infrastructure
