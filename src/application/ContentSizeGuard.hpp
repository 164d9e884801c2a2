/**
 * @file ContentSizeGuard.hpp
 * @brief Character ceiling for the aggregate text of a bundle.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "domain/IngestionError.hpp"

namespace editalflow::application {

/**
 * @class ContentSizeGuard
 * @brief Rejects text longer than the configured ceiling instead of truncating it.
 */
class ContentSizeGuard {
public:
    /**
     * @brief Checks the size of normalized text, counted in Unicode code points.
     * @return DocumentTooLarge(maxChars, actualChars) above the ceiling; nullopt otherwise.
     */
    static std::optional<domain::IngestionError> Check(const std::string& text, std::size_t maxChars);

    /** @brief Justification stored in the record of a bundle rejected for its size. */
    static std::string Justification(const domain::IngestionError& error);
};

} // namespace editalflow::application
