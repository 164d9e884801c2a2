/**
 * @file PdfExtractor.hpp
 * @brief Page-wise PDF text extraction through an ordered list of command-line backends.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/ExtractionResult.hpp"

namespace editalflow::infrastructure {

/**
 * @class PdfExtractor
 * @brief Reads up to maxPages pages, drops near-empty pages and tags the rest with page markers.
 */
class PdfExtractor {
public:
    /**
     * @struct Backend
     * @brief One way of turning a PDF into per-page text.
     *
     * readPages returns the raw text of pages 1..maxPages in order, or nullopt when the
     * backend is unavailable or failed on the file.
     */
    struct Backend {
        std::string name;
        std::function<std::optional<std::vector<std::string>>(const std::string& path, int maxPages)> readPages;
    };

    PdfExtractor(int maxPages, std::size_t minPageChars, std::vector<Backend> backends = DefaultBackends());

    /**
     * @brief Extracts the document. The first backend that reads the file wins; a failing
     * backend hands over to the next one.
     */
    ExtractionResult extract(const std::string& path) const;

    /** @brief poppler pdftotext first, MuPDF mutool second. */
    static std::vector<Backend> DefaultBackends();

private:
    int m_maxPages;
    std::size_t m_minPageChars;
    std::vector<Backend> m_backends;
};

} // namespace editalflow::infrastructure
