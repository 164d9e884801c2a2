/**
 * @file PdfExtractor.cpp
 * @brief Implementation of PdfExtractor.
 */

#include "infrastructure/PdfExtractor.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/TextNormalizer.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

namespace editalflow::infrastructure {

namespace {

// pdftotext ends every page with a form feed.
std::optional<std::vector<std::string>> ReadWithPdftotext(const std::string& path, int maxPages) {
    if (!ProcessRunner::HasTool("pdftotext")) return std::nullopt;

    auto run = ProcessRunner::RunCommand("pdftotext -q -enc UTF-8 -f 1 -l " + std::to_string(maxPages) + " " +
                                         ProcessRunner::ShellQuote(path) + " -");
    if (!run.succeeded()) return std::nullopt;

    std::vector<std::string> pages;
    std::size_t start = 0;
    while (start < run.output.size() && static_cast<int>(pages.size()) < maxPages) {
        std::size_t ff = run.output.find('\f', start);
        if (ff == std::string::npos) {
            pages.push_back(run.output.substr(start));
            break;
        }
        pages.push_back(run.output.substr(start, ff - start));
        start = ff + 1;
    }
    return pages;
}

int ReadMutoolPageCount(const std::string& path) {
    auto info = ProcessRunner::RunCommand("mutool info " + ProcessRunner::ShellQuote(path));
    if (!info.succeeded()) return -1;

    std::istringstream lines(info.output);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Pages:", 0) == 0) {
            try {
                return std::stoi(line.substr(6));
            } catch (const std::exception&) {
                return -1;
            }
        }
    }
    return -1;
}

std::optional<std::vector<std::string>> ReadWithMutool(const std::string& path, int maxPages) {
    if (!ProcessRunner::HasTool("mutool")) return std::nullopt;

    int pageCount = ReadMutoolPageCount(path);
    if (pageCount < 0) return std::nullopt;

    std::vector<std::string> pages;
    const int lastPage = std::min(pageCount, maxPages);
    for (int page = 1; page <= lastPage; ++page) {
        auto run = ProcessRunner::RunCommand("mutool draw -q -F txt -o - " + ProcessRunner::ShellQuote(path) + " " +
                                             std::to_string(page));
        if (!run.succeeded()) return std::nullopt;
        pages.push_back(std::move(run.output));
    }
    return pages;
}

} // namespace

PdfExtractor::PdfExtractor(int maxPages, std::size_t minPageChars, std::vector<Backend> backends)
    : m_maxPages(maxPages), m_minPageChars(minPageChars), m_backends(std::move(backends)) {}

std::vector<PdfExtractor::Backend> PdfExtractor::DefaultBackends() {
    return {
        {"pdftotext", &ReadWithPdftotext},
        {"mutool", &ReadWithMutool},
    };
}

ExtractionResult PdfExtractor::extract(const std::string& path) const {
    std::vector<std::string> warnings;

    for (const auto& backend : m_backends) {
        auto pages = backend.readPages(path, m_maxPages);
        if (!pages) {
            std::cerr << "[PdfExtractor] Backend " << backend.name << " falhou em " << path << std::endl;
            warnings.push_back("Backend " + backend.name + " falhou.");
            continue;
        }

        std::string content;
        int kept = 0;
        for (std::size_t i = 0; i < pages->size(); ++i) {
            std::string pageText = TextNormalizer::Normalize((*pages)[i]);
            if (TextNormalizer::CharacterCount(pageText) <= m_minPageChars) continue;
            content += "\n\n=== Página " + std::to_string(i + 1) + " ===\n\n" + pageText;
            ++kept;
        }

        if (kept == 0) {
            auto result = ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                                   "Nenhuma página do PDF contém texto utilizável: " + path);
            result.method = backend.name;
            result.warnings = std::move(warnings);
            return result;
        }

        auto result = ExtractionResult::Succeeded(std::move(content), backend.name);
        result.warnings = std::move(warnings);
        return result;
    }

    auto result = ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                           "Não foi possível ler o PDF com nenhum backend: " + path);
    result.warnings = std::move(warnings);
    return result;
}

} // namespace editalflow::infrastructure
