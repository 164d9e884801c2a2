/**
 * @file DirectoryIngestor.cpp
 * @brief Implementation of DirectoryIngestor.
 */

#include "application/DirectoryIngestor.hpp"
#include "application/ContentSizeGuard.hpp"
#include "infrastructure/FileSystemBundleScanner.hpp"
#include "infrastructure/TextNormalizer.hpp"
#include <iostream>
#include <sstream>
#include <utility>

namespace editalflow::application {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

} // namespace

DirectoryIngestor::DirectoryIngestor(const domain::ExtractionLimits& limits)
    : m_limits(limits),
      m_formatExtractor(limits),
      m_archiveExtractor(m_formatExtractor) {}

DirectoryIngestor::DirectoryIngestor(const domain::ExtractionLimits& limits,
                                     std::vector<infrastructure::PdfExtractor::Backend> pdfBackends,
                                     std::filesystem::path scratchRoot)
    : m_limits(limits),
      m_formatExtractor(limits, std::move(pdfBackends)),
      m_archiveExtractor(m_formatExtractor, std::move(scratchRoot)) {}

domain::ExtractedUnit DirectoryIngestor::extractFile(const domain::BundleFile& file) const {
    domain::ExtractedUnit unit;
    unit.sourceName = file.relativeName;

    infrastructure::ExtractionResult result;
    if (file.kind == domain::FileKind::ZIP) {
        result = m_archiveExtractor.extractZip(file.path, m_limits.zipMaxChars, m_limits.zipMaxDepth, 0);
        if (result.success && result.depthLimited) {
            std::cerr << "[DirectoryIngestor] " << file.relativeName
                      << ": conteúdo além da profundidade máxima de ZIPs não foi processado" << std::endl;
        }
    } else {
        result = m_formatExtractor.extract(file.path);
    }

    if (result.success) {
        unit.text = std::move(result.content);
    } else if (result.error) {
        unit.error = result.error;
    } else {
        unit.error = domain::IngestionError::Make(domain::IngestionErrorKind::ExtractionError,
                                                  "Falha na extração: " + file.relativeName);
    }
    return unit;
}

DirectoryIngestor::IngestionResult DirectoryIngestor::ingest(const std::string& bundlePath) const {
    return ingest(bundlePath, m_limits.maxContentChars);
}

DirectoryIngestor::IngestionResult DirectoryIngestor::ingest(const std::string& bundlePath, std::size_t maxChars) const {
    IngestionResult result;

    infrastructure::FileSystemBundleScanner scanner(bundlePath);
    if (!scanner.exists()) {
        result.error = domain::IngestionError::Make(domain::IngestionErrorKind::FileNotFound,
                                                    "Diretório não encontrado: " + bundlePath);
        return result;
    }

    std::ostringstream aggregate;
    for (const auto& file : scanner.scan()) {
        if (!file.isMetadata) ++result.contentFiles;

        auto unit = extractFile(file);
        if (!unit.ok()) {
            std::cerr << "[DirectoryIngestor] " << unit.sourceName << " (" << domain::FileKindToString(file.kind)
                      << ", " << file.sizeBytes << " bytes): "
                      << domain::IngestionErrorKindToString(unit.error->kind) << " - "
                      << unit.error->message << std::endl;
            if (!file.isMetadata) {
                ++result.failed;
                result.failedFiles.push_back(unit.sourceName);
            }
            continue;
        }

        if (!file.isMetadata) ++result.processed;
        aggregate << "\n\n=== " << unit.sourceName << " ===\n\n" << unit.text;
    }

    if (result.contentFiles == 0) {
        result.error = domain::IngestionError::Make(
            domain::IngestionErrorKind::InsufficientContent,
            "Apenas metadata.json encontrado. Não há arquivos de conteúdo para análise.");
        return result;
    }
    if (result.processed == 0) {
        auto error = domain::IngestionError::Make(
            domain::IngestionErrorKind::InsufficientContent,
            "Não foi possível extrair conteúdo de nenhum arquivo de conteúdo. Arquivos com erro: " +
                JoinNames(result.failedFiles));
        error.failedFiles = result.failedFiles;
        result.error = error;
        return result;
    }

    std::string text = infrastructure::TextNormalizer::Normalize(aggregate.str());
    if (auto tooLarge = ContentSizeGuard::Check(text, maxChars)) {
        result.error = tooLarge;
        return result;
    }

    std::cout << "[DirectoryIngestor] " << result.processed << "/" << result.contentFiles
              << " arquivos de conteúdo extraídos ("
              << infrastructure::TextNormalizer::CharacterCount(text) << " caracteres)" << std::endl;
    result.text = std::move(text);
    return result;
}

} // namespace editalflow::application
