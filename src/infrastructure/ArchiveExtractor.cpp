/**
 * @file ArchiveExtractor.cpp
 * @brief Implementation of ArchiveExtractor.
 */

#include "infrastructure/ArchiveExtractor.hpp"
#include "infrastructure/ScratchDirectory.hpp"
#include "infrastructure/TextNormalizer.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace editalflow::infrastructure {

namespace {

using ArchiveReadPtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using ArchiveWritePtr = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

std::string ArchiveError(struct archive* a, const char* fallback) {
    const char* message = archive_error_string(a);
    return message ? message : fallback;
}

bool IsUnsafeEntryPath(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute() || relative.has_root_name()) return true;
    for (const auto& part : relative) {
        if (part == "..") return true;
    }
    return false;
}

std::vector<fs::path> ListFilesSorted(const fs::path& root) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statEc;
        if (it->is_regular_file(statEc)) files.push_back(it->path());
    }
    if (ec) {
        std::cerr << "[ArchiveExtractor] Erro ao percorrer " << root << ": " << ec.message() << std::endl;
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

ArchiveExtractor::ArchiveExtractor(const FormatExtractor& formatExtractor, fs::path scratchRoot)
    : m_formatExtractor(formatExtractor), m_scratchRoot(std::move(scratchRoot)) {}

std::string ArchiveExtractor::DepthLimitMarker(int maxDepth) {
    return "[Profundidade máxima de ZIPs atingida (" + std::to_string(maxDepth) + "). Conteúdo não processado.]";
}

std::string ArchiveExtractor::TruncationMarker(std::size_t maxChars) {
    return "\n\n[Texto truncado em " + std::to_string(maxChars) + " caracteres]";
}

bool ArchiveExtractor::IsZipFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;

    std::ifstream file(path, std::ios::binary);
    char magic[4] = {};
    if (!file.read(magic, sizeof(magic))) return false;
    if (magic[0] != 'P' || magic[1] != 'K') return false;
    return (magic[2] == '\x03' && magic[3] == '\x04') ||
           (magic[2] == '\x05' && magic[3] == '\x06') ||
           (magic[2] == '\x07' && magic[3] == '\x08');
}

bool ArchiveExtractor::unpack(const std::string& archivePath, const fs::path& destination, std::string& error) const {
    ArchiveReadPtr reader(archive_read_new(), &archive_read_free);
    ArchiveWritePtr writer(archive_write_disk_new(), &archive_write_free);
    if (!reader || !writer) {
        error = "libarchive indisponível";
        return false;
    }
    archive_read_support_format_zip(reader.get());
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        error = ArchiveError(reader.get(), "falha ao abrir");
        return false;
    }

    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        const auto type = archive_entry_filetype(entry);
        if (!name || (type != AE_IFREG && type != AE_IFDIR)) {
            archive_read_data_skip(reader.get());
            continue;
        }
        const fs::path relative(name);
        if (IsUnsafeEntryPath(relative)) {
            std::cerr << "[ArchiveExtractor] Entrada ignorada (caminho inseguro): " << name << std::endl;
            archive_read_data_skip(reader.get());
            continue;
        }

        const std::string target = (destination / relative).string();
        archive_entry_set_pathname(entry, target.c_str());
        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK) {
            error = ArchiveError(writer.get(), "falha ao gravar entrada");
            return false;
        }

        const void* block = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        int readStatus = ARCHIVE_OK;
        while ((readStatus = archive_read_data_block(reader.get(), &block, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(writer.get(), block, size, offset) != ARCHIVE_OK) {
                error = ArchiveError(writer.get(), "falha ao gravar dados");
                return false;
            }
        }
        if (readStatus != ARCHIVE_EOF) {
            error = ArchiveError(reader.get(), "dados corrompidos");
            return false;
        }
        if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK) {
            error = ArchiveError(writer.get(), "falha ao finalizar entrada");
            return false;
        }
    }
    if (status != ARCHIVE_EOF) {
        error = ArchiveError(reader.get(), "cabeçalho corrompido");
        return false;
    }
    return true;
}

ExtractionResult ArchiveExtractor::extractZip(const std::string& path, std::size_t maxChars,
                                              int maxDepth, int currentDepth) const {
    const int level = currentDepth + 1;
    if (currentDepth >= maxDepth) {
        std::cout << "[ArchiveExtractor] Profundidade máxima atingida (" << maxDepth << "): " << path << std::endl;
        auto result = ExtractionResult::Succeeded(DepthLimitMarker(maxDepth), "zip-depth-limit");
        result.depthLimited = true;
        return result;
    }

    if (!IsZipFile(path)) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::BadArchive,
                                        "Arquivo não é um ZIP válido ou não existe: " + path);
    }

    std::cout << "[ArchiveExtractor] Extraindo ZIP (nível " << level << "): " << path << std::endl;

    ScratchDirectory scratch(m_scratchRoot, "editalflow_zip_");
    if (!scratch.valid()) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError, scratch.error());
    }

    std::string error;
    if (!unpack(path, scratch.path(), error)) {
        std::cerr << "[ArchiveExtractor] ZIP corrompido " << path << ": " << error << std::endl;
        return ExtractionResult::Failed(domain::IngestionErrorKind::BadArchive,
                                        "Arquivo ZIP corrompido (" + path + "): " + error);
    }

    std::string text;
    std::vector<std::string> warnings;
    std::vector<fs::path> nestedZips;
    int processed = 0;
    int depthLimited = 0;

    for (const auto& file : ListFilesSorted(scratch.path())) {
        if (domain::ClassifyFile(file) == domain::FileKind::ZIP) {
            nestedZips.push_back(file);
            continue;
        }

        auto member = m_formatExtractor.extract(file.string());
        const std::string name = file.filename().string();
        if (!member.success) {
            const std::string reason = member.error ? member.error->message : "falha desconhecida";
            std::cerr << "[ArchiveExtractor] Erro ao extrair " << name << ": " << reason << std::endl;
            warnings.push_back(name + ": " + reason);
            continue;
        }
        std::string memberText = TextNormalizer::Normalize(member.content);
        if (memberText.empty()) continue;
        text += "\n\n=== " + name + " ===\n\n" + memberText;
        ++processed;
    }

    for (const auto& nestedZip : nestedZips) {
        const std::string name = nestedZip.filename().string();
        auto nested = extractZip(nestedZip.string(), maxChars, maxDepth, currentDepth + 1);
        if (!nested.success) {
            const std::string reason = nested.error ? nested.error->message : "falha desconhecida";
            std::cerr << "[ArchiveExtractor] Erro no ZIP aninhado " << name << ": " << reason << std::endl;
            warnings.push_back(name + ": " + reason);
            continue;
        }
        text += "\n\n=== ZIP ANINHADO: " + name + " ===\n\n" + nested.content;
        if (nested.depthLimited) {
            warnings.push_back(name + ": " + DepthLimitMarker(maxDepth));
            ++depthLimited;
        } else {
            ++processed;
        }
    }

    // Only markers below this level: bounded result, not an error.
    if (processed == 0 && depthLimited > 0) {
        std::cout << "[ArchiveExtractor] ZIP nível " << level << ": apenas conteúdo além da profundidade máxima" << std::endl;
        auto result = ExtractionResult::Succeeded(std::move(text), "zip-depth-limit");
        result.depthLimited = true;
        result.warnings = std::move(warnings);
        return result;
    }

    if (processed == 0) {
        auto result = ExtractionResult::Failed(domain::IngestionErrorKind::EmptyArchive,
                                               "Nenhum texto extraído do ZIP: " + path);
        result.warnings = std::move(warnings);
        return result;
    }

    if (TextNormalizer::CharacterCount(text) > maxChars) {
        text = TextNormalizer::TruncateToCharacters(text, maxChars) + TruncationMarker(maxChars);
    }

    std::cout << "[ArchiveExtractor] ZIP nível " << level << ": " << processed << " arquivo(s) processado(s)" << std::endl;
    auto result = ExtractionResult::Succeeded(std::move(text), "zip");
    result.warnings = std::move(warnings);
    return result;
}

} // namespace editalflow::infrastructure
