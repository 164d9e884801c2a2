/**
 * @file FormatExtractor.cpp
 * @brief Implementation of FormatExtractor.
 */

#include "infrastructure/FormatExtractor.hpp"
#include "infrastructure/DocxExtractor.hpp"
#include "infrastructure/EncodingDecoder.hpp"
#include <filesystem>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace editalflow::infrastructure {

namespace {

std::string TrimCell(const std::string& value) {
    const char* whitespace = " \t\r\n";
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

} // namespace

FormatExtractor::FormatExtractor(const domain::ExtractionLimits& limits)
    : m_pdf(limits.pdfMaxPages, limits.pdfMinPageChars) {}

FormatExtractor::FormatExtractor(const domain::ExtractionLimits& limits,
                                 std::vector<PdfExtractor::Backend> pdfBackends)
    : m_pdf(limits.pdfMaxPages, limits.pdfMinPageChars, std::move(pdfBackends)) {}

ExtractionResult FormatExtractor::extract(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::FileNotFound,
                                        "Arquivo não encontrado: " + path);
    }

    const domain::FileKind kind = domain::ClassifyFile(path);
    switch (kind) {
        case domain::FileKind::PDF: return m_pdf.extract(path);
        case domain::FileKind::DOCX: return DocxExtractor::Extract(path);
        case domain::FileKind::CSV: return ExtractCsv(path);
        case domain::FileKind::JSON: return ExtractJson(path);
        case domain::FileKind::Text: return ExtractText(path);
        case domain::FileKind::Unknown: return ExtractText(path);
        case domain::FileKind::ZIP:
            return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                            "Arquivos ZIP devem ser processados pelo ArchiveExtractor: " + path);
    }
    return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError, "Formato não suportado: " + path);
}

ExtractionResult FormatExtractor::ExtractText(const std::string& path) {
    auto decoded = EncodingDecoder::DecodeFile(path);
    if (!decoded.ok) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "Não foi possível decodificar o arquivo: " + path);
    }
    return ExtractionResult::Succeeded(std::move(decoded.text), "text-read");
}

std::vector<std::vector<std::string>> FormatExtractor::ParseCsv(const std::string& text) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasData = false;

    auto endField = [&]() {
        row.push_back(std::move(field));
        field.clear();
        rowHasData = true;
    };
    auto endRow = [&]() {
        if (rowHasData || !field.empty()) endField();
        rows.push_back(std::move(row));
        row.clear();
        rowHasData = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"') {
            inQuotes = true;
            rowHasData = true;
        } else if (c == ',') {
            endField();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            endRow();
        } else if (c == '\n') {
            endRow();
        } else {
            field.push_back(c);
        }
    }
    if (rowHasData || !field.empty()) endRow();
    return rows;
}

ExtractionResult FormatExtractor::ExtractCsv(const std::string& path) {
    auto decoded = EncodingDecoder::DecodeFile(path);
    if (!decoded.ok) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "Não foi possível decodificar o CSV: " + path);
    }

    std::string content;
    for (const auto& row : ParseCsv(decoded.text)) {
        bool blank = true;
        std::string line;
        for (std::size_t i = 0; i < row.size(); ++i) {
            const std::string cell = TrimCell(row[i]);
            if (!cell.empty()) blank = false;
            if (i > 0) line += " | ";
            line += cell;
        }
        if (blank) continue;
        if (!content.empty()) content.push_back('\n');
        content += line;
    }

    if (content.empty()) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "Nenhuma linha com conteúdo no CSV: " + path);
    }
    return ExtractionResult::Succeeded(std::move(content), "csv");
}

void FormatExtractor::StripAnalysisParameters(nlohmann::ordered_json& metadata) {
    if (!metadata.is_object()) return;
    metadata.erase("threshold");
    metadata.erase("target");
}

ExtractionResult FormatExtractor::ExtractJson(const std::string& path) {
    auto decoded = EncodingDecoder::DecodeFile(path);
    if (!decoded.ok) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "Não foi possível decodificar o JSON: " + path);
    }

    nlohmann::ordered_json data;
    try {
        data = nlohmann::ordered_json::parse(decoded.text);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[FormatExtractor] JSON inválido em " << path << ": " << e.what() << std::endl;
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "JSON inválido em " + path + ": " + e.what());
    }

    if (domain::IsMetadataFile(path)) {
        StripAnalysisParameters(data);
    }
    return ExtractionResult::Succeeded(data.dump(2), "json");
}

} // namespace editalflow::infrastructure
