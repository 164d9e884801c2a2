/**
 * @file DocxExtractor.cpp
 * @brief Implementation of DocxExtractor.
 */

#include "infrastructure/DocxExtractor.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <tinyxml2.h>
#include <cstring>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace editalflow::infrastructure {

namespace {

using ArchivePtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

std::string Trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

void CollectWordText(const tinyxml2::XMLElement* node, std::string& out) {
    if (!node) return;
    const char* name = node->Name();
    if (std::strcmp(name, "w:t") == 0) {
        if (const char* text = node->GetText()) out += text;
        return;
    }
    if (std::strcmp(name, "w:br") == 0 || std::strcmp(name, "w:cr") == 0) {
        out.push_back('\n');
        return;
    }
    if (std::strcmp(name, "w:tab") == 0) {
        out.push_back(' ');
        return;
    }
    for (auto child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
        CollectWordText(child, out);
    }
}

// Cell text is its paragraphs joined by line breaks.
std::string CellText(const tinyxml2::XMLElement* cell) {
    std::string text;
    bool first = true;
    for (auto p = cell->FirstChildElement("w:p"); p; p = p->NextSiblingElement("w:p")) {
        if (!first) text.push_back('\n');
        CollectWordText(p, text);
        first = false;
    }
    return Trim(text);
}

void AppendTable(const tinyxml2::XMLElement* table, std::string& out) {
    for (auto row = table->FirstChildElement("w:tr"); row; row = row->NextSiblingElement("w:tr")) {
        std::vector<std::string> cells;
        for (auto cell = row->FirstChildElement("w:tc"); cell; cell = cell->NextSiblingElement("w:tc")) {
            std::string text = CellText(cell);
            if (!text.empty()) cells.push_back(std::move(text));
        }
        if (cells.empty()) continue;
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) out += " | ";
            out += cells[i];
        }
        out.push_back('\n');
    }
}

} // namespace

std::optional<std::string> DocxExtractor::ReadContainerEntry(const std::string& path, const std::string& entryName,
                                                             std::string& error) {
    ArchivePtr reader(archive_read_new(), &archive_read_free);
    if (!reader) {
        error = "libarchive indisponível";
        return std::nullopt;
    }
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        error = archive_error_string(reader.get()) ? archive_error_string(reader.get()) : "falha ao abrir";
        return std::nullopt;
    }

    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        if (!name || entryName != name) {
            archive_read_data_skip(reader.get());
            continue;
        }
        std::string data;
        char buffer[8192];
        la_ssize_t n = 0;
        while ((n = archive_read_data(reader.get(), buffer, sizeof(buffer))) > 0) {
            data.append(buffer, static_cast<std::size_t>(n));
        }
        if (n < 0) {
            error = archive_error_string(reader.get()) ? archive_error_string(reader.get()) : "falha de leitura";
            return std::nullopt;
        }
        return data;
    }
    if (status != ARCHIVE_EOF) {
        error = archive_error_string(reader.get()) ? archive_error_string(reader.get()) : "contêiner corrompido";
    } else {
        error = entryName + " ausente";
    }
    return std::nullopt;
}

std::optional<std::string> DocxExtractor::TextFromDocumentXml(const std::string& xml, std::string& error) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        error = doc.ErrorStr() ? doc.ErrorStr() : "XML inválido";
        return std::nullopt;
    }
    const tinyxml2::XMLElement* root = doc.RootElement();
    const tinyxml2::XMLElement* body = root ? root->FirstChildElement("w:body") : nullptr;
    if (!body) {
        error = "w:body ausente";
        return std::nullopt;
    }

    std::string text;
    for (auto p = body->FirstChildElement("w:p"); p; p = p->NextSiblingElement("w:p")) {
        std::string paragraph;
        CollectWordText(p, paragraph);
        if (Trim(paragraph).empty()) continue;
        text += paragraph;
        text.push_back('\n');
    }
    for (auto table = body->FirstChildElement("w:tbl"); table; table = table->NextSiblingElement("w:tbl")) {
        AppendTable(table, text);
    }
    return text;
}

ExtractionResult DocxExtractor::Extract(const std::string& path) {
    std::string error;
    auto xml = ReadContainerEntry(path, "word/document.xml", error);
    if (!xml) {
        std::cerr << "[DocxExtractor] " << path << ": " << error << std::endl;
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "Falha ao ler documento Word " + path + ": " + error);
    }

    auto text = TextFromDocumentXml(*xml, error);
    if (!text) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "XML do documento Word inválido em " + path + ": " + error);
    }
    if (Trim(*text).empty()) {
        return ExtractionResult::Failed(domain::IngestionErrorKind::ExtractionError,
                                        "Nenhum texto extraído do documento Word: " + path);
    }
    return ExtractionResult::Succeeded(std::move(*text), "docx-xml");
}

} // namespace editalflow::infrastructure
