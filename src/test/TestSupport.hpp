/**
 * @file TestSupport.hpp
 * @brief Fixture helpers shared by the test executables.
 */

#pragma once
#include <archive.h>
#include <archive_entry.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace editalflow::test {

using ZipEntries = std::vector<std::pair<std::string, std::string>>;

/** @brief Fresh, empty directory under the system temp directory. */
inline std::filesystem::path MakeTempDir(const std::string& prefix) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(rd()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/** @brief Writes an uncompressed ZIP with the given (name, bytes) entries. Aborts the test on failure. */
inline void WriteZip(const std::filesystem::path& path, const ZipEntries& entries) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_set_format_option(a, "zip", "compression", "store");
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        std::cerr << "[TestSupport] Não foi possível criar " << path << ": " << archive_error_string(a) << std::endl;
        archive_write_free(a);
        std::exit(1);
    }
    for (const auto& entry : entries) {
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, entry.first.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(entry.second.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_write_header(a, e);
        archive_write_data(a, entry.second.data(), entry.second.size());
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
}

/** @brief Minimal .docx whose body is the given WordprocessingML fragment. */
inline void WriteDocx(const std::filesystem::path& path, const std::string& bodyXml) {
    const std::string contentTypes =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/word/document.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
        "</Types>";
    const std::string document =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
        "<w:body>" + bodyXml + "</w:body></w:document>";
    WriteZip(path, {{"[Content_Types].xml", contentTypes}, {"word/document.xml", document}});
}

inline bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace editalflow::test
