/**
 * @file FileSystemBundleScanner.cpp
 * @brief Implementation of the FileSystemBundleScanner.
 */

#include "infrastructure/FileSystemBundleScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace editalflow::infrastructure {

FileSystemBundleScanner::FileSystemBundleScanner(const std::string& bundlePath)
    : m_bundlePath(bundlePath) {}

bool FileSystemBundleScanner::exists() const {
    std::error_code ec;
    return fs::is_directory(m_bundlePath, ec);
}

std::vector<domain::BundleFile> FileSystemBundleScanner::scan() const {
    std::vector<domain::BundleFile> files;

    if (!exists()) {
        return files;
    }

    std::error_code ec;
    for (fs::recursive_directory_iterator it(m_bundlePath, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;

        domain::BundleFile file;
        file.path = it->path().string();
        file.relativeName = it->path().lexically_relative(m_bundlePath).generic_string();
        file.kind = domain::ClassifyFile(it->path());
        file.isMetadata = domain::IsMetadataFile(it->path());

        auto size = it->file_size(entryEc);
        file.sizeBytes = entryEc ? 0 : static_cast<long long>(size);

        files.push_back(file);
    }
    if (ec) {
        std::cerr << "[FileSystemBundleScanner] Erro ao percorrer " << m_bundlePath << ": " << ec.message() << std::endl;
    }

    std::sort(files.begin(), files.end(), [](const domain::BundleFile& a, const domain::BundleFile& b) {
        return a.relativeName < b.relativeName;
    });
    return files;
}

} // namespace editalflow::infrastructure
