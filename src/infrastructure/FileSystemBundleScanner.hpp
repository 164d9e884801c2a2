/**
 * @file FileSystemBundleScanner.hpp
 * @brief Scanner for the files of a document bundle directory.
 */

#pragma once
#include <vector>
#include <string>
#include "domain/SourceArtifact.hpp"

namespace editalflow::infrastructure {

/**
 * @class FileSystemBundleScanner
 * @brief Infrastructure adapter walking a bundle directory tree.
 */
class FileSystemBundleScanner {
public:
    explicit FileSystemBundleScanner(const std::string& bundlePath);

    /** @brief True if the bundle path exists and is a directory. */
    bool exists() const;

    /**
     * @brief Lists every regular file under the bundle, sorted by relative name.
     * @return Files with their kind and metadata classification.
     */
    std::vector<domain::BundleFile> scan() const;

private:
    std::string m_bundlePath;
};

} // namespace editalflow::infrastructure
