/**
 * @file ScratchDirectory.hpp
 * @brief Uniquely named temporary directory removed when the owner goes out of scope.
 */

#pragma once
#include <filesystem>
#include <string>

namespace editalflow::infrastructure {

class ScratchDirectory {
public:
    /**
     * @brief Creates <root>/<prefix>XXXXXX. Check valid() before use.
     * @param root Parent directory; the system temp directory when empty.
     */
    explicit ScratchDirectory(const std::filesystem::path& root = {}, const std::string& prefix = "editalflow_");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    bool valid() const { return !m_path.empty(); }
    const std::filesystem::path& path() const { return m_path; }
    const std::string& error() const { return m_error; }

private:
    std::filesystem::path m_path;
    std::string m_error;
};

} // namespace editalflow::infrastructure
