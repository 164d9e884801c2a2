/**
 * @file ScratchDirectory.cpp
 * @brief Implementation of ScratchDirectory.
 */

#include "infrastructure/ScratchDirectory.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace editalflow::infrastructure {

ScratchDirectory::ScratchDirectory(const fs::path& root, const std::string& prefix) {
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
    if (ec) {
        m_error = "Diretório temporário indisponível: " + ec.message();
        return;
    }

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        m_error = "Falha ao criar diretório temporário: " + std::string(std::strerror(errno));
        return;
    }
    m_path = fs::path(buffer.data());
}

ScratchDirectory::~ScratchDirectory() {
    if (m_path.empty()) return;
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[ScratchDirectory] Erro ao remover " << m_path << ": " << ec.message() << std::endl;
    }
}

} // namespace editalflow::infrastructure
