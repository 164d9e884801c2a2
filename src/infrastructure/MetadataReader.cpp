/**
 * @file MetadataReader.cpp
 * @brief Implementation of MetadataReader.
 */

#include "infrastructure/MetadataReader.hpp"
#include "infrastructure/EncodingDecoder.hpp"
#include "domain/SourceArtifact.hpp"
#include <filesystem>
#include <iostream>
#include <regex>
#include <utility>

namespace fs = std::filesystem;

namespace editalflow::infrastructure {

namespace {

std::string Trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

fs::path FindMetadataFile(const fs::path& bundleDir) {
    std::error_code ec;
    fs::path exact = bundleDir / "metadata.json";
    if (fs::is_regular_file(exact, ec)) return exact;

    for (fs::directory_iterator it(bundleDir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc) && domain::IsMetadataFile(it->path())) return it->path();
    }
    return {};
}

} // namespace

std::string MetadataReader::ScalarToString(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number() || value.is_boolean()) return value.dump();
    return {};
}

std::string MetadataReader::ExtractCity(const nlohmann::json& metadata) {
    if (!metadata.is_object() || !metadata.contains("agency") || !metadata["agency"].is_string()) {
        return {};
    }
    const std::string agency = metadata["agency"].get<std::string>();

    static const std::regex patterns[] = {
        std::regex(R"(([^/,\-]+?)\s*/\s*([A-Z]{2})(?![A-Za-z]))"),
        std::regex(R"(([^/,\-]+?)\s*-\s*([A-Z]{2})(?![A-Za-z]))"),
        std::regex(R"(([^/,\-]+?)\s*,\s*([A-Z]{2})(?![A-Za-z]))"),
    };
    for (const auto& pattern : patterns) {
        std::smatch match;
        if (std::regex_search(agency, match, pattern)) {
            const std::string city = Trim(match[1].str());
            if (!city.empty()) return city + "/" + match[2].str();
        }
    }
    return {};
}

MetadataReader::BundleMetadata MetadataReader::Parse(const std::string& text) {
    BundleMetadata metadata;

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[MetadataReader] metadata.json inválido: " << e.what() << std::endl;
        return metadata;
    }
    if (!data.is_object()) {
        std::cerr << "[MetadataReader] metadata.json não é um objeto JSON" << std::endl;
        return metadata;
    }

    data.erase("threshold");
    data.erase("target");

    metadata.found = true;
    if (data.contains("bid_number")) {
        const std::string bid = Trim(ScalarToString(data["bid_number"]));
        if (!bid.empty()) metadata.bidNumber = bid;
    }
    if (data.contains("city")) {
        metadata.city = Trim(ScalarToString(data["city"]));
    }
    if (metadata.city.empty()) {
        metadata.city = ExtractCity(data);
    }
    metadata.fields = std::move(data);
    return metadata;
}

MetadataReader::BundleMetadata MetadataReader::Read(const std::string& bundleDir) {
    const fs::path metadataPath = FindMetadataFile(bundleDir);
    if (metadataPath.empty()) {
        std::cout << "[MetadataReader] metadata.json não encontrado em: " << bundleDir << std::endl;
        return {};
    }

    auto decoded = EncodingDecoder::DecodeFile(metadataPath.string());
    if (!decoded.ok) {
        std::cerr << "[MetadataReader] Não foi possível ler " << metadataPath << " com nenhum encoding" << std::endl;
        return {};
    }
    return Parse(decoded.text);
}

} // namespace editalflow::infrastructure
