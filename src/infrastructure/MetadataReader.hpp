/**
 * @file MetadataReader.hpp
 * @brief Reads the optional metadata.json of a document bundle.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace editalflow::infrastructure {

class MetadataReader {
public:
    struct BundleMetadata {
        nlohmann::json fields = nlohmann::json::object(); ///< Without "threshold" and "target".
        std::string bidNumber = "N/A";
        std::string city;  ///< Empty when neither "city" nor a City/UF agency is present.
        bool found = false;
    };

    /**
     * @brief Reads <bundleDir>/metadata.json. A missing or unreadable file is not an error:
     *        the result then only carries bidNumber "N/A".
     */
    static BundleMetadata Read(const std::string& bundleDir);

    /**
     * @brief Parses metadata text (already decoded to UTF-8).
     * @return Metadata; found=false when the text is not a JSON object.
     */
    static BundleMetadata Parse(const std::string& text);

    /** @brief "City/UF" from the agency field ("Cidade/UF", "Cidade - UF", "Cidade, UF"). */
    static std::string ExtractCity(const nlohmann::json& metadata);

    /** @brief Strings as-is, numbers and booleans in their JSON form, anything else empty. */
    static std::string ScalarToString(const nlohmann::json& value);
};

} // namespace editalflow::infrastructure
