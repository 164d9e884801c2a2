#include <cassert>
#include <filesystem>
#include <iostream>

#include "infrastructure/MetadataReader.hpp"
#include "TestSupport.hpp"

using namespace editalflow;
using editalflow::infrastructure::MetadataReader;

int main() {
    std::cout << "[Test] Starting MetadataReader Test..." << std::endl;

    auto parsed = MetadataReader::Parse(
        R"({"bid_number": "PE 12/2024", "agency": "Prefeitura Municipal de Maringá/PR", "object": "Notebooks",
            "target": "notebook", "threshold": 100})");
    assert(parsed.found);
    assert(parsed.bidNumber == "PE 12/2024");
    assert(parsed.city == "Prefeitura Municipal de Maringá/PR");
    assert(!parsed.fields.contains("target") && !parsed.fields.contains("threshold"));
    assert(parsed.fields["object"] == "Notebooks");

    auto explicitCity = MetadataReader::Parse(R"({"city": "Recife/PE", "agency": "Governo, SP"})");
    assert(explicitCity.city == "Recife/PE");
    assert(explicitCity.bidNumber == "N/A");

    nlohmann::json agency = {{"agency", "Secretaria de Saúde, BA"}};
    assert(MetadataReader::ExtractCity(agency) == "Secretaria de Saúde/BA");
    agency["agency"] = "Ministério da Educação";
    assert(MetadataReader::ExtractCity(agency).empty());

    assert(!MetadataReader::Parse("[1, 2]").found);
    assert(!MetadataReader::Parse("{ quebrado").found);

    assert(MetadataReader::ScalarToString(nlohmann::json(42)) == "42");
    assert(MetadataReader::ScalarToString(nlohmann::json::array()).empty());

    std::cout << "[Test] Reading from a bundle..." << std::endl;
    auto dir = test::MakeTempDir("editalflow_metadata");
    auto none = MetadataReader::Read(dir.string());
    assert(!none.found);
    assert(none.bidNumber == "N/A");

    test::WriteFile(dir / "METADATA.json", "{\"bid_number\": 77, \"object\": \"Aquisi\xE7\xE3o\"}");
    auto latin = MetadataReader::Read(dir.string());
    assert(latin.found && "Case-insensitive name, Latin-1 bytes.");
    assert(latin.bidNumber == "77");
    assert(latin.fields["object"] == "Aquisição");

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] MetadataReader Test passed!" << std::endl;
    return 0;
}
