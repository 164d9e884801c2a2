#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "infrastructure/ArchiveExtractor.hpp"
#include "infrastructure/FormatExtractor.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using namespace editalflow;
using editalflow::infrastructure::ArchiveExtractor;
using editalflow::test::Contains;

namespace {

bool IsEmptyDirectory(const fs::path& dir) {
    return fs::is_directory(dir) && fs::directory_iterator(dir) == fs::directory_iterator();
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveExtractor Test..." << std::endl;

    auto dir = test::MakeTempDir("editalflow_archive");
    auto scratchRoot = dir / "scratch";
    fs::create_directories(scratchRoot);

    domain::ExtractionLimits limits;
    infrastructure::FormatExtractor formats(limits);
    ArchiveExtractor extractor(formats, scratchRoot);

    std::cout << "[Test] Flat archive..." << std::endl;
    test::WriteZip(dir / "anexos.zip", {
        {"b_termo.txt", "Termo de referência: 750 notebooks."},
        {"a_itens.csv", "item,quantidade\nnotebook,750\n"},
        {"vazio.txt", "   "},
    });
    assert(ArchiveExtractor::IsZipFile((dir / "anexos.zip").string()));
    auto flat = extractor.extractZip((dir / "anexos.zip").string(), limits.zipMaxChars);
    assert(flat.success);
    assert(flat.method == "zip");
    assert(Contains(flat.content, "=== a_itens.csv ==="));
    assert(Contains(flat.content, "notebook | 750"));
    assert(flat.content.find("a_itens.csv") < flat.content.find("b_termo.txt") && "Members are walked in sorted order.");
    assert(!flat.warnings.empty() && "The blank member is reported and skipped.");
    assert(IsEmptyDirectory(scratchRoot));

    std::cout << "[Test] Depth bound with four nested levels..." << std::endl;
    test::WriteZip(dir / "l3.zip", {{"d.txt", "conteudo do quarto nivel"}});
    test::WriteZip(dir / "l2.zip", {{"c.txt", "conteudo do terceiro nivel"}, {"l3.zip", test::ReadFile(dir / "l3.zip")}});
    test::WriteZip(dir / "l1.zip", {{"b.txt", "conteudo do segundo nivel"}, {"l2.zip", test::ReadFile(dir / "l2.zip")}});
    test::WriteZip(dir / "outer.zip", {{"a.txt", "conteudo do primeiro nivel"}, {"l1.zip", test::ReadFile(dir / "l1.zip")}});

    auto nested = extractor.extractZip((dir / "outer.zip").string(), limits.zipMaxChars, 3, 0);
    assert(nested.success);
    assert(Contains(nested.content, "conteudo do primeiro nivel"));
    assert(Contains(nested.content, "=== ZIP ANINHADO: l1.zip ==="));
    assert(Contains(nested.content, "conteudo do terceiro nivel"));
    assert(Contains(nested.content, ArchiveExtractor::DepthLimitMarker(3)));
    assert(!Contains(nested.content, "conteudo do quarto nivel") && "The fourth level is never opened.");
    assert(IsEmptyDirectory(scratchRoot));

    auto atLimit = extractor.extractZip((dir / "outer.zip").string(), limits.zipMaxChars, 3, 3);
    assert(atLimit.success && atLimit.depthLimited);

    std::cout << "[Test] Nested chain without sibling text..." << std::endl;
    test::WriteZip(dir / "s3.zip", {{"d.txt", "conteudo do quarto nivel"}});
    test::WriteZip(dir / "s2.zip", {{"s3.zip", test::ReadFile(dir / "s3.zip")}});
    test::WriteZip(dir / "s1.zip", {{"s2.zip", test::ReadFile(dir / "s2.zip")}});
    test::WriteZip(dir / "cadeia.zip", {{"s1.zip", test::ReadFile(dir / "s1.zip")}});

    auto chain = extractor.extractZip((dir / "cadeia.zip").string(), limits.zipMaxChars, 3, 0);
    assert(chain.success && "Hitting the depth cap is not an error.");
    assert(chain.depthLimited);
    assert(!chain.error);
    assert(Contains(chain.content, "=== ZIP ANINHADO: s1.zip ==="));
    assert(Contains(chain.content, "=== ZIP ANINHADO: s3.zip ==="));
    assert(Contains(chain.content, ArchiveExtractor::DepthLimitMarker(3)));
    assert(!Contains(chain.content, "conteudo do quarto nivel"));
    assert(IsEmptyDirectory(scratchRoot));

    std::cout << "[Test] Truncation..." << std::endl;
    auto truncated = extractor.extractZip((dir / "anexos.zip").string(), 20);
    assert(truncated.success);
    assert(Contains(truncated.content, ArchiveExtractor::TruncationMarker(20)));

    std::cout << "[Test] Bad and empty archives..." << std::endl;
    auto missing = extractor.extractZip((dir / "nao_existe.zip").string(), limits.zipMaxChars);
    assert(!missing.success);
    assert(missing.error->kind == domain::IngestionErrorKind::BadArchive);

    test::WriteFile(dir / "falso.zip", "isto não é um zip");
    auto notZip = extractor.extractZip((dir / "falso.zip").string(), limits.zipMaxChars);
    assert(notZip.error && notZip.error->kind == domain::IngestionErrorKind::BadArchive);

    std::string corrupt = test::ReadFile(dir / "anexos.zip").substr(0, 40);
    test::WriteFile(dir / "truncado.zip", corrupt);
    auto broken = extractor.extractZip((dir / "truncado.zip").string(), limits.zipMaxChars);
    assert(!broken.success);
    assert(broken.error->kind == domain::IngestionErrorKind::BadArchive);
    assert(IsEmptyDirectory(scratchRoot) && "Scratch space is released after a failure too.");

    test::WriteZip(dir / "sem_texto.zip", {{"branco.txt", "  \n "}});
    auto empty = extractor.extractZip((dir / "sem_texto.zip").string(), limits.zipMaxChars);
    assert(!empty.success);
    assert(empty.error->kind == domain::IngestionErrorKind::EmptyArchive);
    assert(IsEmptyDirectory(scratchRoot));

    fs::remove_all(dir);
    std::cout << "[PASS] ArchiveExtractor Test passed!" << std::endl;
    return 0;
}
