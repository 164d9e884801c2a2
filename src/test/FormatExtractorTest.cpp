#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "infrastructure/DocxExtractor.hpp"
#include "infrastructure/FormatExtractor.hpp"
#include "TestSupport.hpp"

using namespace editalflow;
using editalflow::infrastructure::FormatExtractor;
using editalflow::infrastructure::PdfExtractor;
using editalflow::test::Contains;

namespace {

PdfExtractor::Backend FailingBackend(int& calls) {
    return {"quebrado", [&calls](const std::string&, int) -> std::optional<std::vector<std::string>> {
        ++calls;
        return std::nullopt;
    }};
}

PdfExtractor::Backend FixedPages(std::vector<std::string> pages) {
    return {"fixo", [pages](const std::string&, int maxPages) -> std::optional<std::vector<std::string>> {
        std::vector<std::string> out;
        for (int i = 0; i < maxPages && i < static_cast<int>(pages.size()); ++i) out.push_back(pages[i]);
        return out;
    }};
}

} // namespace

int main() {
    std::cout << "[Test] Starting FormatExtractor Test..." << std::endl;

    auto dir = test::MakeTempDir("editalflow_format");
    domain::ExtractionLimits limits;
    FormatExtractor extractor(limits);

    auto missing = extractor.extract((dir / "nao_existe.txt").string());
    assert(!missing.success);
    assert(missing.error->kind == domain::IngestionErrorKind::FileNotFound);

    std::cout << "[Test] Plain text and Markdown..." << std::endl;
    test::WriteFile(dir / "anexo.md", "# Termo de Referência\n\nAquisição de notebooks.");
    auto md = extractor.extract((dir / "anexo.md").string());
    assert(md.success);
    assert(Contains(md.content, "Aquisição de notebooks."));

    test::WriteFile(dir / "vazio.txt", " \n \n");
    auto blank = extractor.extract((dir / "vazio.txt").string());
    assert(!blank.success);
    assert(blank.error->kind == domain::IngestionErrorKind::ExtractionError);

    std::cout << "[Test] CSV rows..." << std::endl;
    test::WriteFile(dir / "itens.csv",
                    "item,descricao,quantidade\n"
                    "1, \"Notebook 14\"\" i5\" ,750\n"
                    ",,\n"
                    "\n"
                    "2,\"Mouse, sem fio\",100\n");
    auto csv = extractor.extract((dir / "itens.csv").string());
    assert(csv.success);
    assert(csv.content == "item | descricao | quantidade\n1 | Notebook 14\" i5 | 750\n2 | Mouse, sem fio | 100");

    std::cout << "[Test] JSON and metadata stripping..." << std::endl;
    const std::string payload = R"({"bid_number": "90012/2024", "target": "notebook", "threshold": 500, "object": "Notebooks"})";
    test::WriteFile(dir / "metadata.json", payload);
    test::WriteFile(dir / "dados.json", payload);

    auto metadata = extractor.extract((dir / "metadata.json").string());
    assert(metadata.success);
    auto parsedMetadata = nlohmann::json::parse(metadata.content);
    assert(!parsedMetadata.contains("target"));
    assert(!parsedMetadata.contains("threshold"));
    assert(parsedMetadata["bid_number"] == "90012/2024");

    auto other = extractor.extract((dir / "dados.json").string());
    assert(other.success);
    assert(nlohmann::json::parse(other.content).contains("target") && "Only metadata.json loses its answer keys.");

    test::WriteFile(dir / "quebrado.json", "{\"a\": ");
    assert(!extractor.extract((dir / "quebrado.json").string()).success);

    std::cout << "[Test] PDF backends..." << std::endl;
    test::WriteFile(dir / "edital.pdf", "%PDF-1.4 corrompido");
    auto corrupt = extractor.extract((dir / "edital.pdf").string());
    assert(!corrupt.success && "A corrupt PDF is an extraction error.");
    assert(corrupt.error->kind == domain::IngestionErrorKind::ExtractionError);

    int failingCalls = 0;
    const std::string longPage(80, 'x');
    FormatExtractor withBackends(limits, {FailingBackend(failingCalls),
                                          FixedPages({"Capa", "Página com o objeto: " + longPage, "   "})});
    auto pdf = withBackends.extract((dir / "edital.pdf").string());
    assert(failingCalls == 1 && "The first backend is tried before falling back.");
    assert(pdf.success);
    assert(pdf.method == "fixo");
    assert(Contains(pdf.content, "=== Página 2 ==="));
    assert(!Contains(pdf.content, "=== Página 1 ===") && "Near-empty pages are dropped.");

    domain::ExtractionLimits onePage;
    onePage.pdfMaxPages = 1;
    FormatExtractor firstPageOnly(onePage, {FixedPages({"Capa", "Página com o objeto: " + longPage})});
    assert(!firstPageOnly.extract((dir / "edital.pdf").string()).success);

    std::cout << "[Test] DOCX..." << std::endl;
    test::WriteDocx(dir / "termo.docx",
                    "<w:p><w:r><w:t>Objeto: aquisição de</w:t></w:r><w:r><w:t xml:space=\"preserve\"> notebooks</w:t></w:r></w:p>"
                    "<w:p><w:r><w:t>Prazo:</w:t><w:tab/><w:t>30 dias</w:t></w:r></w:p>"
                    "<w:tbl><w:tr><w:tc><w:p><w:r><w:t>Item</w:t></w:r></w:p></w:tc>"
                    "<w:tc><w:p><w:r><w:t>Quantidade</w:t></w:r></w:p></w:tc></w:tr>"
                    "<w:tr><w:tc><w:p><w:r><w:t>Notebook</w:t></w:r></w:p></w:tc>"
                    "<w:tc><w:p><w:r><w:t>750</w:t></w:r></w:p></w:tc></w:tr></w:tbl>");
    auto docx = extractor.extract((dir / "termo.docx").string());
    assert(docx.success);
    assert(docx.method == "docx-xml");
    assert(Contains(docx.content, "Objeto: aquisição de notebooks"));
    assert(Contains(docx.content, "Prazo: 30 dias"));
    assert(Contains(docx.content, "Notebook | 750"));

    test::WriteFile(dir / "falso.docx", "não é um zip");
    assert(!extractor.extract((dir / "falso.docx").string()).success);

    std::string xmlError;
    assert(!infrastructure::DocxExtractor::TextFromDocumentXml("<w:document>", xmlError));
    assert(!xmlError.empty());

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] FormatExtractor Test passed!" << std::endl;
    return 0;
}
