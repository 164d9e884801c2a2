/**
 * @file ContentSizeGuard.cpp
 * @brief Implementation of ContentSizeGuard.
 */

#include "application/ContentSizeGuard.hpp"
#include "infrastructure/TextNormalizer.hpp"

namespace editalflow::application {

std::optional<domain::IngestionError> ContentSizeGuard::Check(const std::string& text, std::size_t maxChars) {
    const std::size_t actual = infrastructure::TextNormalizer::CharacterCount(text);
    if (actual <= maxChars) {
        return std::nullopt;
    }

    auto error = domain::IngestionError::Make(
        domain::IngestionErrorKind::DocumentTooLarge,
        "Documento muito grande: " + std::to_string(actual) + " caracteres (limite: " +
            std::to_string(maxChars) + ")");
    error.maxChars = maxChars;
    error.actualChars = actual;
    return error;
}

std::string ContentSizeGuard::Justification(const domain::IngestionError& error) {
    return "Não foi possível processar a análise por completo pois o documento é muito grande "
           "(tamanho atual: " + std::to_string(error.actualChars) + " caracteres, limite: " +
           std::to_string(error.maxChars) + " caracteres). Por segurança, o edital foi marcado como não relevante.";
}

} // namespace editalflow::application
