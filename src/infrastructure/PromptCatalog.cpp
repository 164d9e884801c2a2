#include "infrastructure/PromptCatalog.hpp"

namespace editalflow::infrastructure {

using json = nlohmann::json;

namespace {

json StringProperty(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

std::string MetadataField(const json& metadata, const char* key) {
    if (metadata.is_object() && metadata.contains(key) && metadata[key].is_string()) {
        return metadata[key].get<std::string>();
    }
    return "";
}

} // namespace

std::string PromptCatalog::GetSummarySystemPrompt() {
    return
        "Você é um analista de licitações públicas brasileiras. Leia o edital e produza um resumo executivo fiel ao texto.\n\n"
        "REGRAS:\n"
        "1. Descreva APENAS o que está no documento. Não invente datas, valores ou contatos.\n"
        "2. Campos sem informação no texto devem ser retornados como string vazia.\n"
        "3. 'city' deve seguir o formato Cidade/UF quando identificável.\n"
        "4. Retorne APENAS o JSON pedido, sem texto extra.";
}

json PromptCatalog::GetSummarySchema() {
    return {
        {"title", "SummaryAnalysis"},
        {"type", "object"},
        {"properties", {
            {"summary", StringProperty("Resumo executivo do edital")},
            {"city", StringProperty("Cidade/UF do órgão licitante")},
            {"title", StringProperty("Título do edital")},
            {"object", StringProperty("Objeto da licitação")},
            {"quantities", StringProperty("Quantidades mencionadas")},
            {"specifications", StringProperty("Especificações técnicas principais")},
            {"deadlines", StringProperty("Prazos e datas")},
            {"values", StringProperty("Valores estimados")},
            {"phone", StringProperty("Telefone de contato")},
            {"website", StringProperty("Website")},
            {"email", StringProperty("Email de contato")}
        }},
        {"required", json::array({"summary"})}
    };
}

std::string PromptCatalog::BuildSummaryPrompt(const std::string& content, const json& metadata) {
    std::string prompt = "METADADOS DO EDITAL:\n" + metadata.dump(2) + "\n\n";
    prompt += "CONTEÚDO DO EDITAL:\n" + content;
    return prompt;
}

std::string PromptCatalog::GetTargetSystemPrompt() {
    return
        "Você avalia se um edital de licitação é relevante para um tema alvo.\n"
        "Considere sinônimos e variações do termo (ex.: 'notebook' inclui 'laptop' e 'computador portátil').\n"
        "Um edital é relevante quando o objeto contratado inclui o alvo, não quando apenas o menciona de passagem.\n"
        "Retorne APENAS o JSON pedido.";
}

json PromptCatalog::GetTargetSchema() {
    return {
        {"title", "TargetAnalysis"},
        {"type", "object"},
        {"properties", {
            {"is_relevant", {{"type", "boolean"}}},
            {"confidence", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}}},
            {"matching_terms", {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"explanation", StringProperty("Motivo da decisão")}
        }},
        {"required", json::array({"is_relevant", "explanation"})}
    };
}

std::string PromptCatalog::BuildTargetPrompt(const std::string& target, const std::string& summary,
                                             const json& metadata) {
    std::string prompt = "ALVO: " + target + "\n\n";
    prompt += "OBJETO: " + MetadataField(metadata, "object") + "\n";
    prompt += "ESPECIFICAÇÕES: " + MetadataField(metadata, "specifications") + "\n\n";
    prompt += "RESUMO DO EDITAL:\n" + summary;
    return prompt;
}

std::string PromptCatalog::GetQuantitySystemPrompt() {
    return
        "Você extrai quantidades de itens de editais de licitação.\n"
        "Some as quantidades do item alvo que aparecem NESTE trecho (lotes, itens, unidades).\n"
        "Se o trecho não mencionar quantidade do alvo, retorne total_quantity 0.\n"
        "total_quantity deve ser um inteiro não negativo e unit uma string não vazia (ex.: 'unidades').\n"
        "Retorne APENAS o JSON pedido.";
}

json PromptCatalog::GetQuantitySchema() {
    return {
        {"title", "QuantitiesAnalysis"},
        {"type", "object"},
        {"properties", {
            {"total_quantity", {{"type", "integer"}, {"minimum", 0}}},
            {"unit", StringProperty("Unidade de medida")},
            {"explanation", StringProperty("De onde vieram os números")}
        }},
        {"required", json::array({"total_quantity", "unit", "explanation"})}
    };
}

std::string PromptCatalog::BuildQuantityPrompt(const std::string& target, int threshold, const std::string& chunkText,
                                               std::size_t chunkIndex, std::size_t chunkCount) {
    std::string prompt = "ALVO: " + target + "\n";
    prompt += "QUANTIDADE MÍNIMA DE INTERESSE: " + std::to_string(threshold) + "\n";
    prompt += "TRECHO " + std::to_string(chunkIndex + 1) + " DE " + std::to_string(chunkCount) + ":\n";
    prompt += chunkText;
    return prompt;
}

std::string PromptCatalog::GetJustificationSystemPrompt() {
    return
        "Você redige a justificativa final da análise de um edital de licitação.\n"
        "Em um parágrafo curto, explique se o edital é relevante para o alvo e por quê,\n"
        "citando a correspondência com o alvo e, quando houver, a quantidade frente ao mínimo exigido.\n"
        "Responda em português, em texto corrido, sem listas.";
}

std::string PromptCatalog::BuildJustificationPrompt(const std::string& target, bool targetMatch,
                                                    const std::string& thresholdMatch, int threshold,
                                                    const std::string& summary) {
    std::string prompt = "ALVO: " + target + "\n";
    prompt += "CORRESPONDE AO ALVO: " + std::string(targetMatch ? "sim" : "não") + "\n";
    prompt += "QUANTIDADE MÍNIMA: " + std::to_string(threshold) + "\n";
    prompt += "ATENDE À QUANTIDADE: " + thresholdMatch + "\n\n";
    prompt += "RESUMO DO EDITAL:\n" + summary;
    return prompt;
}

} // namespace editalflow::infrastructure
