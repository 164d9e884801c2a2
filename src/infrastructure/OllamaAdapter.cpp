/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include <iostream>
#include <vector>

namespace editalflow::infrastructure {

OllamaAdapter::OllamaAdapter(const domain::OllamaSettings& settings)
    : m_client(settings.host, settings.port, settings.readTimeoutSeconds) {
    if (!settings.model.empty()) {
        m_model = settings.model;
        m_modelPinned = true;
    }
}

void OllamaAdapter::initialize() {
    if (!m_modelPinned) {
        detectBestModel();
    }
}

void OllamaAdapter::detectBestModel() {
    auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaAdapter] No models reported by the server, keeping " << m_model << std::endl;
        return;
    }

    // Priority Hierarchy
    const std::vector<std::string> priorities = {
        "qwen2.5:7b",
        "qwen2.5",
        "llama3",
        "mistral",
        "gemma"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                m_model = model;
                std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }

    m_model = availableModels.front();
    std::cout << "[OllamaAdapter] Fallback model: " << m_model << std::endl;
}

std::optional<std::string> OllamaAdapter::generateJson(const std::string& systemPrompt,
                                                       const std::string& userPrompt,
                                                       const nlohmann::json& responseSchema) {
    std::cout << "[OllamaAdapter] Sending request to " << m_model << " (JSON schema)"
              << " PromptSize=" << (systemPrompt.size() + userPrompt.size()) << " bytes" << std::endl;
    const nlohmann::json format = responseSchema.is_null() ? nlohmann::json("json") : responseSchema;
    return m_client.generate(m_model, systemPrompt, userPrompt, format);
}

std::optional<std::string> OllamaAdapter::generateText(const std::string& systemPrompt,
                                                       const std::string& userPrompt) {
    std::cout << "[OllamaAdapter] Sending request to " << m_model << " (text)"
              << " PromptSize=" << (systemPrompt.size() + userPrompt.size()) << " bytes" << std::endl;
    return m_client.generate(m_model, systemPrompt, userPrompt);
}

std::string OllamaAdapter::getCurrentModel() const {
    return m_model;
}

} // namespace editalflow::infrastructure
