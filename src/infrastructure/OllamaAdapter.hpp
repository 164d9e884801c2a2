/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "domain/AIService.hpp"
#include "domain/AnalysisSettings.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace editalflow::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements AIService using the Ollama REST API.
 */
class OllamaAdapter : public domain::AIService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param settings Server address, timeout and optional pinned model.
     */
    explicit OllamaAdapter(const domain::OllamaSettings& settings);

    /** @brief Picks an installed model unless one was pinned in the settings. */
    void initialize() override;

    /** @brief Schema-constrained generation. @see domain::AIService::generateJson */
    std::optional<std::string> generateJson(const std::string& systemPrompt,
                                            const std::string& userPrompt,
                                            const nlohmann::json& responseSchema) override;

    /** @brief Free-text generation. @see domain::AIService::generateText */
    std::optional<std::string> generateText(const std::string& systemPrompt,
                                            const std::string& userPrompt) override;

    std::string getCurrentModel() const override;

private:
    void detectBestModel();

    OllamaClient m_client;
    bool m_modelPinned = false;
    std::string m_model = "qwen2.5:7b"; ///< Target model name.
};

} // namespace editalflow::infrastructure
