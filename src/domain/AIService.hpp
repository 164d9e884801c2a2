/**
 * @file AIService.hpp
 * @brief Interface of the language model used by the analysis stages.
 */

#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace editalflow::domain {

/**
 * @class AIService
 * @brief Abstract interface for the model that summarizes and judges a bidding document.
 *
 * Calls are synchronous. An empty optional means the call failed (connection, timeout or
 * an unreadable reply); callers treat that as a stage failure.
 */
class AIService {
public:
    virtual ~AIService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Generates a JSON-only response constrained by a JSON schema.
     * @param systemPrompt System-level instructions.
     * @param userPrompt User content (the document or request).
     * @param responseSchema JSON schema the reply must follow.
     * @return Optional JSON string if generation succeeded.
     */
    virtual std::optional<std::string> generateJson(const std::string& systemPrompt,
                                                    const std::string& userPrompt,
                                                    const nlohmann::json& responseSchema) = 0;

    /**
     * @brief Generates a free-text response.
     * @param systemPrompt System-level instructions.
     * @param userPrompt User content.
     * @return Optional text if generation succeeded.
     */
    virtual std::optional<std::string> generateText(const std::string& systemPrompt,
                                                    const std::string& userPrompt) = 0;

    /**
     * @brief Gets the name of the currently selected AI model.
     * @return The model name.
     */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace editalflow::domain
