/**
 * @file AimoModelAdapter.hpp
 * @brief Adapter for communication with an OpenAI-compatible completion server.
 */

#pragma once
#include "domain/AIService.hpp"
#include "infrastructure/CompletionClient.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <mutex>
#include <string>

namespace noteagent::infrastructure {

/**
 * @class AimoModelAdapter
 * @brief Implements AIService using CompletionClient and the loaded AgentSettings.
 */
class AimoModelAdapter : public domain::AIService {
public:
    explicit AimoModelAdapter(const AgentSettings& settings);

    /** @brief Logs whether the configured model is served. */
    void initialize() override;

    /** @brief Sends a chat history to the AI. @see domain::AIService::chat */
    std::optional<std::string> chat(const std::vector<domain::AIService::ChatMessage>& history) override;

    std::vector<std::string> getAvailableModels() override;
    void setModel(const std::string& modelName) override;
    std::string getCurrentModel() const override;

    /** @brief `[{role, content}, ...]` as sent on the wire. */
    static nlohmann::json ToMessagesJson(const std::vector<domain::AIService::ChatMessage>& history);

private:
    CompletionClient m_client;
    CompletionOptions m_options;
    mutable std::mutex m_modelMutex;
    std::string m_model; ///< Target model name.
};

} // namespace noteagent::infrastructure
