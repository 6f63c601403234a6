/**
 * @file AimoModelAdapter.cpp
 * @brief Implementation of the AimoModelAdapter class.
 */
#include "infrastructure/AimoModelAdapter.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace noteagent::infrastructure {

AimoModelAdapter::AimoModelAdapter(const AgentSettings& settings)
    : m_client(settings.endpoint, settings.basePath, settings.apiKey, settings.timeoutSeconds),
      m_model(settings.model) {
    m_options.temperature = settings.temperature;
    m_options.maxTokens = settings.maxTokens;
    m_options.topP = settings.topP;
}

void AimoModelAdapter::initialize() {
    auto models = m_client.getAvailableModels();
    std::string model = getCurrentModel();
    if (models.empty()) {
        std::cerr << "[AimoModelAdapter] Could not list models. Keeping configured model: " << model << std::endl;
        return;
    }
    if (std::find(models.begin(), models.end(), model) == models.end()) {
        std::cerr << "[AimoModelAdapter] Model '" << model << "' is not served by the endpoint ("
                  << models.size() << " models available)" << std::endl;
    } else {
        std::cout << "[AimoModelAdapter] Using model: " << model << std::endl;
    }
}

json AimoModelAdapter::ToMessagesJson(const std::vector<domain::AIService::ChatMessage>& history) {
    json messagesJson = json::array();
    for (const auto& msg : history) {
        messagesJson.push_back({
            {"role", domain::AIService::ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    return messagesJson;
}

std::optional<std::string> AimoModelAdapter::chat(const std::vector<domain::AIService::ChatMessage>& history) {
    return m_client.chat(getCurrentModel(), ToMessagesJson(history), m_options);
}

std::vector<std::string> AimoModelAdapter::getAvailableModels() {
    return m_client.getAvailableModels();
}

void AimoModelAdapter::setModel(const std::string& modelName) {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    m_model = modelName;
}

std::string AimoModelAdapter::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace noteagent::infrastructure
