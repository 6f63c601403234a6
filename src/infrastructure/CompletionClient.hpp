/**
 * @file CompletionClient.hpp
 * @brief Low-level HTTP client for an OpenAI-compatible chat completion API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace noteagent::infrastructure {

/**
 * @struct CompletionOptions
 * @brief Sampling parameters sent with every request.
 */
struct CompletionOptions {
    double temperature = 0.5;
    int maxTokens = 1000;
    double topP = 0.95;
};

class CompletionClient {
public:
    /**
     * @param endpoint scheme://host:port of the server.
     * @param basePath Prefix before /chat/completions and /models (e.g. "/v1").
     */
    CompletionClient(const std::string& endpoint = "http://localhost:11434",
                     const std::string& basePath = "/v1",
                     const std::string& apiKey = "",
                     int timeoutSeconds = 600);

    /** @brief Request body for POST {basePath}/chat/completions. */
    static nlohmann::json BuildRequest(const std::string& model,
                                       const nlohmann::json& messages,
                                       const CompletionOptions& options);

    /** @brief `choices[0].message.content` of a completion response, if present. */
    static std::optional<std::string> ExtractContent(const nlohmann::json& body);

    /** @brief Sends a POST request to {basePath}/chat/completions. */
    std::optional<std::string> chat(const std::string& model,
                                    const nlohmann::json& messages,
                                    const CompletionOptions& options);

    /** @brief Fetches model ids from {basePath}/models. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_endpoint;
    std::string m_basePath;
    std::string m_apiKey;
    int m_timeoutSeconds;
};

} // namespace noteagent::infrastructure
