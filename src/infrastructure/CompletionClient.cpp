#include "infrastructure/CompletionClient.hpp"
#include <httplib.h>
#include <iostream>

namespace noteagent::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kModelListTimeoutSeconds = 5;

httplib::Headers AuthHeaders(const std::string& apiKey) {
    httplib::Headers headers;
    if (!apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + apiKey);
    }
    return headers;
}
}

CompletionClient::CompletionClient(const std::string& endpoint,
                                   const std::string& basePath,
                                   const std::string& apiKey,
                                   int timeoutSeconds)
    : m_endpoint(endpoint), m_basePath(basePath), m_apiKey(apiKey), m_timeoutSeconds(timeoutSeconds) {}

json CompletionClient::BuildRequest(const std::string& model,
                                    const json& messages,
                                    const CompletionOptions& options) {
    return {
        {"model", model},
        {"messages", messages},
        {"temperature", options.temperature},
        {"max_tokens", options.maxTokens},
        {"top_p", options.topP},
        {"stream", false}
    };
}

std::optional<std::string> CompletionClient::ExtractContent(const json& body) {
    if (!body.is_object() || !body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
        return std::nullopt;
    }
    const auto& choice = body["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        return std::nullopt;
    }
    const auto& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
        return std::nullopt;
    }
    return message["content"].get<std::string>();
}

std::optional<std::string> CompletionClient::chat(const std::string& model,
                                                  const json& messages,
                                                  const CompletionOptions& options) {
    httplib::Client cli(m_endpoint);
    cli.set_read_timeout(m_timeoutSeconds);

    json requestData = BuildRequest(model, messages, options);

    auto res = cli.Post(m_basePath + "/chat/completions", AuthHeaders(m_apiKey),
                        requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto content = ExtractContent(json::parse(res->body));
            if (!content) {
                std::cerr << "[CompletionClient] Response has no choices[0].message.content" << std::endl;
            }
            return content;
        } catch (const std::exception& e) {
            std::cerr << "[CompletionClient] Chat JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[CompletionClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[CompletionClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        }
    }
    return std::nullopt;
}

std::vector<std::string> CompletionClient::getAvailableModels() {
    httplib::Client cli(m_endpoint);
    cli.set_read_timeout(kModelListTimeoutSeconds);

    auto res = cli.Get(m_basePath + "/models", AuthHeaders(m_apiKey));
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("data") && body["data"].is_array()) {
                for (const auto& item : body["data"]) {
                    if (item.contains("id") && item["id"].is_string()) {
                        models.push_back(item["id"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[CompletionClient] Models JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        std::cerr << "[CompletionClient] Failed to list models from " << m_endpoint << m_basePath << "/models" << std::endl;
    }
    return models;
}

} // namespace noteagent::infrastructure
