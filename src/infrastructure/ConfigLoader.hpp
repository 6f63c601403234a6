/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving agent configuration (settings.json).
 *
 * Provides a unified way to access the completion endpoint, model and request
 * parameters without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace noteagent::infrastructure {

/**
 * @struct AgentSettings
 * @brief Completion backend and conversation settings. Defaults match a fresh install.
 */
struct AgentSettings {
    std::string endpoint = "http://localhost:11434"; ///< scheme://host:port
    std::string basePath = "/v1";
    std::string model = "aimo-chat";
    double temperature = 0.5;
    int maxTokens = 1000;
    double topP = 0.95;
    int timeoutSeconds = 600;
    std::size_t maxHistoryMessages = 0; ///< 0 keeps the whole history.
    std::string apiKey;
};

class ConfigLoader {
public:
    /** @brief Environment variable that overrides the `apiKey` key. */
    static constexpr const char* kApiKeyEnv = "NOTEAGENT_API_KEY";

    /**
     * @brief Reads settings.json.
     * @param configPath Explicit file; empty means PathUtils::GetDefaultSettingsPath().
     * @return Defaults when the file does not exist.
     * @throws domain::NoteAgentError (ConfigurationError) when the file cannot be read or parsed.
     */
    static AgentSettings LoadSettings(const std::string& configPath = "");

    /** @brief Overlays the keys present in `j` on the defaults. */
    static AgentSettings FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const AgentSettings& settings);

    /**
     * @brief Writes settings back, preserving keys this struct does not know about.
     * @return false (and logs) when the file could not be written.
     */
    static bool SaveSettings(const std::string& configPath, const AgentSettings& settings);
};

} // namespace noteagent::infrastructure
