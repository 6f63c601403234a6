/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/NoteAgentError.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace noteagent::infrastructure {

using json = nlohmann::json;

namespace {

[[noreturn]] void ConfigError(const std::string& message) {
    throw domain::NoteAgentError(domain::ErrorKind::ConfigurationError, message);
}

std::filesystem::path ResolvePath(const std::string& configPath) {
    return configPath.empty() ? PathUtils::GetDefaultSettingsPath() : std::filesystem::path(configPath);
}

} // namespace

AgentSettings ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        ConfigError("settings must be a JSON object");
    }

    AgentSettings settings;
    try {
        settings.endpoint = j.value("endpoint", settings.endpoint);
        settings.basePath = j.value("basePath", settings.basePath);
        settings.model = j.value("model", settings.model);
        settings.temperature = j.value("temperature", settings.temperature);
        settings.maxTokens = j.value("maxTokens", settings.maxTokens);
        settings.topP = j.value("topP", settings.topP);
        settings.timeoutSeconds = j.value("timeoutSeconds", settings.timeoutSeconds);
        settings.apiKey = j.value("apiKey", settings.apiKey);
    } catch (const json::exception& e) {
        ConfigError(std::string("invalid settings value: ") + e.what());
    }

    if (j.contains("maxHistoryMessages")) {
        const auto& v = j["maxHistoryMessages"];
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            ConfigError("maxHistoryMessages must be a non-negative integer");
        }
        settings.maxHistoryMessages = v.get<std::size_t>();
    }
    if (settings.timeoutSeconds <= 0) {
        ConfigError("timeoutSeconds must be positive");
    }
    return settings;
}

json ConfigLoader::ToJson(const AgentSettings& settings) {
    return {
        {"endpoint", settings.endpoint},
        {"basePath", settings.basePath},
        {"model", settings.model},
        {"temperature", settings.temperature},
        {"maxTokens", settings.maxTokens},
        {"topP", settings.topP},
        {"timeoutSeconds", settings.timeoutSeconds},
        {"maxHistoryMessages", settings.maxHistoryMessages},
        {"apiKey", settings.apiKey}
    };
}

AgentSettings ConfigLoader::LoadSettings(const std::string& configPath) {
    std::filesystem::path path = ResolvePath(configPath);

    AgentSettings settings;
    if (std::filesystem::exists(path)) {
        std::ifstream f(path);
        if (!f.is_open()) {
            ConfigError("cannot open " + path.string());
        }
        json j;
        try {
            f >> j;
        } catch (const json::parse_error& e) {
            ConfigError("error reading " + path.string() + ": " + e.what());
        }
        settings = FromJson(j);
    } else {
        std::cout << "[ConfigLoader] No settings at " << path << ", using defaults" << std::endl;
    }

    const char* envKey = std::getenv(kApiKeyEnv);
    if (envKey && *envKey) {
        settings.apiKey = envKey;
    }
    return settings;
}

bool ConfigLoader::SaveSettings(const std::string& configPath, const AgentSettings& settings) {
    std::filesystem::path path = ResolvePath(configPath);
    json j = json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            f >> j;
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, overwriting: " << e.what() << std::endl;
            j = json::object();
        }
        if (!j.is_object()) j = json::object();
    }

    j.update(ToJson(settings));

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ConfigLoader] Error creating config directory: " << e.what() << std::endl;
        return false;
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << path << std::endl;
        return false;
    }
    f << j.dump(4);
    return !f.fail();
}

} // namespace noteagent::infrastructure
