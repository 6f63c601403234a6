#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "domain/NoteAgentError.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace noteagent::infrastructure;
using noteagent::domain::ErrorKind;
using noteagent::domain::NoteAgentError;
using json = nlohmann::json;

namespace {

const std::string kTestRoot = "test_config_root";

std::string WriteSettings(const std::string& name, const std::string& content) {
    std::filesystem::path path = std::filesystem::path(kTestRoot) / name;
    std::ofstream f(path);
    f << content;
    return path.string();
}

bool ThrowsConfigurationError(const std::string& path) {
    try {
        ConfigLoader::LoadSettings(path);
    } catch (const NoteAgentError& e) {
        return e.kind() == ErrorKind::ConfigurationError;
    }
    return false;
}

void TestDefaults() {
    std::cout << "[Test] Missing file yields defaults..." << std::endl;
    AgentSettings settings = ConfigLoader::LoadSettings(kTestRoot + "/does-not-exist.json");
    assert(settings.endpoint == "http://localhost:11434");
    assert(settings.basePath == "/v1");
    assert(settings.model == "aimo-chat");
    assert(settings.temperature == 0.5);
    assert(settings.maxTokens == 1000);
    assert(settings.topP == 0.95);
    assert(settings.timeoutSeconds == 600);
    assert(settings.maxHistoryMessages == 0);
    assert(settings.apiKey.empty());
    std::cout << "[PASS] Missing file yields defaults." << std::endl;
}

void TestOverlay() {
    std::cout << "[Test] Present keys override defaults..." << std::endl;
    std::string path = WriteSettings("partial.json",
        R"({ "model": "gpt-mini", "temperature": 0.1, "maxHistoryMessages": 6, "apiKey": "file-key", "theme": "dark" })");
    AgentSettings settings = ConfigLoader::LoadSettings(path);
    assert(settings.model == "gpt-mini");
    assert(settings.temperature == 0.1);
    assert(settings.maxHistoryMessages == 6);
    assert(settings.apiKey == "file-key");
    assert(settings.maxTokens == 1000);
    std::cout << "[PASS] Present keys override defaults." << std::endl;
}

void TestInvalidFiles() {
    std::cout << "[Test] Invalid settings are rejected..." << std::endl;
    assert(ThrowsConfigurationError(WriteSettings("broken.json", "{ \"model\": ")));
    assert(ThrowsConfigurationError(WriteSettings("array.json", "[1, 2]")));
    assert(ThrowsConfigurationError(WriteSettings("type.json", R"({ "maxTokens": "many" })")));
    assert(ThrowsConfigurationError(WriteSettings("history.json", R"({ "maxHistoryMessages": -3 })")));
    assert(ThrowsConfigurationError(WriteSettings("timeout.json", R"({ "timeoutSeconds": 0 })")));
    std::cout << "[PASS] Invalid settings are rejected." << std::endl;
}

void TestEnvironmentApiKey() {
    std::cout << "[Test] Environment API key wins..." << std::endl;
    std::string path = WriteSettings("keyed.json", R"({ "apiKey": "file-key" })");
    setenv(ConfigLoader::kApiKeyEnv, "env-key", 1);
    assert(ConfigLoader::LoadSettings(path).apiKey == "env-key");
    unsetenv(ConfigLoader::kApiKeyEnv);
    assert(ConfigLoader::LoadSettings(path).apiKey == "file-key");
    std::cout << "[PASS] Environment API key wins." << std::endl;
}

void TestSavePreservesUnknownKeys() {
    std::cout << "[Test] Save keeps unrelated keys..." << std::endl;
    std::string path = WriteSettings("saved.json", R"({ "theme": "dark", "model": "old" })");

    AgentSettings settings;
    settings.model = "new-model";
    settings.maxHistoryMessages = 4;
    assert(ConfigLoader::SaveSettings(path, settings));

    std::ifstream f(path);
    json j;
    f >> j;
    assert(j["theme"] == "dark");
    assert(j["model"] == "new-model");
    assert(j["maxHistoryMessages"] == 4);

    AgentSettings reloaded = ConfigLoader::LoadSettings(path);
    assert(reloaded.model == "new-model");
    assert(reloaded.maxHistoryMessages == 4);

    std::string nested = (std::filesystem::path(kTestRoot) / "nested" / "settings.json").string();
    assert(ConfigLoader::SaveSettings(nested, settings));
    assert(std::filesystem::exists(nested));
    std::cout << "[PASS] Save keeps unrelated keys." << std::endl;
}

void TestDefaultLocation() {
    std::cout << "[Test] Default settings location follows XDG..." << std::endl;
    std::filesystem::path xdg = std::filesystem::absolute(kTestRoot) / "xdg";
    setenv("XDG_CONFIG_HOME", xdg.string().c_str(), 1);
    assert(PathUtils::GetConfigHome() == xdg);
    assert(PathUtils::GetDefaultSettingsPath() == xdg / "noteagent" / "settings.json");

    AgentSettings settings = ConfigLoader::LoadSettings();
    assert(settings.model == "aimo-chat");
    std::cout << "[PASS] Default settings location follows XDG." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;
    std::filesystem::create_directories(kTestRoot);
    unsetenv(ConfigLoader::kApiKeyEnv);

    TestDefaults();
    TestOverlay();
    TestInvalidFiles();
    TestEnvironmentApiKey();
    TestSavePreservesUnknownKeys();
    TestDefaultLocation();

    // Clean up
    std::filesystem::remove_all(kTestRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
