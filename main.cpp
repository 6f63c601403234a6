#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/ActionParser.hpp"
#include "application/AgentRuntime.hpp"
#include "application/BriefProjector.hpp"
#include "application/NoteEditor.hpp"
#include "application/PromptAssembler.hpp"
#include "domain/NoteAgentError.hpp"
#include "infrastructure/AimoModelAdapter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/LexicalJsonCodec.hpp"

using namespace noteagent;

namespace {

struct CliOptions {
    std::string notePath;
    std::optional<std::size_t> cursor;
    std::vector<std::string> messages;
    std::string configPath;
    std::string applyPath;
    bool printBrief = false;
    bool printPrompt = false;
};

void PrintUsage() {
    std::cerr << "Usage: noteagent <note.json> [--cursor N] [--message TEXT]... [--config PATH]\n"
              << "                 [--brief] [--prompt] [--apply OUT.json]\n\n"
              << "  --brief          print the note brief as JSON and exit\n"
              << "  --prompt         print the system prompt and exit\n"
              << "  --message TEXT   user turn to send (repeatable)\n"
              << "  --cursor N       cursor position among top-level blocks (default: end of note)\n"
              << "  --config PATH    settings.json to use instead of the default location\n"
              << "  --apply OUT      write the note with the agent's edit applied to OUT\n";
}

bool ParseArgs(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "[noteagent] Missing value for " << flag << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--brief") {
            options.printBrief = true;
        } else if (arg == "--prompt") {
            options.printPrompt = true;
        } else if (arg == "--cursor") {
            const char* value = needValue("--cursor");
            if (!value) return false;
            try {
                std::size_t consumed = 0;
                unsigned long cursor = std::stoul(value, &consumed);
                if (consumed != std::string(value).size() || std::string(value)[0] == '-') {
                    throw std::invalid_argument(value);
                }
                options.cursor = static_cast<std::size_t>(cursor);
            } catch (const std::exception&) {
                std::cerr << "[noteagent] Invalid cursor: " << value << std::endl;
                return false;
            }
        } else if (arg == "--message") {
            const char* value = needValue("--message");
            if (!value) return false;
            options.messages.emplace_back(value);
        } else if (arg == "--config") {
            const char* value = needValue("--config");
            if (!value) return false;
            options.configPath = value;
        } else if (arg == "--apply") {
            const char* value = needValue("--apply");
            if (!value) return false;
            options.applyPath = value;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[noteagent] Unknown option: " << arg << std::endl;
            return false;
        } else if (options.notePath.empty()) {
            options.notePath = arg;
        } else {
            std::cerr << "[noteagent] Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    return !options.notePath.empty();
}

std::optional<std::string> ReadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!ParseArgs(argc, argv, options)) {
        PrintUsage();
        return 1;
    }

    auto text = ReadFile(options.notePath);
    if (!text) {
        std::cerr << "[noteagent] Cannot open note: " << options.notePath << std::endl;
        return 1;
    }

    try {
        domain::Note note = infrastructure::LexicalJsonCodec::ParseNoteText(*text);
        std::size_t cursor = options.cursor.value_or(note.children().size());
        if (cursor > note.children().size()) {
            std::cerr << "[noteagent] Cursor " << cursor << " is past the end of the note ("
                      << note.children().size() << " blocks)" << std::endl;
            return 1;
        }

        if (options.printBrief) {
            std::cout << application::BriefProjector::ToJson(application::BriefProjector::Project(note)).dump(2) << std::endl;
            return 0;
        }
        if (options.printPrompt) {
            std::cout << application::PromptAssembler::BuildSystemPrompt(
                application::BriefProjector::Project(note), cursor);
            return 0;
        }
        if (options.messages.empty()) {
            std::cerr << "[noteagent] Nothing to send: pass at least one --message" << std::endl;
            PrintUsage();
            return 1;
        }

        auto settings = infrastructure::ConfigLoader::LoadSettings(options.configPath);
        auto aiService = std::make_shared<infrastructure::AimoModelAdapter>(settings);
        aiService->initialize();

        std::vector<domain::AIService::ChatMessage> history;
        for (const auto& message : options.messages) {
            history.push_back({domain::AIService::ChatMessage::Role::User, message});
        }

        application::AgentRuntime runtime(aiService, settings.maxHistoryMessages);
        runtime.start();
        domain::ChatAction action = runtime.chat(history, domain::ChatContext{note, cursor});
        runtime.stop();

        std::cout << application::ActionParser::ToJson(action).dump(2) << std::endl;
        std::cout << domain::DescribeAction(action) << std::endl;

        if (!options.applyPath.empty()) {
            domain::Note edited = application::NoteEditor::ApplyAction(note, action);
            std::ofstream out(options.applyPath);
            if (!out.is_open()) {
                std::cerr << "[noteagent] Cannot write " << options.applyPath << std::endl;
                return 1;
            }
            out << infrastructure::LexicalJsonCodec::ToJson(edited).dump(2) << std::endl;
            std::cout << "[noteagent] Wrote " << options.applyPath << std::endl;
        }
    } catch (const domain::NoteAgentError& e) {
        std::cerr << "[noteagent] " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
