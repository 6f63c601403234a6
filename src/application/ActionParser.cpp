/**
 * @file ActionParser.cpp
 * @brief Implementation of ActionParser.
 */

#include "application/ActionParser.hpp"
#include "domain/NoteAgentError.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace noteagent::application {

using json = nlohmann::json;
using namespace noteagent::domain;

namespace {
    const std::string kFence = "```";

    std::string Trim(const std::string& s) {
        const char* ws = " \t\r\n\f\v";
        size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    bool StartsWith(const std::string& text, const std::string& prefix) {
        return text.compare(0, prefix.length(), prefix) == 0;
    }

    bool EndsWith(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool IsTagChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '+' || c == '.';
    }

    bool IsSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // Length of the language tag after an opening fence, or 0 when the word
    // following the fence is content rather than a tag (e.g. "```hello world",
    // or "```Done\n```" where nothing else is fenced).
    size_t LanguageTagLength(const std::string& rest) {
        size_t k = 0;
        while (k < rest.size() && IsTagChar(rest[k])) ++k;
        if (k == 0 || k == rest.size()) return 0;
        if (rest[k] == '\n' || rest[k] == '\r') {
            std::string body = Trim(rest.substr(k));
            if (EndsWith(body, kFence)) body.erase(body.size() - kFence.size());
            return Trim(body).empty() ? 0 : k;
        }
        if (!IsSpace(rest[k])) return 0;
        size_t next = k;
        while (next < rest.size() && IsSpace(rest[next])) ++next;
        return (next < rest.size() && rest[next] == '{') ? k : 0;
    }

    [[noreturn]] void ShapeError(const std::string& action, const std::string& message) {
        throw NoteAgentError(ErrorKind::MalformedActionShape, action + ": " + message);
    }

    std::string RequireString(const json& j, const char* key, const std::string& action) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            ShapeError(action, std::string("field '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    std::uint32_t RequireIndex(const json& j, const char* key, const std::string& action) {
        auto it = j.find(key);
        const std::string err = std::string("field '") + key + "' must be a non-negative integer";
        if (it == j.end() || !it->is_number_integer()) ShapeError(action, err);
        if (it->is_number_unsigned()) {
            std::uint64_t value = it->get<std::uint64_t>();
            if (value > std::numeric_limits<std::uint32_t>::max()) ShapeError(action, err);
            return static_cast<std::uint32_t>(value);
        }
        std::int64_t value = it->get<std::int64_t>();
        if (value < 0 || value > std::numeric_limits<std::uint32_t>::max()) ShapeError(action, err);
        return static_cast<std::uint32_t>(value);
    }
}

std::string ActionParser::StripCodeFence(const std::string& text) {
    std::string s = Trim(text);
    if (StartsWith(s, kFence)) {
        std::string rest = s.substr(kFence.size());
        s = rest.substr(LanguageTagLength(rest));
    }
    if (EndsWith(s, kFence)) {
        s.erase(s.size() - kFence.size());
    }
    return Trim(s);
}

ChatAction ActionParser::Parse(const std::string& rawReply) {
    std::string text = StripCodeFence(rawReply);
    if (text.empty() || text[0] != '{') {
        return ReplyAction{text};
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw NoteAgentError(ErrorKind::MalformedActionJson, e.what());
    }

    auto it = j.find("action");
    if (it == j.end()) {
        return ReplyAction{text};
    }
    if (!it->is_string()) {
        throw NoteAgentError(ErrorKind::UnsupportedActionType, it->dump());
    }

    const std::string action = it->get<std::string>();
    if (action == InsertNodeAction::Type) {
        InsertNodeAction insert;
        insert.insertAfter = RequireIndex(j, "insert_after", action);
        insert.nodeType = RequireString(j, "node_type", action);
        insert.content = RequireString(j, "content", action);
        return insert;
    }
    if (action == ModifyNodeAction::Type) {
        ModifyNodeAction modify;
        modify.id = RequireIndex(j, "id", action);
        modify.nodeType = RequireString(j, "node_type", action);
        modify.content = RequireString(j, "content", action);
        return modify;
    }
    if (action == ReplyAction::Type) {
        return ReplyAction{RequireString(j, "content", action)};
    }
    throw NoteAgentError(ErrorKind::UnsupportedActionType, action);
}

json ActionParser::ToJson(const ChatAction& action) {
    return std::visit([](const auto& a) -> json {
        using T = std::decay_t<decltype(a)>;
        json j = {{"action", T::Type}};
        if constexpr (std::is_same_v<T, InsertNodeAction>) {
            j["insert_after"] = a.insertAfter;
            j["node_type"] = a.nodeType;
        } else if constexpr (std::is_same_v<T, ModifyNodeAction>) {
            j["id"] = a.id;
            j["node_type"] = a.nodeType;
        }
        j["content"] = a.content;
        return j;
    }, action);
}

} // namespace noteagent::application
