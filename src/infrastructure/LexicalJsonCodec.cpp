/**
 * @file LexicalJsonCodec.cpp
 * @brief Implementation of LexicalJsonCodec.
 */

#include "infrastructure/LexicalJsonCodec.hpp"
#include "domain/NoteAgentError.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>
#include <variant>

namespace noteagent::infrastructure {

using json = nlohmann::json;
using namespace noteagent::domain;

namespace {

[[noreturn]] void Fail(const std::string& path, const std::string& message) {
    throw NoteAgentError(ErrorKind::MalformedDocument, path + ": " + message);
}

// Nesting level of the ParseNode call in progress on this thread.
thread_local std::size_t t_parseDepth = 0;

struct DepthScope {
    DepthScope() { ++t_parseDepth; }
    ~DepthScope() { --t_parseDepth; }
};

std::string Quoted(const char* key) {
    return std::string("'") + key + "'";
}

// --- Readers ---

const json* Find(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

const json& Require(const json& j, const char* key, const std::string& path) {
    const json* value = Find(j, key);
    if (!value) Fail(path, "missing field " + Quoted(key));
    return *value;
}

std::string AsString(const json& v, const char* key, const std::string& path) {
    if (!v.is_string()) Fail(path, "field " + Quoted(key) + " must be a string");
    return v.get<std::string>();
}

std::uint32_t AsUInt32(const json& v, const char* key, const std::string& path) {
    if (!v.is_number_integer()) Fail(path, "field " + Quoted(key) + " must be an unsigned integer");
    std::uint64_t value = 0;
    if (v.is_number_unsigned()) {
        value = v.get<std::uint64_t>();
    } else {
        std::int64_t signedValue = v.get<std::int64_t>();
        if (signedValue < 0) Fail(path, "field " + Quoted(key) + " must not be negative");
        value = static_cast<std::uint64_t>(signedValue);
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        Fail(path, "field " + Quoted(key) + " is out of range");
    }
    return static_cast<std::uint32_t>(value);
}

bool AsBool(const json& v, const char* key, const std::string& path) {
    if (!v.is_boolean()) Fail(path, "field " + Quoted(key) + " must be a boolean");
    return v.get<bool>();
}

std::string RequireString(const json& j, const char* key, const std::string& path) {
    return AsString(Require(j, key, path), key, path);
}

std::uint32_t RequireUInt(const json& j, const char* key, const std::string& path) {
    return AsUInt32(Require(j, key, path), key, path);
}

bool RequireBool(const json& j, const char* key, const std::string& path) {
    return AsBool(Require(j, key, path), key, path);
}

std::optional<std::string> OptionalString(const json& j, const char* key, const std::string& path) {
    const json* value = Find(j, key);
    if (!value) return std::nullopt;
    return AsString(*value, key, path);
}

std::optional<std::uint32_t> OptionalUInt(const json& j, const char* key, const std::string& path) {
    const json* value = Find(j, key);
    if (!value) return std::nullopt;
    return AsUInt32(*value, key, path);
}

MessageSender RequireSender(const json& j, const std::string& path) {
    std::string raw = RequireString(j, "sender", path);
    auto sender = SenderFromString(raw);
    if (!sender) Fail(path, "unknown sender '" + raw + "'");
    return *sender;
}

/** @param elementFormat true when "format" is the element alignment string. */
BaseNodeProperties ReadBase(const json& j, const std::string& path, bool elementFormat) {
    BaseNodeProperties base;
    base.version = RequireUInt(j, "version", path);
    if (auto direction = OptionalString(j, "direction", path)) {
        auto parsed = DirectionFromString(*direction);
        if (!parsed) Fail(path, "unknown direction '" + *direction + "'");
        base.direction = parsed;
    }
    if (elementFormat) {
        base.format = OptionalString(j, "format", path);
    }
    base.indent = OptionalUInt(j, "indent", path);
    return base;
}

NodeList ReadChildArray(const json& array, const std::string& path) {
    if (!array.is_array()) Fail(path, "field 'children' must be an array");
    NodeList children;
    children.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        children.push_back(LexicalJsonCodec::ParseNode(array[i], path + ".children[" + std::to_string(i) + "]"));
    }
    return children;
}

NodeList ReadChildren(const json& j, const std::string& path) {
    return ReadChildArray(Require(j, "children", path), path);
}

void ReadFields(const json& j, const std::string& path, TextNode& n) {
    n.text = RequireString(j, "text", path);
    n.format = RequireUInt(j, "format", path);
    n.detail = OptionalUInt(j, "detail", path);
    n.mode = OptionalString(j, "mode", path);
    n.style = OptionalString(j, "style", path);
    n.base = ReadBase(j, path, false);
}

void ReadFields(const json& j, const std::string& path, ParagraphNode& n) {
    n.children = ReadChildren(j, path);
    n.textFormat = OptionalUInt(j, "textFormat", path);
    n.textStyle = OptionalString(j, "textStyle", path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, HeadingNode& n) {
    std::string tag = RequireString(j, "tag", path);
    auto parsed = HeadingTagFromString(tag);
    if (!parsed) Fail(path, "unknown heading tag '" + tag + "'");
    n.tag = *parsed;
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, ListNode& n) {
    std::string listType = RequireString(j, "listType", path);
    auto parsed = ListTypeFromString(listType);
    if (!parsed) Fail(path, "unknown listType '" + listType + "'");
    n.listType = *parsed;
    n.start = OptionalUInt(j, "start", path);
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, ListItemNode& n) {
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, QuoteNode& n) {
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, CodeNode& n) {
    auto text = OptionalString(j, "text", path);
    const json* children = Find(j, "children");
    if (text && children) Fail(path, "code node carries both 'text' and 'children'");
    if (text) {
        n.body = *text;
    } else if (children) {
        n.body = ReadChildArray(*children, path);
    }
    n.language = OptionalString(j, "language", path);
    n.format = RequireUInt(j, "format", path);
    n.base = ReadBase(j, path, false);
}

void ReadFields(const json& j, const std::string& path, LinkNode& n) {
    n.url = RequireString(j, "url", path);
    n.rel = OptionalString(j, "rel", path);
    n.target = OptionalString(j, "target", path);
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, AutoLinkNode& n) {
    n.url = RequireString(j, "url", path);
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, HashtagNode& n) {
    n.text = RequireString(j, "text", path);
    n.format = RequireUInt(j, "format", path);
    n.base = ReadBase(j, path, false);
}

void ReadFields(const json& j, const std::string& path, TableNode& n) {
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, TableRowNode& n) {
    n.children = ReadChildren(j, path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, TableCellNode& n) {
    n.children = ReadChildren(j, path);
    n.headerState = RequireUInt(j, "headerState", path);
    n.colSpan = RequireUInt(j, "colSpan", path);
    n.rowSpan = RequireUInt(j, "rowSpan", path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, PageBreakNode& n) {
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, AIEmbeddingNode& n) {
    n.content = RequireString(j, "content", path);
    n.isLoading = RequireBool(j, "isLoading", path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, VoiceInputNode& n) {
    n.content = RequireString(j, "content", path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, ChatMessageNode& n) {
    n.sender = RequireSender(j, path);
    n.content = RequireString(j, "content", path);
    n.timestamp = RequireString(j, "timestamp", path);
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, ChatSessionNode& n) {
    n.sessionId = RequireString(j, "sessionId", path);
    n.isActive = RequireBool(j, "isActive", path);
    const json& messages = Require(j, "messages", path);
    if (!messages.is_array()) Fail(path, "field 'messages' must be an array");
    for (size_t i = 0; i < messages.size(); ++i) {
        const std::string msgPath = path + ".messages[" + std::to_string(i) + "]";
        const json& m = messages[i];
        if (!m.is_object()) Fail(msgPath, "message must be an object");
        ChatSessionMessage msg;
        msg.id = RequireUInt(m, "id", msgPath);
        msg.sender = RequireSender(m, msgPath);
        msg.content = RequireString(m, "content", msgPath);
        msg.timestamp = RequireString(m, "timestamp", msgPath);
        n.messages.push_back(std::move(msg));
    }
    n.base = ReadBase(j, path, true);
}

void ReadFields(const json& j, const std::string& path, MentionNode& n) {
    n.mentionName = RequireString(j, "mentionName", path);
    n.text = RequireString(j, "text", path);
    n.format = RequireUInt(j, "format", path);
    n.base = ReadBase(j, path, false);
}

/** Walks the NodeVariant alternatives and reads the one whose Type matches. */
template <std::size_t I = 0>
Node ParseByTag(const std::string& tag, const json& j, const std::string& path) {
    if constexpr (I < std::variant_size_v<NodeVariant>) {
        using T = std::variant_alternative_t<I, NodeVariant>;
        if (tag == T::Type) {
            T node;
            ReadFields(j, path, node);
            return Node{std::move(node)};
        }
        return ParseByTag<I + 1>(tag, j, path);
    } else {
        throw NoteAgentError(ErrorKind::UnrecognizedNodeType, path + ": unknown node type '" + tag + "'");
    }
}

// --- Writers ---

void WriteBase(json& j, const BaseNodeProperties& base, bool elementFormat) {
    j["version"] = base.version;
    if (base.direction) j["direction"] = DirectionToString(*base.direction);
    if (elementFormat && base.format) j["format"] = *base.format;
    if (base.indent) j["indent"] = *base.indent;
}

json WriteChildren(const NodeList& children) {
    json array = json::array();
    for (const auto& child : children) {
        array.push_back(LexicalJsonCodec::ToJson(child));
    }
    return array;
}

void WriteFields(json& j, const TextNode& n) {
    j["text"] = n.text;
    j["format"] = n.format;
    if (n.detail) j["detail"] = *n.detail;
    if (n.mode) j["mode"] = *n.mode;
    if (n.style) j["style"] = *n.style;
    WriteBase(j, n.base, false);
}

void WriteFields(json& j, const ParagraphNode& n) {
    j["children"] = WriteChildren(n.children);
    if (n.textFormat) j["textFormat"] = *n.textFormat;
    if (n.textStyle) j["textStyle"] = *n.textStyle;
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const HeadingNode& n) {
    j["tag"] = HeadingTagToString(n.tag);
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const ListNode& n) {
    j["listType"] = ListTypeToString(n.listType);
    if (n.start) j["start"] = *n.start;
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const ListItemNode& n) {
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const QuoteNode& n) {
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const CodeNode& n) {
    if (const auto* text = std::get_if<std::string>(&n.body)) {
        j["text"] = *text;
    } else if (const auto* children = std::get_if<NodeList>(&n.body)) {
        j["children"] = WriteChildren(*children);
    }
    if (n.language) j["language"] = *n.language;
    j["format"] = n.format;
    WriteBase(j, n.base, false);
}

void WriteFields(json& j, const LinkNode& n) {
    j["url"] = n.url;
    if (n.rel) j["rel"] = *n.rel;
    if (n.target) j["target"] = *n.target;
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const AutoLinkNode& n) {
    j["url"] = n.url;
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const HashtagNode& n) {
    j["text"] = n.text;
    j["format"] = n.format;
    WriteBase(j, n.base, false);
}

void WriteFields(json& j, const TableNode& n) {
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const TableRowNode& n) {
    j["children"] = WriteChildren(n.children);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const TableCellNode& n) {
    j["children"] = WriteChildren(n.children);
    j["headerState"] = n.headerState;
    j["colSpan"] = n.colSpan;
    j["rowSpan"] = n.rowSpan;
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const PageBreakNode& n) {
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const AIEmbeddingNode& n) {
    j["content"] = n.content;
    j["isLoading"] = n.isLoading;
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const VoiceInputNode& n) {
    j["content"] = n.content;
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const ChatMessageNode& n) {
    j["sender"] = SenderToString(n.sender);
    j["content"] = n.content;
    j["timestamp"] = n.timestamp;
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const ChatSessionNode& n) {
    j["sessionId"] = n.sessionId;
    j["isActive"] = n.isActive;
    json messages = json::array();
    for (const auto& msg : n.messages) {
        messages.push_back({
            {"id", msg.id},
            {"sender", SenderToString(msg.sender)},
            {"content", msg.content},
            {"timestamp", msg.timestamp}
        });
    }
    j["messages"] = std::move(messages);
    WriteBase(j, n.base, true);
}

void WriteFields(json& j, const MentionNode& n) {
    j["mentionName"] = n.mentionName;
    j["text"] = n.text;
    j["format"] = n.format;
    WriteBase(j, n.base, false);
}

} // namespace

Node LexicalJsonCodec::ParseNode(const json& j, const std::string& path) {
    DepthScope scope;
    if (t_parseDepth > kMaxNestingDepth) {
        Fail(path, "nesting deeper than " + std::to_string(kMaxNestingDepth));
    }
    if (!j.is_object()) Fail(path, "node must be an object");
    const json* type = Find(j, "type");
    if (!type) Fail(path, "node has no 'type'");
    return ParseByTag(AsString(*type, "type", path), j, path);
}

Note LexicalJsonCodec::ParseNote(const json& j) {
    if (!j.is_object()) Fail("note", "must be an object");

    Note note;
    if (const json* id = Find(j, "id")) {
        if (!id->is_number_integer()) Fail("note", "field 'id' must be an integer");
        if (id->is_number_unsigned() && id->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
            Fail("note", "field 'id' is out of range");
        }
        std::int64_t value = id->get<std::int64_t>();
        if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max()) {
            Fail("note", "field 'id' is out of range");
        }
        note.id = static_cast<std::int32_t>(value);
    }
    note.noteId = OptionalString(j, "noteId", "note");

    const json& state = Require(j, "lexicalState", "note");
    if (!state.is_object()) Fail("lexicalState", "must be an object");
    const json& root = Require(state, "root", "lexicalState");
    if (!root.is_object()) Fail("root", "must be an object");

    std::string rootType = RequireString(root, "type", "root");
    if (rootType != RootNode::Type) Fail("root", "expected type 'root', got '" + rootType + "'");

    note.lexicalState.root.base = ReadBase(root, "root", true);
    if (note.lexicalState.root.base.version != kSupportedFormatVersion) {
        throw NoteAgentError(ErrorKind::UnsupportedFormatVersion,
                             "root: version " + std::to_string(note.lexicalState.root.base.version) +
                             " (supported: " + std::to_string(kSupportedFormatVersion) + ")");
    }
    note.lexicalState.root.children = ReadChildren(root, "root");
    return note;
}

Note LexicalJsonCodec::ParseNoteText(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw NoteAgentError(ErrorKind::MalformedDocument, std::string("note: invalid JSON: ") + e.what());
    }
    return ParseNote(j);
}

json LexicalJsonCodec::ToJson(const Node& node) {
    json j = json::object();
    std::visit([&j](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        j["type"] = T::Type;
        WriteFields(j, n);
    }, node.value);
    return j;
}

json LexicalJsonCodec::ToJson(const Note& note) {
    json root = json::object();
    root["type"] = RootNode::Type;
    root["children"] = WriteChildren(note.lexicalState.root.children);
    WriteBase(root, note.lexicalState.root.base, true);

    json j = json::object();
    if (note.id) j["id"] = *note.id;
    if (note.noteId) j["noteId"] = *note.noteId;
    j["lexicalState"] = {{"root", std::move(root)}};
    return j;
}

} // namespace noteagent::infrastructure
