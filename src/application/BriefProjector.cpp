/**
 * @file BriefProjector.cpp
 * @brief Implementation of BriefProjector.
 */

#include "application/BriefProjector.hpp"

#include <sstream>
#include <type_traits>

namespace noteagent::application {

using namespace noteagent::domain;

namespace {
    const char* kListBullet = "\xE2\x80\xA2 ";

    bool IsBlank(const std::string& s) {
        return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
    }

    std::string JoinChildren(const NodeList& children) {
        std::string out;
        for (const auto& child : children) {
            out += BriefProjector::ExtractText(child);
        }
        return out;
    }

    std::string FormatMessage(MessageSender sender, const std::string& content) {
        return "[" + SenderToString(sender) + "] " + content;
    }
}

std::string BriefProjector::ExtractText(const Node& node) {
    return std::visit([](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, TextNode> || std::is_same_v<T, HashtagNode> ||
                      std::is_same_v<T, MentionNode>) {
            return n.text;
        } else if constexpr (std::is_same_v<T, AIEmbeddingNode> || std::is_same_v<T, VoiceInputNode>) {
            return n.content;
        } else if constexpr (std::is_same_v<T, ListItemNode>) {
            return kListBullet + JoinChildren(n.children);
        } else if constexpr (std::is_same_v<T, LinkNode> || std::is_same_v<T, AutoLinkNode>) {
            return JoinChildren(n.children) + " (" + n.url + ")";
        } else if constexpr (std::is_same_v<T, ParagraphNode> || std::is_same_v<T, HeadingNode> ||
                             std::is_same_v<T, ListNode> || std::is_same_v<T, QuoteNode> ||
                             std::is_same_v<T, TableNode> || std::is_same_v<T, TableRowNode> ||
                             std::is_same_v<T, TableCellNode>) {
            return JoinChildren(n.children);
        } else if constexpr (std::is_same_v<T, CodeNode>) {
            if (const auto* text = std::get_if<std::string>(&n.body)) return *text;
            if (const auto* children = std::get_if<NodeList>(&n.body)) return JoinChildren(*children);
            return "";
        } else if constexpr (std::is_same_v<T, PageBreakNode>) {
            return "---";
        } else if constexpr (std::is_same_v<T, ChatMessageNode>) {
            return FormatMessage(n.sender, n.content);
        } else if constexpr (std::is_same_v<T, ChatSessionNode>) {
            std::string out;
            for (size_t i = 0; i < n.messages.size(); ++i) {
                if (i > 0) out += "\n";
                out += FormatMessage(n.messages[i].sender, n.messages[i].content);
            }
            return out;
        } else {
            static_assert(kUnhandledNode<T>, "ExtractText: unhandled node type");
        }
    }, node.value);
}

std::vector<BriefEntry> BriefProjector::Project(const Note& note) {
    std::vector<BriefEntry> brief;
    const auto& children = note.children();
    for (size_t i = 0; i < children.size(); ++i) {
        std::string content = ExtractText(children[i]);
        if (IsBlank(content)) continue;
        brief.push_back({i, NodeTypeTag(children[i]), std::move(content)});
    }
    return brief;
}

nlohmann::json BriefProjector::ToJson(const std::vector<BriefEntry>& brief) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : brief) {
        j.push_back({
            {"id", entry.id},
            {"nodeType", entry.nodeType},
            {"content", entry.content}
        });
    }
    return j;
}

std::string BriefProjector::ExtractNoteText(const Note& note) {
    std::string out;
    const auto& children = note.children();
    for (size_t i = 0; i < children.size(); ++i) {
        if (i > 0) out += "\n";
        out += ExtractText(children[i]);
    }
    return out;
}

std::size_t BriefProjector::CountWords(const Note& note) {
    std::istringstream ss(ExtractNoteText(note));
    std::size_t count = 0;
    std::string word;
    while (ss >> word) {
        ++count;
    }
    return count;
}

std::size_t BriefProjector::CountCharacters(const Note& note) {
    std::size_t count = 0;
    for (unsigned char c : ExtractNoteText(note)) {
        // Continuation bytes (10xxxxxx) belong to the previous code point.
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

bool BriefProjector::IsEmpty(const Note& note) {
    for (const auto& child : note.children()) {
        if (!IsBlank(ExtractText(child))) return false;
    }
    return true;
}

} // namespace noteagent::application
