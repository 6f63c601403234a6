/**
 * @file LexicalNode.cpp
 * @brief Tag, label and factory helpers for the Lexical node model.
 */

#include "domain/LexicalNode.hpp"

#include <cctype>
#include <type_traits>
#include <utility>

namespace noteagent::domain {

std::string NodeTypeTag(const Node& node) {
    return std::visit([](const auto& n) -> std::string {
        return std::decay_t<decltype(n)>::Type;
    }, node.value);
}

std::string NodeTypeLabel(const Node& node) {
    return std::visit([](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, TextNode>) return "Text";
        else if constexpr (std::is_same_v<T, ParagraphNode>) return "Paragraph";
        else if constexpr (std::is_same_v<T, HeadingNode>) {
            std::string tag = HeadingTagToString(n.tag);
            for (auto& c : tag) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return "Heading " + tag;
        }
        else if constexpr (std::is_same_v<T, ListNode>) {
            switch (n.listType) {
                case ListType::Bullet: return "Bullet List";
                case ListType::Number: return "Numbered List";
                case ListType::Check: return "Check List";
            }
            return "List";
        }
        else if constexpr (std::is_same_v<T, ListItemNode>) return "List Item";
        else if constexpr (std::is_same_v<T, QuoteNode>) return "Quote";
        else if constexpr (std::is_same_v<T, CodeNode>) return "Code";
        else if constexpr (std::is_same_v<T, LinkNode>) return "Link";
        else if constexpr (std::is_same_v<T, AutoLinkNode>) return "Auto Link";
        else if constexpr (std::is_same_v<T, HashtagNode>) return "Hashtag";
        else if constexpr (std::is_same_v<T, TableNode>) return "Table";
        else if constexpr (std::is_same_v<T, TableRowNode>) return "Table Row";
        else if constexpr (std::is_same_v<T, TableCellNode>) return "Table Cell";
        else if constexpr (std::is_same_v<T, PageBreakNode>) return "Page Break";
        else if constexpr (std::is_same_v<T, AIEmbeddingNode>) return "AI Embedding";
        else if constexpr (std::is_same_v<T, VoiceInputNode>) return "Voice Input";
        else if constexpr (std::is_same_v<T, ChatMessageNode>) return "Chat Message";
        else if constexpr (std::is_same_v<T, ChatSessionNode>) return "Chat Session";
        else if constexpr (std::is_same_v<T, MentionNode>) return "Mention";
        else static_assert(kUnhandledNode<T>, "NodeTypeLabel: unhandled node type");
    }, node.value);
}

const NodeList* ChildrenOf(const Node& node) {
    return std::visit([](const auto& n) -> const NodeList* {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, CodeNode>) {
            return std::get_if<NodeList>(&n.body);
        } else if constexpr (std::is_same_v<T, ParagraphNode> || std::is_same_v<T, HeadingNode> ||
                             std::is_same_v<T, ListNode> || std::is_same_v<T, ListItemNode> ||
                             std::is_same_v<T, QuoteNode> || std::is_same_v<T, LinkNode> ||
                             std::is_same_v<T, AutoLinkNode> || std::is_same_v<T, TableNode> ||
                             std::is_same_v<T, TableRowNode> || std::is_same_v<T, TableCellNode>) {
            return &n.children;
        } else {
            return nullptr;
        }
    }, node.value);
}

std::string DirectionToString(TextDirection direction) {
    return direction == TextDirection::RightToLeft ? "rtl" : "ltr";
}

std::optional<TextDirection> DirectionFromString(const std::string& value) {
    if (value == "ltr") return TextDirection::LeftToRight;
    if (value == "rtl") return TextDirection::RightToLeft;
    return std::nullopt;
}

std::string HeadingTagToString(HeadingTag tag) {
    switch (tag) {
        case HeadingTag::H1: return "h1";
        case HeadingTag::H2: return "h2";
        case HeadingTag::H3: return "h3";
        case HeadingTag::H4: return "h4";
        case HeadingTag::H5: return "h5";
        case HeadingTag::H6: return "h6";
    }
    return "h1";
}

std::optional<HeadingTag> HeadingTagFromString(const std::string& value) {
    if (value == "h1") return HeadingTag::H1;
    if (value == "h2") return HeadingTag::H2;
    if (value == "h3") return HeadingTag::H3;
    if (value == "h4") return HeadingTag::H4;
    if (value == "h5") return HeadingTag::H5;
    if (value == "h6") return HeadingTag::H6;
    return std::nullopt;
}

std::string ListTypeToString(ListType type) {
    switch (type) {
        case ListType::Bullet: return "bullet";
        case ListType::Number: return "number";
        case ListType::Check: return "check";
    }
    return "bullet";
}

std::optional<ListType> ListTypeFromString(const std::string& value) {
    if (value == "bullet") return ListType::Bullet;
    if (value == "number") return ListType::Number;
    if (value == "check") return ListType::Check;
    return std::nullopt;
}

std::string SenderToString(MessageSender sender) {
    switch (sender) {
        case MessageSender::User: return "user";
        case MessageSender::Agent: return "agent";
        case MessageSender::System: return "system";
    }
    return "user";
}

std::optional<MessageSender> SenderFromString(const std::string& value) {
    if (value == "user") return MessageSender::User;
    if (value == "agent") return MessageSender::Agent;
    if (value == "system") return MessageSender::System;
    return std::nullopt;
}

Node MakeTextNode(const std::string& text, std::uint32_t format) {
    TextNode node;
    node.text = text;
    node.format = format;
    node.detail = 0;
    node.mode = "normal";
    node.style = "";
    return Node{node};
}

Node MakeParagraphNode(NodeList children) {
    ParagraphNode node;
    node.children = std::move(children);
    node.textFormat = 0;
    node.textStyle = "";
    return Node{std::move(node)};
}

Node MakeHeadingNode(HeadingTag tag, NodeList children) {
    HeadingNode node;
    node.tag = tag;
    node.children = std::move(children);
    return Node{std::move(node)};
}

Node MakeAIEmbeddingNode(const std::string& content, bool isLoading) {
    AIEmbeddingNode node;
    node.content = content;
    node.isLoading = isLoading;
    return Node{node};
}

Note MakeEmptyNote(const std::string& noteId) {
    Note note;
    note.noteId = noteId;
    note.lexicalState.root.base.version = kSupportedFormatVersion;
    return note;
}

} // namespace noteagent::domain
