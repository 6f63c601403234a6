/**
 * @file LexicalNode.hpp
 * @brief Domain model of a Lexical note: a closed variant tree of editor nodes.
 *
 * Every node struct carries a static `Type` tag equal to its wire discriminator.
 * Code that must handle every node kind dispatches with std::visit and ends its
 * `if constexpr` chain with `static_assert(kUnhandledNode<T>)`, so adding a
 * variant alternative is a compile error until every such visitor handles it.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace noteagent::domain {

/** @brief Root schema version this build understands. */
constexpr std::uint32_t kSupportedFormatVersion = 1;

/** @brief Format flag bits used by text-like nodes. */
enum TextFormatFlag : std::uint32_t {
    FormatBold = 1,
    FormatItalic = 2,
    FormatUnderline = 4,
    FormatStrikethrough = 8
};

enum class TextDirection { LeftToRight, RightToLeft };
enum class HeadingTag { H1, H2, H3, H4, H5, H6 };
enum class ListType { Bullet, Number, Check };
enum class MessageSender { User, Agent, System };

/**
 * @struct BaseNodeProperties
 * @brief Attributes shared by every node and by the root.
 */
struct BaseNodeProperties {
    std::uint32_t version = 1; ///< Per-node schema version.
    std::optional<TextDirection> direction;
    std::optional<std::string> format; ///< Element alignment. Text-like nodes use numeric flags instead.
    std::optional<std::uint32_t> indent;
};

struct Node;
using NodeList = std::vector<Node>;

struct TextNode {
    static constexpr const char* Type = "text";
    std::string text;
    std::uint32_t format = 0; ///< TextFormatFlag bits.
    std::optional<std::uint32_t> detail;
    std::optional<std::string> mode;
    std::optional<std::string> style;
    BaseNodeProperties base;
};

struct ParagraphNode {
    static constexpr const char* Type = "paragraph";
    NodeList children;
    std::optional<std::uint32_t> textFormat;
    std::optional<std::string> textStyle;
    BaseNodeProperties base;
};

struct HeadingNode {
    static constexpr const char* Type = "heading";
    HeadingTag tag = HeadingTag::H1;
    NodeList children;
    BaseNodeProperties base;
};

struct ListNode {
    static constexpr const char* Type = "list";
    ListType listType = ListType::Bullet;
    std::optional<std::uint32_t> start;
    NodeList children;
    BaseNodeProperties base;
};

struct ListItemNode {
    static constexpr const char* Type = "listitem";
    NodeList children;
    BaseNodeProperties base;
};

struct QuoteNode {
    static constexpr const char* Type = "quote";
    NodeList children;
    BaseNodeProperties base;
};

/** @brief Inline code carries text, a code block carries children; never both. */
using CodeBody = std::variant<std::monostate, std::string, NodeList>;

struct CodeNode {
    static constexpr const char* Type = "code";
    CodeBody body;
    std::optional<std::string> language;
    std::uint32_t format = 0;
    BaseNodeProperties base;
};

struct LinkNode {
    static constexpr const char* Type = "link";
    std::string url;
    std::optional<std::string> rel;
    std::optional<std::string> target;
    NodeList children;
    BaseNodeProperties base;
};

struct AutoLinkNode {
    static constexpr const char* Type = "autolink";
    std::string url;
    NodeList children;
    BaseNodeProperties base;
};

struct HashtagNode {
    static constexpr const char* Type = "hashtag";
    std::string text;
    std::uint32_t format = 0;
    BaseNodeProperties base;
};

struct TableNode {
    static constexpr const char* Type = "table";
    NodeList children; ///< TableRow nodes.
    BaseNodeProperties base;
};

struct TableRowNode {
    static constexpr const char* Type = "tablerow";
    NodeList children; ///< TableCell nodes.
    BaseNodeProperties base;
};

struct TableCellNode {
    static constexpr const char* Type = "tablecell";
    NodeList children;
    std::uint32_t headerState = 0;
    std::uint32_t colSpan = 1;
    std::uint32_t rowSpan = 1;
    BaseNodeProperties base;
};

struct PageBreakNode {
    static constexpr const char* Type = "page-break";
    BaseNodeProperties base;
};

struct AIEmbeddingNode {
    static constexpr const char* Type = "ai-embedding";
    std::string content;
    bool isLoading = false;
    BaseNodeProperties base;
};

struct VoiceInputNode {
    static constexpr const char* Type = "voice-input";
    std::string content;
    BaseNodeProperties base;
};

struct ChatMessageNode {
    static constexpr const char* Type = "chat-message";
    MessageSender sender = MessageSender::User;
    std::string content;
    std::string timestamp; ///< ISO-8601, kept verbatim.
    BaseNodeProperties base;
};

/**
 * @struct ChatSessionMessage
 * @brief Lightweight message record owned by a chat session (not a Node).
 */
struct ChatSessionMessage {
    std::uint32_t id = 0;
    MessageSender sender = MessageSender::User;
    std::string content;
    std::string timestamp;
};

struct ChatSessionNode {
    static constexpr const char* Type = "chat-session";
    std::string sessionId;
    bool isActive = false;
    std::vector<ChatSessionMessage> messages;
    BaseNodeProperties base;
};

struct MentionNode {
    static constexpr const char* Type = "mention";
    std::string mentionName;
    std::string text;
    std::uint32_t format = 0;
    BaseNodeProperties base;
};

using NodeVariant = std::variant<
    TextNode,
    ParagraphNode,
    HeadingNode,
    ListNode,
    ListItemNode,
    QuoteNode,
    CodeNode,
    LinkNode,
    AutoLinkNode,
    HashtagNode,
    TableNode,
    TableRowNode,
    TableCellNode,
    PageBreakNode,
    AIEmbeddingNode,
    VoiceInputNode,
    ChatMessageNode,
    ChatSessionNode,
    MentionNode
>;

/**
 * @struct Node
 * @brief One element of the document tree.
 */
struct Node {
    NodeVariant value;
};

/** @brief Fallthrough guard for exhaustive `if constexpr` visitors. */
template <typename T>
inline constexpr bool kUnhandledNode = false;

/**
 * @struct RootNode
 * @brief Top-level container; `base.version` is the document's format version.
 */
struct RootNode {
    static constexpr const char* Type = "root";
    NodeList children;
    BaseNodeProperties base;
};

struct LexicalState {
    RootNode root;
};

/**
 * @struct Note
 * @brief A note as exchanged with the editor front-end.
 */
struct Note {
    std::optional<std::int32_t> id;
    std::optional<std::string> noteId;
    LexicalState lexicalState;

    const NodeList& children() const { return lexicalState.root.children; }
    NodeList& children() { return lexicalState.root.children; }
};

/**
 * @struct ChatContext
 * @brief Document plus cursor for one chat turn.
 *
 * cursorPosition indexes the root's children and may equal children().size().
 */
struct ChatContext {
    const Note& note;
    std::size_t cursorPosition = 0;
};

// --- Tag and label helpers ---

/** @brief Wire discriminator of a node, e.g. "page-break". */
std::string NodeTypeTag(const Node& node);

/** @brief Human-readable label, e.g. "Heading H2" or "Bullet List". */
std::string NodeTypeLabel(const Node& node);

/** @brief Child sequence of a container node, or nullptr for leaves. */
const NodeList* ChildrenOf(const Node& node);

std::string DirectionToString(TextDirection direction);
std::optional<TextDirection> DirectionFromString(const std::string& value);
std::string HeadingTagToString(HeadingTag tag);
std::optional<HeadingTag> HeadingTagFromString(const std::string& value);
std::string ListTypeToString(ListType type);
std::optional<ListType> ListTypeFromString(const std::string& value);
std::string SenderToString(MessageSender sender);
std::optional<MessageSender> SenderFromString(const std::string& value);

// --- Factories (mirror what the editor creates for fresh nodes) ---

Node MakeTextNode(const std::string& text, std::uint32_t format = 0);
Node MakeParagraphNode(NodeList children = {});
Node MakeHeadingNode(HeadingTag tag, NodeList children = {});
Node MakeAIEmbeddingNode(const std::string& content, bool isLoading = false);

/** @brief Empty note with a version-1 root. */
Note MakeEmptyNote(const std::string& noteId);

} // namespace noteagent::domain
