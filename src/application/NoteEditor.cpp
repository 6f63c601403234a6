/**
 * @file NoteEditor.cpp
 * @brief Implementation of NoteEditor.
 */

#include "application/NoteEditor.hpp"
#include "domain/NoteAgentError.hpp"

#include <type_traits>
#include <utility>

namespace noteagent::application {

using namespace noteagent::domain;

namespace {
    [[noreturn]] void InvalidReference(const std::string& what, std::size_t id, std::size_t size) {
        throw NoteAgentError(ErrorKind::InvalidNodeReference,
                             what + " " + std::to_string(id) + " is outside the note (" +
                             std::to_string(size) + " top-level nodes)");
    }

    // Rewrites `node` in place for a modify_node action.
    void RewriteNode(Node& node, const std::string& nodeType, const std::string& content) {
        if (nodeType == TextNode::Type) {
            bool done = std::visit([&content](auto& n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, TextNode> || std::is_same_v<T, HashtagNode> ||
                              std::is_same_v<T, MentionNode>) {
                    n.text = content;
                    return true;
                } else {
                    return false;
                }
            }, node.value);
            if (!done) node = MakeTextNode(content);
        } else if (nodeType == ParagraphNode::Type) {
            bool done = std::visit([&content](auto& n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, ParagraphNode> || std::is_same_v<T, HeadingNode> ||
                              std::is_same_v<T, QuoteNode> || std::is_same_v<T, ListItemNode>) {
                    n.children.clear();
                    n.children.push_back(MakeTextNode(content));
                    return true;
                } else {
                    return false;
                }
            }, node.value);
            if (!done) node = MakeParagraphNode({MakeTextNode(content)});
        } else if (nodeType == AIEmbeddingNode::Type) {
            bool done = std::visit([&content](auto& n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, AIEmbeddingNode> || std::is_same_v<T, VoiceInputNode>) {
                    n.content = content;
                    return true;
                } else {
                    return false;
                }
            }, node.value);
            if (!done) node = MakeAIEmbeddingNode(content);
        } else {
            // A block named by its own type keeps its kind and gets new text.
            std::visit([&nodeType, &content](auto& n) {
                using T = std::decay_t<decltype(n)>;
                if (nodeType != T::Type) return;
                if constexpr (std::is_same_v<T, HashtagNode> || std::is_same_v<T, MentionNode>) {
                    n.text = content;
                } else if constexpr (std::is_same_v<T, VoiceInputNode> || std::is_same_v<T, ChatMessageNode>) {
                    n.content = content;
                } else if constexpr (std::is_same_v<T, CodeNode>) {
                    if (std::holds_alternative<NodeList>(n.body)) {
                        n.body = NodeList{MakeTextNode(content)};
                    } else {
                        n.body = content;
                    }
                } else if constexpr (std::is_same_v<T, ListNode>) {
                    ListItemNode item;
                    item.children.push_back(MakeTextNode(content));
                    n.children.clear();
                    n.children.push_back(Node{std::move(item)});
                } else if constexpr (std::is_same_v<T, HeadingNode> || std::is_same_v<T, QuoteNode> ||
                                     std::is_same_v<T, ListItemNode> || std::is_same_v<T, LinkNode> ||
                                     std::is_same_v<T, AutoLinkNode> || std::is_same_v<T, TableCellNode>) {
                    n.children.clear();
                    n.children.push_back(MakeTextNode(content));
                }
                // Tables, rows, page breaks and chat sessions have no single text to replace.
            }, node.value);
        }
    }
}

Note NoteEditor::InsertNode(const Note& note, Node node, std::size_t position) {
    Note result = note;
    auto& children = result.children();
    if (position <= children.size()) {
        children.insert(children.begin() + static_cast<std::ptrdiff_t>(position), std::move(node));
    } else {
        children.push_back(std::move(node));
    }
    return result;
}

Note NoteEditor::AppendNode(const Note& note, Node node) {
    Note result = note;
    result.children().push_back(std::move(node));
    return result;
}

Note NoteEditor::RemoveNode(const Note& note, std::size_t id) {
    Note result = note;
    auto& children = result.children();
    if (id < children.size()) {
        children.erase(children.begin() + static_cast<std::ptrdiff_t>(id));
    }
    return result;
}

Note NoteEditor::UpdateNode(const Note& note, std::size_t id, Node node) {
    if (id >= note.children().size()) {
        InvalidReference("node", id, note.children().size());
    }
    Note result = note;
    result.children()[id] = std::move(node);
    return result;
}

const Node* NoteEditor::GetNodeById(const Note& note, std::size_t id) {
    const auto& children = note.children();
    return id < children.size() ? &children[id] : nullptr;
}

Node NoteEditor::CreateNodeForType(const std::string& nodeType, const std::string& content) {
    if (nodeType == TextNode::Type) {
        return MakeTextNode(content);
    }
    if (nodeType == HeadingNode::Type) {
        return MakeHeadingNode(HeadingTag::H1, {MakeTextNode(content)});
    }
    if (nodeType == AIEmbeddingNode::Type) {
        return MakeAIEmbeddingNode(content);
    }
    return MakeParagraphNode({MakeTextNode(content)});
}

Note NoteEditor::ApplyAction(const Note& note, const ChatAction& action) {
    if (const auto* insert = std::get_if<InsertNodeAction>(&action)) {
        const std::size_t size = note.children().size();
        const std::size_t position = static_cast<std::size_t>(insert->insertAfter) + 1;
        if (size > 0 && position > size) {
            InvalidReference("insert_after", insert->insertAfter, size);
        }
        // An empty note has no block to anchor to; the new node simply becomes the first one.
        return InsertNode(note, CreateNodeForType(insert->nodeType, insert->content), size == 0 ? 0 : position);
    }

    if (const auto* modify = std::get_if<ModifyNodeAction>(&action)) {
        const std::size_t size = note.children().size();
        if (modify->id >= size) {
            InvalidReference("node", modify->id, size);
        }
        Note result = note;
        RewriteNode(result.children()[modify->id], modify->nodeType, modify->content);
        return result;
    }

    return note;
}

} // namespace noteagent::application
