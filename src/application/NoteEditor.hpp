/**
 * @file NoteEditor.hpp
 * @brief Pure edits on the top level of a note, including applying agent actions.
 */

#pragma once

#include <cstddef>
#include <string>
#include "domain/ChatAction.hpp"
#include "domain/LexicalNode.hpp"

namespace noteagent::application {

/**
 * @class NoteEditor
 * @brief Copy-on-write helpers. The input note is never modified.
 *
 * Node ids are indices into the root's children, the same ids the brief uses.
 */
class NoteEditor {
public:
    /** @brief Inserts at `position` when it lies in [0, size], appends otherwise. */
    static domain::Note InsertNode(const domain::Note& note, domain::Node node, std::size_t position);

    /** @brief Appends at the end of the note. */
    static domain::Note AppendNode(const domain::Note& note, domain::Node node);

    /** @brief Removes child `id`; an unknown id returns an unchanged copy. */
    static domain::Note RemoveNode(const domain::Note& note, std::size_t id);

    /** @throws domain::NoteAgentError (InvalidNodeReference) for an unknown id. */
    static domain::Note UpdateNode(const domain::Note& note, std::size_t id, domain::Node node);

    /** @brief Child `id`, or nullptr. */
    static const domain::Node* GetNodeById(const domain::Note& note, std::size_t id);

    /**
     * @brief Fresh node for an agent-provided type name.
     *
     * "text", "paragraph", "heading" (h1) and "ai-embedding" are honoured;
     * anything else becomes a paragraph.
     */
    static domain::Node CreateNodeForType(const std::string& nodeType, const std::string& content);

    /**
     * @brief Applies one action and returns the edited note.
     *
     * modify_node with "text", "paragraph" or "ai-embedding" rewrites a block
     * holding that kind of content and replaces any other block. Any other
     * type name rewrites the block only when it names the block's own type;
     * a table, row, page break or chat session is then left unchanged.
     * @throws domain::NoteAgentError (InvalidNodeReference) when the action
     *         points outside the note.
     */
    static domain::Note ApplyAction(const domain::Note& note, const domain::ChatAction& action);
};

} // namespace noteagent::application
