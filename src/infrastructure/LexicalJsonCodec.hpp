/**
 * @file LexicalJsonCodec.hpp
 * @brief Converts between Lexical tree-JSON and the domain node model.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/LexicalNode.hpp"

namespace noteagent::infrastructure {

/**
 * @class LexicalJsonCodec
 * @brief Stateless (de)serializer for notes and nodes.
 *
 * Reading keeps every schema-declared field and silently drops the rest.
 * Optional fields that are absent (or null) on input stay absent on output.
 * Any failure throws domain::NoteAgentError naming the offending node path,
 * e.g. "root.children[2].children[0]"; one bad node fails the whole note.
 * Trees nested deeper than kMaxNestingDepth are rejected as MalformedDocument,
 * so every parsed note is safe to walk recursively.
 */
class LexicalJsonCodec {
public:
    /** @brief Deepest accepted node level; top-level blocks are level 1. */
    static constexpr std::size_t kMaxNestingDepth = 128;

    /** @brief Parses `{ id?, noteId?, lexicalState: { root } }`. */
    static domain::Note ParseNote(const nlohmann::json& j);

    /** @brief Parses raw text; invalid JSON is reported as MalformedDocument. */
    static domain::Note ParseNoteText(const std::string& text);

    /**
     * @brief Parses a single node.
     * @param path Position of the node, used in error messages.
     */
    static domain::Node ParseNode(const nlohmann::json& j, const std::string& path);

    static nlohmann::json ToJson(const domain::Note& note);
    static nlohmann::json ToJson(const domain::Node& node);
};

} // namespace noteagent::infrastructure
