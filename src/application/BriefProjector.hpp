/**
 * @file BriefProjector.hpp
 * @brief Flattens a note's tree into the per-block summary handed to the model.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/LexicalNode.hpp"

namespace noteagent::application {

/**
 * @struct BriefEntry
 * @brief One top-level block of the note as the model sees it.
 */
struct BriefEntry {
    std::size_t id = 0;   ///< Index among the root's direct children.
    std::string nodeType; ///< Wire tag, e.g. "paragraph".
    std::string content;  ///< Flattened plain text.
};

/**
 * @class BriefProjector
 * @brief Pure text projection of notes. Never mutates its input.
 *
 * Text extraction recurses per level; notes read through LexicalJsonCodec
 * are bounded by LexicalJsonCodec::kMaxNestingDepth.
 */
class BriefProjector {
public:
    /**
     * @brief Projects every top-level child with non-blank text.
     *
     * Ids are the original child indices, so they increase strictly and
     * skip the blocks that were dropped.
     */
    static std::vector<BriefEntry> Project(const domain::Note& note);

    /** @brief Recursive plain text of a single node. */
    static std::string ExtractText(const domain::Node& node);

    /** @brief Wire form: `[{ "id", "nodeType", "content" }, ...]`. */
    static nlohmann::json ToJson(const std::vector<BriefEntry>& brief);

    /** @brief Text of every top-level child joined with newlines. */
    static std::string ExtractNoteText(const domain::Note& note);

    static std::size_t CountWords(const domain::Note& note);

    /** @brief Number of UTF-8 code points in ExtractNoteText(). */
    static std::size_t CountCharacters(const domain::Note& note);

    /** @brief True when no top-level child carries non-blank text. */
    static bool IsEmpty(const domain::Note& note);
};

} // namespace noteagent::application
