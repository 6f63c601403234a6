/**
 * @file PromptAssembler.hpp
 * @brief Application service that assembles the system prompt for a chat turn.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "domain/AIService.hpp"
#include "domain/LexicalNode.hpp"
#include "application/BriefProjector.hpp"

namespace noteagent::application {

/**
 * @struct PromptContext
 * @brief Value object holding everything the system prompt is rendered from.
 */
struct PromptContext {
    std::vector<BriefEntry> brief;
    std::size_t cursorPosition = 0;

    /** @brief Renders the fixed instruction template around the brief and cursor. */
    std::string render() const;
};

/**
 * @class PromptAssembler
 * @brief Builds the message list sent to the completion backend.
 */
class PromptAssembler {
public:
    /** @brief Projects the note and captures the cursor. */
    static PromptContext Assemble(const domain::ChatContext& context);

    /** @brief Block after which text typed at the cursor belongs. */
    static std::size_t SuggestInsertAfter(std::size_t cursorPosition);

    static std::string BuildSystemPrompt(const std::vector<BriefEntry>& brief, std::size_t cursorPosition);

    /**
     * @brief System prompt followed by the chat history.
     * @param maxHistory Keeps only the last N history messages; 0 keeps all.
     */
    static std::vector<domain::AIService::ChatMessage> BuildConversation(
        const domain::ChatContext& context,
        const std::vector<domain::AIService::ChatMessage>& history,
        std::size_t maxHistory = 0);
};

} // namespace noteagent::application
