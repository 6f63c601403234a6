/**
 * @file PromptAssembler.cpp
 * @brief Implementation of the PromptAssembler service.
 */

#include "application/PromptAssembler.hpp"
#include <sstream>

namespace noteagent::application {

using domain::AIService;

PromptContext PromptAssembler::Assemble(const domain::ChatContext& context) {
    PromptContext prompt;
    prompt.brief = BriefProjector::Project(context.note);
    prompt.cursorPosition = context.cursorPosition;
    return prompt;
}

std::size_t PromptAssembler::SuggestInsertAfter(std::size_t cursorPosition) {
    return cursorPosition == 0 ? 0 : cursorPosition - 1;
}

std::string PromptContext::render() const {
    std::stringstream ss;

    ss << "You are a writing assistant embedded in a rich-text note editor.\n"
       << "The note is summarized below as a list of blocks. Each block has an id (its position in the note), "
       << "a nodeType and its plain-text content. Empty blocks are omitted.\n\n";

    ss << "=== NOTE_BRIEF ===\n"
       << BriefProjector::ToJson(brief).dump(2) << "\n"
       << "========================================\n\n";

    ss << "=== CURSOR ===\n"
       << "The user's cursor is at position " << cursorPosition << ".\n"
       << "To insert new content at the cursor, use insert_after = "
       << PromptAssembler::SuggestInsertAfter(cursorPosition) << ".\n"
       << "========================================\n\n";

    ss << "Instruction: Answer with exactly one JSON object and nothing else, choosing one of:\n"
       << "{\"action\": \"insert_node\", \"insert_after\": <id>, \"node_type\": \"paragraph\", \"content\": \"<text>\"}\n"
       << "    adds a new block right after block <id>.\n"
       << "{\"action\": \"modify_node\", \"id\": <id>, \"node_type\": \"<nodeType of that block>\", \"content\": \"<text>\"}\n"
       << "    replaces the text of block <id>, keeping its kind; tables, rows, page breaks\n"
       << "    and chat sessions cannot be modified.\n"
       << "{\"action\": \"reply\", \"content\": \"<text>\"}\n"
       << "    answers the user without editing the note.\n"
       << "Valid node_type values for new blocks: text, paragraph, heading, ai-embedding.\n"
       << "Do not wrap the JSON in code blocks.\n";

    return ss.str();
}

std::string PromptAssembler::BuildSystemPrompt(const std::vector<BriefEntry>& brief, std::size_t cursorPosition) {
    PromptContext prompt;
    prompt.brief = brief;
    prompt.cursorPosition = cursorPosition;
    return prompt.render();
}

std::vector<AIService::ChatMessage> PromptAssembler::BuildConversation(
    const domain::ChatContext& context,
    const std::vector<AIService::ChatMessage>& history,
    std::size_t maxHistory) {

    std::vector<AIService::ChatMessage> messages;
    messages.push_back({AIService::ChatMessage::Role::System, Assemble(context).render()});

    size_t first = 0;
    if (maxHistory > 0 && history.size() > maxHistory) {
        first = history.size() - maxHistory;
    }
    messages.insert(messages.end(), history.begin() + static_cast<std::ptrdiff_t>(first), history.end());
    return messages;
}

} // namespace noteagent::application
