#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/PromptAssembler.hpp"
#include "domain/LexicalNode.hpp"

using namespace noteagent::domain;
using noteagent::application::BriefProjector;
using noteagent::application::PromptAssembler;
using ChatMessage = AIService::ChatMessage;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Note SampleNote() {
    Note note = MakeEmptyNote("prompt-test");
    note.children().push_back(MakeHeadingNode(HeadingTag::H1, {MakeTextNode("Plan")}));
    note.children().push_back(MakeParagraphNode({MakeTextNode("")}));
    note.children().push_back(MakeParagraphNode({MakeTextNode("Buy milk")}));
    return note;
}

void TestInsertSuggestion() {
    std::cout << "[Test] insert_after suggestion..." << std::endl;
    assert(PromptAssembler::SuggestInsertAfter(0) == 0);
    assert(PromptAssembler::SuggestInsertAfter(1) == 0);
    assert(PromptAssembler::SuggestInsertAfter(3) == 2);
    std::cout << "[PASS] insert_after suggestion." << std::endl;
}

void TestSystemPrompt() {
    std::cout << "[Test] System prompt embeds brief and cursor..." << std::endl;
    Note note = SampleNote();
    auto brief = BriefProjector::Project(note);
    std::string prompt = PromptAssembler::BuildSystemPrompt(brief, 3);

    assert(Contains(prompt, BriefProjector::ToJson(brief).dump(2)));
    assert(Contains(prompt, "\"content\": \"Buy milk\""));
    assert(!Contains(prompt, "\"id\": 1,"));
    assert(Contains(prompt, "cursor is at position 3"));
    assert(Contains(prompt, "insert_after = 2"));
    assert(Contains(prompt, "insert_node"));
    assert(Contains(prompt, "modify_node"));
    assert(Contains(prompt, "<nodeType of that block>"));
    assert(Contains(prompt, "page breaks"));
    assert(Contains(prompt, "\"reply\""));

    std::string atStart = PromptAssembler::BuildSystemPrompt(brief, 0);
    assert(Contains(atStart, "cursor is at position 0"));
    assert(Contains(atStart, "insert_after = 0"));

    std::string empty = PromptAssembler::BuildSystemPrompt({}, 0);
    assert(Contains(empty, "[]"));
    std::cout << "[PASS] System prompt embeds brief and cursor." << std::endl;
}

void TestConversation() {
    std::cout << "[Test] Conversation assembly..." << std::endl;
    Note note = SampleNote();
    ChatContext context{note, 1};

    std::vector<ChatMessage> history = {
        {ChatMessage::Role::User, "first"},
        {ChatMessage::Role::Assistant, "answer"},
        {ChatMessage::Role::User, "second"}
    };

    auto all = PromptAssembler::BuildConversation(context, history);
    assert(all.size() == 4);
    assert(all[0].role == ChatMessage::Role::System);
    assert(all[0].content == PromptAssembler::Assemble(context).render());
    assert(Contains(all[0].content, "cursor is at position 1"));
    assert(all[1].content == "first");
    assert(all[3].content == "second");

    auto truncated = PromptAssembler::BuildConversation(context, history, 2);
    assert(truncated.size() == 3);
    assert(truncated[0].role == ChatMessage::Role::System);
    assert(truncated[1].content == "answer");
    assert(truncated[2].content == "second");

    auto roomy = PromptAssembler::BuildConversation(context, history, 10);
    assert(roomy.size() == 4);

    auto onlySystem = PromptAssembler::BuildConversation(context, {});
    assert(onlySystem.size() == 1);
    std::cout << "[PASS] Conversation assembly." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Prompt Assembler Test..." << std::endl;
    TestInsertSuggestion();
    TestSystemPrompt();
    TestConversation();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
