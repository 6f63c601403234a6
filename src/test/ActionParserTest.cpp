#undef NDEBUG
#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "application/ActionParser.hpp"
#include "domain/ChatAction.hpp"
#include "domain/NoteAgentError.hpp"

using namespace noteagent::domain;
using noteagent::application::ActionParser;

namespace {

std::string ReplyText(const ChatAction& action) {
    assert(std::holds_alternative<ReplyAction>(action));
    return std::get<ReplyAction>(action).content;
}

ErrorKind CaptureError(const std::string& raw, std::string& detail) {
    try {
        ActionParser::Parse(raw);
    } catch (const NoteAgentError& e) {
        detail = e.detail();
        return e.kind();
    }
    assert(false && "Expected NoteAgentError");
    return ErrorKind::MalformedActionJson;
}

void TestPlainProse() {
    std::cout << "[Test] Prose becomes a reply..." << std::endl;
    assert(ReplyText(ActionParser::Parse("Hello there")) == "Hello there");
    assert(ReplyText(ActionParser::Parse("  Sure, done.\n")) == "Sure, done.");
    assert(ReplyText(ActionParser::Parse("")) == "");
    assert(ReplyText(ActionParser::Parse("I think {this} works")) == "I think {this} works");
    std::cout << "[PASS] Prose becomes a reply." << std::endl;
}

void TestFencedJson() {
    std::cout << "[Test] Code fences are stripped..." << std::endl;
    assert(ReplyText(ActionParser::Parse(" ```{\"action\":\"reply\",\"content\":\"hi\"}``` ")) == "hi");

    ChatAction tagged = ActionParser::Parse("```json\n{\"action\":\"modify_node\",\"id\":0,\"node_type\":\"paragraph\",\"content\":\"new\"}\n```");
    const auto& modify = std::get<ModifyNodeAction>(tagged);
    assert(modify.id == 0 && modify.nodeType == "paragraph" && modify.content == "new");

    ChatAction spaced = ActionParser::Parse("```json {\"action\":\"reply\",\"content\":\"ok\"}```");
    assert(ReplyText(spaced) == "ok");

    assert(ActionParser::StripCodeFence("```\nplain\n```") == "plain");
    assert(ActionParser::StripCodeFence("```hello world```") == "hello world");
    assert(ActionParser::StripCodeFence("```") == "");
    // A lone word inside a fence is the answer, not a language tag
    assert(ReplyText(ActionParser::Parse("```Done\n```")) == "Done");
    assert(ActionParser::StripCodeFence("```Done```") == "Done");
    assert(ActionParser::StripCodeFence("```text\nDone\n```") == "Done");
    assert(ActionParser::StripCodeFence("no fence") == "no fence");
    std::cout << "[PASS] Code fences are stripped." << std::endl;
}

void TestInsertNode() {
    std::cout << "[Test] insert_node..." << std::endl;
    ChatAction action = ActionParser::Parse(
        "{\"action\":\"insert_node\",\"insert_after\":2,\"node_type\":\"text\",\"content\":\"x\"}");
    const auto& insert = std::get<InsertNodeAction>(action);
    assert(insert.insertAfter == 2);
    assert(insert.nodeType == "text");
    assert(insert.content == "x");
    std::cout << "[PASS] insert_node." << std::endl;
}

void TestJsonWithoutAction() {
    std::cout << "[Test] JSON without action is a verbatim reply..." << std::endl;
    assert(ReplyText(ActionParser::Parse("{\"foo\":\"bar\"}")) == "{\"foo\":\"bar\"}");
    std::cout << "[PASS] JSON without action is a verbatim reply." << std::endl;
}

void TestErrors() {
    std::cout << "[Test] Parser errors..." << std::endl;
    std::string detail;

    assert(CaptureError("{\"action\":\"delete_node\"}", detail) == ErrorKind::UnsupportedActionType);
    assert(detail == "delete_node");

    assert(CaptureError("{\"action\":7}", detail) == ErrorKind::UnsupportedActionType);
    assert(detail == "7");

    assert(CaptureError("{not json", detail) == ErrorKind::MalformedActionJson);
    assert(CaptureError("{\"action\":\"reply\"} trailing", detail) == ErrorKind::MalformedActionJson);

    assert(CaptureError("{\"action\":\"insert_node\",\"node_type\":\"text\",\"content\":\"x\"}", detail) ==
           ErrorKind::MalformedActionShape);
    assert(detail.find("insert_after") != std::string::npos);

    assert(CaptureError("{\"action\":\"insert_node\",\"insert_after\":-1,\"node_type\":\"text\",\"content\":\"x\"}", detail) ==
           ErrorKind::MalformedActionShape);
    assert(CaptureError("{\"action\":\"insert_node\",\"insert_after\":\"2\",\"node_type\":\"text\",\"content\":\"x\"}", detail) ==
           ErrorKind::MalformedActionShape);
    assert(CaptureError("{\"action\":\"insert_node\",\"insert_after\":1.5,\"node_type\":\"text\",\"content\":\"x\"}", detail) ==
           ErrorKind::MalformedActionShape);
    assert(CaptureError("{\"action\":\"modify_node\",\"id\":1,\"content\":\"x\"}", detail) ==
           ErrorKind::MalformedActionShape);
    assert(detail.find("node_type") != std::string::npos);
    assert(CaptureError("{\"action\":\"reply\",\"content\":5}", detail) == ErrorKind::MalformedActionShape);
    std::cout << "[PASS] Parser errors." << std::endl;
}

void TestWireFormatAndDescription() {
    std::cout << "[Test] Action wire format and description..." << std::endl;
    ChatAction insert = InsertNodeAction{3, "paragraph", "body"};
    auto j = ActionParser::ToJson(insert);
    assert(j["action"] == "insert_node");
    assert(j["insert_after"] == 3);
    assert(j["node_type"] == "paragraph");
    assert(j["content"] == "body");
    assert(DescribeAction(insert) == "Agent inserted a new paragraph node");
    assert(ActionTypeOf(insert) == "insert_node");

    ChatAction modify = ModifyNodeAction{1, "heading", "T"};
    assert(ActionParser::ToJson(modify)["id"] == 1);
    assert(DescribeAction(modify) == "Agent modified heading node at position 1");

    ChatAction reply = ReplyAction{"hi"};
    auto r = ActionParser::ToJson(reply);
    assert(r.size() == 2 && r["action"] == "reply" && r["content"] == "hi");
    assert(DescribeAction(reply) == "Agent replied to your message");

    // Wire form parses back to the same action
    ChatAction parsed = ActionParser::Parse(j.dump());
    const auto& back = std::get<InsertNodeAction>(parsed);
    assert(back.insertAfter == 3 && back.content == "body");
    std::cout << "[PASS] Action wire format and description." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Action Parser Test..." << std::endl;
    TestPlainProse();
    TestFencedJson();
    TestInsertNode();
    TestJsonWithoutAction();
    TestErrors();
    TestWireFormatAndDescription();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
