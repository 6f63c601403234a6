#undef NDEBUG
#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "application/BriefProjector.hpp"
#include "application/NoteEditor.hpp"
#include "domain/NoteAgentError.hpp"

using namespace noteagent::domain;
using noteagent::application::BriefProjector;
using noteagent::application::NoteEditor;

namespace {

Note ThreeParagraphs() {
    Note note = MakeEmptyNote("editor-test");
    note.children().push_back(MakeParagraphNode({MakeTextNode("zero")}));
    note.children().push_back(MakeParagraphNode({MakeTextNode("one")}));
    note.children().push_back(MakeParagraphNode({MakeTextNode("two")}));
    return note;
}

std::string TextAt(const Note& note, std::size_t id) {
    return BriefProjector::ExtractText(note.children().at(id));
}

bool ThrowsInvalidReference(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const NoteAgentError& e) {
        return e.kind() == ErrorKind::InvalidNodeReference;
    }
    return false;
}

void TestInsertRemoveUpdate() {
    std::cout << "[Test] Insert, remove and update..." << std::endl;
    Note note = ThreeParagraphs();

    Note front = NoteEditor::InsertNode(note, MakeTextNode("new"), 0);
    assert(front.children().size() == 4);
    assert(TextAt(front, 0) == "new");

    Note end = NoteEditor::InsertNode(note, MakeTextNode("new"), 3);
    assert(TextAt(end, 3) == "new");

    Note beyond = NoteEditor::InsertNode(note, MakeTextNode("new"), 99);
    assert(beyond.children().size() == 4 && TextAt(beyond, 3) == "new");

    Note appended = NoteEditor::AppendNode(note, MakeTextNode("tail"));
    assert(TextAt(appended, 3) == "tail");

    Note removed = NoteEditor::RemoveNode(note, 1);
    assert(removed.children().size() == 2);
    assert(TextAt(removed, 1) == "two");

    Note untouched = NoteEditor::RemoveNode(note, 7);
    assert(untouched.children().size() == 3);

    Note updated = NoteEditor::UpdateNode(note, 2, MakeTextNode("replaced"));
    assert(TextAt(updated, 2) == "replaced");
    assert(ThrowsInvalidReference([&] { NoteEditor::UpdateNode(note, 3, MakeTextNode("x")); }));

    assert(NoteEditor::GetNodeById(note, 0) != nullptr);
    assert(NoteEditor::GetNodeById(note, 3) == nullptr);

    // Input note is never modified
    assert(note.children().size() == 3);
    assert(TextAt(note, 2) == "two");
    std::cout << "[PASS] Insert, remove and update." << std::endl;
}

void TestCreateNodeForType() {
    std::cout << "[Test] Node creation by type name..." << std::endl;
    Node text = NoteEditor::CreateNodeForType("text", "a");
    assert(std::get<TextNode>(text.value).text == "a");

    Node paragraph = NoteEditor::CreateNodeForType("paragraph", "b");
    assert(NodeTypeTag(paragraph) == "paragraph");
    assert(BriefProjector::ExtractText(paragraph) == "b");

    Node heading = NoteEditor::CreateNodeForType("heading", "c");
    assert(std::get<HeadingNode>(heading.value).tag == HeadingTag::H1);
    assert(BriefProjector::ExtractText(heading) == "c");

    Node embedding = NoteEditor::CreateNodeForType("ai-embedding", "d");
    assert(std::get<AIEmbeddingNode>(embedding.value).content == "d");
    assert(!std::get<AIEmbeddingNode>(embedding.value).isLoading);

    Node fallback = NoteEditor::CreateNodeForType("quote", "e");
    assert(NodeTypeTag(fallback) == "paragraph");
    assert(BriefProjector::ExtractText(fallback) == "e");
    std::cout << "[PASS] Node creation by type name." << std::endl;
}

void TestApplyInsert() {
    std::cout << "[Test] Apply insert_node..." << std::endl;
    Note note = ThreeParagraphs();

    Note edited = NoteEditor::ApplyAction(note, InsertNodeAction{0, "paragraph", "after zero"});
    assert(edited.children().size() == 4);
    assert(TextAt(edited, 1) == "after zero");
    assert(TextAt(edited, 2) == "one");

    Note atEnd = NoteEditor::ApplyAction(note, InsertNodeAction{2, "heading", "last"});
    assert(NodeTypeTag(atEnd.children()[3]) == "heading");

    assert(ThrowsInvalidReference([&] { NoteEditor::ApplyAction(note, InsertNodeAction{3, "text", "x"}); }));

    Note empty = MakeEmptyNote("empty");
    Note first = NoteEditor::ApplyAction(empty, InsertNodeAction{0, "text", "hello"});
    assert(first.children().size() == 1);
    assert(TextAt(first, 0) == "hello");
    std::cout << "[PASS] Apply insert_node." << std::endl;
}

void TestApplyModify() {
    std::cout << "[Test] Apply modify_node..." << std::endl;
    Note note = ThreeParagraphs();
    note.children().push_back(MakeAIEmbeddingNode("old"));
    note.children().push_back(MakeTextNode("loose"));
    note.children().push_back(Node{PageBreakNode{}});

    Note paragraph = NoteEditor::ApplyAction(note, ModifyNodeAction{1, "paragraph", "ONE"});
    assert(TextAt(paragraph, 1) == "ONE");
    assert(ChildrenOf(paragraph.children()[1])->size() == 1);

    Note embedding = NoteEditor::ApplyAction(note, ModifyNodeAction{3, "ai-embedding", "fresh"});
    assert(std::get<AIEmbeddingNode>(embedding.children()[3].value).content == "fresh");

    Note text = NoteEditor::ApplyAction(note, ModifyNodeAction{4, "text", "tight"});
    assert(std::get<TextNode>(text.children()[4].value).text == "tight");

    Note unchanged = NoteEditor::ApplyAction(note, ModifyNodeAction{0, "table", "ignored"});
    assert(TextAt(unchanged, 0) == "zero");

    // A mismatched type name swaps in a fresh node of that type
    Note swapped = NoteEditor::ApplyAction(note, ModifyNodeAction{5, "paragraph", "text now"});
    assert(NodeTypeTag(swapped.children()[5]) == "paragraph");
    assert(TextAt(swapped, 5) == "text now");

    assert(ThrowsInvalidReference([&] { NoteEditor::ApplyAction(note, ModifyNodeAction{6, "text", "x"}); }));
    assert(TextAt(note, 1) == "one");
    std::cout << "[PASS] Apply modify_node." << std::endl;
}

void TestModifyByOwnType() {
    std::cout << "[Test] modify_node naming the block's own type..." << std::endl;
    Note note = MakeEmptyNote("own-type");
    note.children().push_back(MakeHeadingNode(HeadingTag::H2, {MakeTextNode("Old")}));

    QuoteNode quote;
    quote.children.push_back(MakeParagraphNode({MakeTextNode("said")}));
    note.children().push_back(Node{std::move(quote)});

    ListNode list;
    list.listType = ListType::Bullet;
    for (const char* item : {"a", "b"}) {
        ListItemNode li;
        li.children.push_back(MakeTextNode(item));
        list.children.push_back(Node{std::move(li)});
    }
    note.children().push_back(Node{std::move(list)});

    CodeNode inlineCode;
    inlineCode.body = std::string("x = 1");
    note.children().push_back(Node{std::move(inlineCode)});

    VoiceInputNode voice;
    voice.content = "um";
    note.children().push_back(Node{std::move(voice)});

    note.children().push_back(Node{PageBreakNode{}});

    Note heading = NoteEditor::ApplyAction(note, ModifyNodeAction{0, "heading", "New"});
    const auto& h = std::get<HeadingNode>(heading.children()[0].value);
    assert(h.tag == HeadingTag::H2);
    assert(TextAt(heading, 0) == "New");
    assert(BriefProjector::Project(heading)[0].content == "New");

    Note quoted = NoteEditor::ApplyAction(note, ModifyNodeAction{1, "quote", "unsaid"});
    assert(NodeTypeTag(quoted.children()[1]) == "quote");
    assert(TextAt(quoted, 1) == "unsaid");

    Note listed = NoteEditor::ApplyAction(note, ModifyNodeAction{2, "list", "only"});
    const auto& l = std::get<ListNode>(listed.children()[2].value);
    assert(l.children.size() == 1);
    assert(NodeTypeTag(l.children[0]) == "listitem");
    assert(TextAt(listed, 2) == "\xE2\x80\xA2 only");

    Note coded = NoteEditor::ApplyAction(note, ModifyNodeAction{3, "code", "x = 2"});
    assert(std::get<std::string>(std::get<CodeNode>(coded.children()[3].value).body) == "x = 2");

    Note spoken = NoteEditor::ApplyAction(note, ModifyNodeAction{4, "voice-input", "hello"});
    assert(std::get<VoiceInputNode>(spoken.children()[4].value).content == "hello");

    Note broken = NoteEditor::ApplyAction(note, ModifyNodeAction{5, "page-break", "ignored"});
    assert(NodeTypeTag(broken.children()[5]) == "page-break");

    // Naming some other block's type is still a no-op
    Note other = NoteEditor::ApplyAction(note, ModifyNodeAction{0, "quote", "nope"});
    assert(TextAt(other, 0) == "Old");
    std::cout << "[PASS] modify_node naming the block's own type." << std::endl;
}

void TestApplyReply() {
    std::cout << "[Test] Apply reply leaves the note alone..." << std::endl;
    Note note = ThreeParagraphs();
    Note same = NoteEditor::ApplyAction(note, ReplyAction{"just talking"});
    assert(same.children().size() == 3);
    assert(BriefProjector::ExtractNoteText(same) == BriefProjector::ExtractNoteText(note));
    std::cout << "[PASS] Apply reply leaves the note alone." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Note Editor Test..." << std::endl;
    TestInsertRemoveUpdate();
    TestCreateNodeForType();
    TestApplyInsert();
    TestApplyModify();
    TestModifyByOwnType();
    TestApplyReply();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
