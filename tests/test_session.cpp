#include <gtest/gtest.h>
#include <vibecli/core/commands.hpp>
#include <vibecli/core/session.hpp>
#include <vibecli/core/utils.hpp>
#include "test_support.hpp"

#include <memory>

using namespace vibecli;
using vibecli::testing_support::TempDir;
using vibecli::testing_support::ScriptedPrompter;
using vibecli::testing_support::RecordingRunner;
using vibecli::testing_support::ScriptedAI;

namespace {

// Context entry with its "(Updated HH:MM:SS)" stamp removed
std::string without_timestamp(const std::string& entry) {
    std::string s = entry;
    size_t start = s.find(" (Updated ");
    size_t end = s.find("):", start);
    if (start != std::string::npos && end != std::string::npos) {
        s.erase(start, end + 2 - start);
    }
    return s;
}

} // namespace

class SessionTest : public ::testing::Test {
protected:
    TempDir dir;
    Workspace workspace;
    ScriptedAI ai;
    ScriptedPrompter prompter;
    RecordingRunner runner;
    SessionConfig config;
    std::unique_ptr<Session> session;

    void SetUp() override {
        ASSERT_TRUE(workspace.open(dir.path()));
        config.system_prompt = "SYS";
        config.stream = false;
        config.dispatcher.color = false;
    }

    Session& start() {
        session.reset(new Session(workspace, ai, prompter, runner, config));
        session->start();
        return *session;
    }

    std::vector<ConversationMessage>& history() { return session->state().message_history; }
};

// ============================================================================
// Startup and context entry
// ============================================================================

TEST_F(SessionTest, StartSeedsSystemPromptAndContext) {
    dir.write("index.html", "<h1>hi</h1>\n");
    start();

    ASSERT_EQ(2u, history().size());
    EXPECT_EQ(MessageRole::SYSTEM, history()[0].role);
    EXPECT_EQ("SYS", history()[0].content);
    EXPECT_EQ(1, session->find_context_entry());
    EXPECT_TRUE(starts_with(history()[1].content, Session::CONTEXT_MARKER));
    EXPECT_NE(std::string::npos, history()[1].content.find("<h1>hi</h1>"));
}

TEST_F(SessionTest, NoContextWhenScanDisabled) {
    config.load_context = false;
    start();
    ASSERT_EQ(1u, history().size());
    EXPECT_EQ(-1, session->find_context_entry());
}

TEST_F(SessionTest, RefreshTwiceIsStableApartFromTimestamp) {
    dir.write("src/app.js", "let x = 1;\n");
    start();
    std::string first = history()[1].content;

    session->refresh_context(session->state());
    ASSERT_EQ(2u, history().size());
    EXPECT_EQ(without_timestamp(first), without_timestamp(history()[1].content));
}

TEST_F(SessionTest, PackageManagerDetectedFromLockFile) {
    dir.write("pnpm-lock.yaml", "");
    start();
    EXPECT_EQ(PackageManager::PNPM, session->state().package_manager);
}

// ============================================================================
// Turns
// ============================================================================

TEST_F(SessionTest, ProseReplyEndsTurnAfterOneCompletion) {
    start();
    ai.reply("Closures capture the variables of their enclosing scope.");
    TurnOutcome out = session->run_turn("explain closures");

    EXPECT_TRUE(out.backend_ok);
    EXPECT_EQ(1, out.completions);
    EXPECT_EQ(0u, out.actions);
    ASSERT_EQ(4u, history().size());
    EXPECT_EQ(MessageRole::USER, history()[2].role);
    EXPECT_EQ("explain closures", history()[2].content);
    EXPECT_EQ(MessageRole::ASSISTANT, history()[3].role);
    EXPECT_NE(std::string::npos, prompter.all_said().find("Closures capture"));
}

TEST_F(SessionTest, ChangeDirectoryRetargetsContext) {
    dir.write("top.txt", "root file\n");
    dir.write("subdir/inner.txt", "inner file\n");
    start();

    ai.reply(">>> CD subdir\n<<<");
    ai.reply("Now inside subdir.");
    TurnOutcome out = session->run_turn("go to subdir");

    EXPECT_EQ(2, out.completions);
    EXPECT_EQ(1u, out.actions);
    EXPECT_EQ(dir.file("subdir"), session->state().current_working_directory);

    const std::string& ctx = history()[session->find_context_entry()].content;
    EXPECT_NE(std::string::npos, ctx.find("inner.txt"));
    EXPECT_EQ(std::string::npos, ctx.find("top.txt"));

    // results come back to the backend as one user message
    ASSERT_EQ(2u, ai.requests.size());
    const ConversationMessage& fed = ai.requests[1].back();
    EXPECT_EQ(MessageRole::USER, fed.role);
    EXPECT_TRUE(starts_with(fed.content, "[ACTION_RESULT verb=CD success=true]"));
}

TEST_F(SessionTest, FollowUpBudgetBoundsCompletions) {
    config.max_followup_turns = 1;
    start();
    ai.reply(">>> TREE <<<");
    ai.reply(">>> TREE <<<");
    ai.reply(">>> TREE <<<");
    TurnOutcome out = session->run_turn("show me");

    EXPECT_EQ(2, out.completions);
    EXPECT_EQ(2u, out.actions);
    EXPECT_EQ(1u, ai.replies.size());
}

TEST_F(SessionTest, ZeroFollowUpsMeansSingleCompletion) {
    config.max_followup_turns = 0;
    start();
    ai.reply(">>> LISTFILES <<<");
    ai.reply("unused");
    TurnOutcome out = session->run_turn("list");
    EXPECT_EQ(1, out.completions);
    EXPECT_EQ(MessageRole::USER, history().back().role);
}

TEST_F(SessionTest, InstallUsesDetectedManager) {
    dir.write("pnpm-lock.yaml", "");
    start();
    prompter.answer("y");
    ai.reply(">>> INSTALL axios\n<<<");
    ai.reply("Installed.");
    session->run_turn("add axios");

    ASSERT_EQ(1u, runner.runs.size());
    EXPECT_EQ("pnpm add axios", runner.runs[0].command);
}

TEST_F(SessionTest, StreamedProseHidesCommandBlocks) {
    config.stream = true;
    start();
    prompter.answer("y");
    ai.reply("Here you go.\n>>> WRITE a.txt\nhi\n<<<\nDone.");
    TurnOutcome out = session->run_turn("write a");

    EXPECT_TRUE(out.backend_ok);
    EXPECT_EQ("hi", dir.read("a.txt"));
    EXPECT_NE(std::string::npos, prompter.streamed.find("Here you go."));
    EXPECT_EQ(std::string::npos, prompter.streamed.find(">>> WRITE"));
}

TEST_F(SessionTest, BackendFailureKeepsHistoryAndSession) {
    start();
    ai.fail("HTTP 500: upstream error");
    TurnOutcome out = session->run_turn("hello");

    EXPECT_FALSE(out.backend_ok);
    EXPECT_EQ("HTTP 500: upstream error", out.error);
    ASSERT_EQ(3u, history().size());
    EXPECT_EQ("hello", history()[2].content);
    EXPECT_NE(std::string::npos, prompter.all_warnings().find("Backend error: HTTP 500"));

    ai.reply("Hi again.");
    out = session->run_turn("hello?");
    EXPECT_TRUE(out.backend_ok);
    EXPECT_EQ(5u, history().size());
}

TEST_F(SessionTest, InterruptAtPromptStopsRemainingActions) {
    start();
    prompter.interrupt_when_empty = true;
    ai.reply(">>> WRITE a.txt\nA\n<<<\n>>> WRITE b.txt\nB\n<<<");
    TurnOutcome out = session->run_turn("write two files");

    EXPECT_TRUE(out.interrupted);
    EXPECT_EQ(1, out.completions);
    EXPECT_EQ(1u, out.actions);
    EXPECT_FALSE(path_exists(dir.file("a.txt")));
    EXPECT_FALSE(path_exists(dir.file("b.txt")));
    EXPECT_NE(std::string::npos, history().back().content.find("Interrupted by operator"));
}

TEST_F(SessionTest, ContextLimitErrorRetriesWithCompactedHistory) {
    start();
    ai.reply(std::string(5000, 'x'));
    session->run_turn("first");

    ai.fail("This model's maximum context length is 8192 tokens");
    ai.reply("fits now");
    TurnOutcome out = session->run_turn("second");

    EXPECT_TRUE(out.backend_ok);
    EXPECT_EQ(2, out.completions);
    EXPECT_NE(std::string::npos, history()[3].content.find(Session::TRUNCATION_MARKER));
    EXPECT_EQ("fits now", history().back().content);
}

// ============================================================================
// History maintenance
// ============================================================================

TEST_F(SessionTest, PruningKeepsLeadingEntriesAndRecentTurns) {
    config.max_history_turns = 2;
    start();
    const char* questions[] = {"q1", "q2", "q3", "q4"};
    for (size_t i = 0; i < 4; ++i) {
        ai.reply(std::string("a") + questions[i]);
        session->run_turn(questions[i]);
    }

    ASSERT_EQ(6u, history().size());
    EXPECT_EQ("SYS", history()[0].content);
    EXPECT_EQ(1, session->find_context_entry());
    EXPECT_EQ("q3", history()[2].content);
    EXPECT_EQ("aq4", history()[5].content);
}

TEST_F(SessionTest, CompactionSkipsContextAndNewestMessage) {
    config.max_history_chars = 1000;
    start();
    history().push_back(ConversationMessage::assistant(std::string(4500, 'a')));
    history().push_back(ConversationMessage::user(std::string(4500, 'u')));

    EXPECT_TRUE(session->compact_history());
    EXPECT_NE(std::string::npos, history()[2].content.find("(4500 characters)"));
    EXPECT_EQ(4500u, history()[3].content.size());
    EXPECT_TRUE(starts_with(history()[1].content, Session::CONTEXT_MARKER));
}

TEST_F(SessionTest, ClearConversationKeepsContext) {
    start();
    ai.reply("ok");
    session->run_turn("hi");
    session->clear_conversation();
    ASSERT_EQ(2u, history().size());
    EXPECT_EQ(1, session->find_context_entry());
}

// ============================================================================
// Intent classification
// ============================================================================

TEST_F(SessionTest, IntentHintPrefixesInstruction) {
    config.classify_intent = true;
    start();
    ai.reply("  write.");
    ai.reply("Sure.");
    session->run_turn("make a readme");

    ASSERT_EQ(2u, ai.requests.size());
    ASSERT_EQ(1u, ai.requests[0].size());
    EXPECT_EQ(0u, ai.requests[0][0].content.find("ANALYZE THE FOLLOWING REQUEST: 'make a readme'"));
    EXPECT_EQ(10, ai.options[0].max_tokens);
    EXPECT_EQ("ACTION REQUIRED: WRITE. User Request: make a readme", history()[2].content);
}

TEST_F(SessionTest, ChatIntentLeavesInstructionAlone) {
    config.classify_intent = true;
    start();
    ai.reply("CHAT");
    ai.reply("Hello!");
    session->run_turn("how are you");
    EXPECT_EQ("how are you", history()[2].content);
}

// ============================================================================
// Operator commands
// ============================================================================

TEST_F(SessionTest, OperatorCommands) {
    start();
    CommandTable table;
    register_core_commands(table);
    CommandReply reply;

    EXPECT_FALSE(table.handle("write me a server", *session, reply));

    ASSERT_TRUE(table.handle("  EXIT ", *session, reply));
    EXPECT_TRUE(reply.quit);

    ASSERT_TRUE(table.handle("/status", *session, reply));
    EXPECT_FALSE(reply.quit);
    EXPECT_NE(std::string::npos, reply.text.find("Package manager: npm"));
    EXPECT_NE(std::string::npos, reply.text.find("Context: loaded"));

    ASSERT_TRUE(table.handle("/refresh", *session, reply));
    EXPECT_TRUE(starts_with(reply.text, "Context refreshed.\n\nCurrent Structure:\n"));

    ASSERT_TRUE(table.handle("/help", *session, reply));
    EXPECT_NE(std::string::npos, reply.text.find("/clear - "));

    ai.reply("ok");
    session->run_turn("hi");
    ASSERT_TRUE(table.handle("/clear", *session, reply));
    EXPECT_EQ(2u, history().size());
}

TEST(ContextLimitErrors, RecognisedPhrasings) {
    EXPECT_TRUE(is_context_limit_error("This model's maximum context length is 8192 tokens"));
    EXPECT_TRUE(is_context_limit_error("400: prompt is too long"));
    EXPECT_TRUE(is_context_limit_error("Input exceeds the context window"));
    EXPECT_FALSE(is_context_limit_error("HTTP 401: invalid api key"));
}
