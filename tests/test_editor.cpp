/**
 * @file test_editor.cpp
 * @brief Tests for the child-process editor (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Editor.hpp"

#include <chrono>
#include <thread>

using namespace jpatch;

namespace {

/// Poll until the process exits; false if it is still running after ~5s
bool wait_finished(EditorProcess& process) {
    for (int i = 0; i < 500; ++i) {
        if (process.finished()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Command splitting
// ============================================================================

TEST(SplitCommand, Words) {
    EXPECT_EQ(split_command("vim"), (std::vector<std::string>{"vim"}));
    EXPECT_EQ(split_command("  code   --wait "),
              (std::vector<std::string>{"code", "--wait"}));
}

TEST(SplitCommand, Quotes) {
    EXPECT_EQ(split_command("'my editor' -n"),
              (std::vector<std::string>{"my editor", "-n"}));
    EXPECT_EQ(split_command("emacs \"-q\" --eval='(x y)'"),
              (std::vector<std::string>{"emacs", "-q", "--eval=(x y)"}));
    EXPECT_EQ(split_command("a ''"), (std::vector<std::string>{"a", ""}));
}

TEST(SplitCommand, Empty) {
    EXPECT_TRUE(split_command("").empty());
    EXPECT_TRUE(split_command("   ").empty());
}

// ============================================================================
// Process editor
// ============================================================================

TEST(ProcessEditor, RejectsEmptyCommand) {
    EXPECT_THROW(ProcessEditor("  "), EditorError);
}

TEST(ProcessEditor, RunSucceeds) {
    ProcessEditor editor("true");
    EXPECT_EQ(editor.command(), "true");
    EXPECT_NO_THROW(editor.run("/dev/null"));
}

TEST(ProcessEditor, RunReportsExitStatus) {
    ProcessEditor editor("false");
    try {
        editor.run("/dev/null");
        FAIL() << "expected EditorError";
    } catch (const EditorError& e) {
        EXPECT_EQ(e.command(), "false");
        EXPECT_NE(std::string(e.what()).find("status 1"), std::string::npos);
    }
}

TEST(ProcessEditor, RunMissingProgram) {
    ProcessEditor editor("jpatch-no-such-editor-program");
    EXPECT_THROW(editor.run("/dev/null"), EditorError);
}

TEST(ProcessEditor, LaunchFinishes) {
    ProcessEditor editor("true");
    auto process = editor.launch("/dev/null");
    EXPECT_TRUE(wait_finished(*process));
    // Reaped: further polls keep reporting success
    EXPECT_TRUE(process->finished());
}

TEST(ProcessEditor, LaunchReportsFailure) {
    ProcessEditor editor("sh -c 'exit 3'");
    auto process = editor.launch("/dev/null");
    EXPECT_THROW(wait_finished(*process), EditorError);
}

TEST(ProcessEditor, LaunchedEditorStoppedOnDestruction) {
    ProcessEditor editor("sh -c 'sleep 30'");
    const auto start = std::chrono::steady_clock::now();
    {
        auto process = editor.launch("/dev/null");
        EXPECT_FALSE(process->finished());
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}
