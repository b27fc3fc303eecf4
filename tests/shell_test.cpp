#include "constants.hpp"
#include "shell.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace minterm {
namespace {

using test::read_file;
using test::split_lines;
using test::TempDirectory;
using test::TestSession;

using Lines = std::vector<std::string>;

// Line reader fed from a fixed script that remembers what it was given.
class ScriptedLineReader : public LineReader {
public:
  explicit ScriptedLineReader(Lines lines) : lines_(std::move(lines)) {}

  auto read_line(const std::string &prompt)
      -> std::optional<std::string> override {
    prompts.push_back(prompt);
    if (next_ >= lines_.size()) {
      return std::nullopt;
    }
    return lines_[next_++];
  }

  auto add_history(const std::string &line) -> void override {
    history.push_back(line);
  }

  auto set_completion_source(CompletionSource *) -> void override {}

  Lines prompts;
  Lines history;

private:
  Lines lines_;
  size_t next_ = 0;
};

class ShellTest : public ::testing::Test {
protected:
  ShellTest() : terminal(dir.path()) {}

  TempDirectory dir;
  TestSession terminal;
};

TEST_F(ShellTest, ScenarioMkdirCdTouchRm) {
  std::istringstream input("mkdir sub\n"
                           "cd sub\n"
                           "pwd\n"
                           "touch f.txt\n"
                           "ls\n"
                           "rm f.txt\n"
                           "ls\n");
  StreamLineReader reader(input);

  repl_loop(terminal.session, reader);

  EXPECT_EQ(split_lines(terminal.take_out()),
            (Lines{(dir.path() / "sub").string(), "f.txt"}));
  EXPECT_TRUE(terminal.take_err().empty());
  EXPECT_EQ(terminal.session.cwd, dir.path() / "sub");
}

TEST_F(ShellTest, EmptyInputIsANoOp) {
  EXPECT_TRUE(handle_input(terminal.session, ""));
  EXPECT_TRUE(handle_input(terminal.session, "   \t"));

  EXPECT_TRUE(terminal.session.history.entries().empty());
  EXPECT_TRUE(terminal.take_out().empty());
  EXPECT_TRUE(terminal.take_err().empty());
}

TEST_F(ShellTest, ExitAndQuitStopTheLoop) {
  EXPECT_FALSE(handle_input(terminal.session, "exit"));
  EXPECT_FALSE(handle_input(terminal.session, "quit"));
  EXPECT_FALSE(handle_input(terminal.session, "  exit now"));
}

TEST_F(ShellTest, LinesAfterExitAreNotRun) {
  ScriptedLineReader reader({"touch before", "exit", "touch after"});

  repl_loop(terminal.session, reader);

  EXPECT_TRUE(fs::exists(dir.path() / "before"));
  EXPECT_FALSE(fs::exists(dir.path() / "after"));
}

TEST_F(ShellTest, EveryAcceptedLineIsRecordedWithoutDeduplication) {
  ScriptedLineReader reader({"pwd", "", "pwd", "nosuchcommand_xyz", "exit"});

  repl_loop(terminal.session, reader);

  Lines expected{"pwd", "pwd", "nosuchcommand_xyz", "exit"};
  EXPECT_EQ(terminal.session.history.entries(), expected);
  EXPECT_EQ(reader.history, expected);
}

TEST_F(ShellTest, PromptShowsSessionCwd) {
  test::ScopedEnvironment home("HOME", "/nonexistent_home_for_test");
  fs::create_directory(dir.path() / "sub");
  ScriptedLineReader reader({"cd sub"});

  repl_loop(terminal.session, reader);

  ASSERT_EQ(reader.prompts.size(), 2u);
  EXPECT_EQ(reader.prompts[0], "minterm:" + dir.path().string() + "$ ");
  EXPECT_EQ(reader.prompts[1],
            "minterm:" + (dir.path() / "sub").string() + "$ ");
}

TEST_F(ShellTest, PromptAbbreviatesHome) {
  test::ScopedEnvironment home("HOME", dir.path().string());
  EXPECT_EQ(build_prompt(terminal.session), "minterm:~$ ");

  terminal.session.cwd = dir.path() / "deeper";
  EXPECT_EQ(build_prompt(terminal.session), "minterm:~/deeper$ ");
}

TEST_F(ShellTest, BuiltinFailureDoesNotStopTheLoop) {
  EXPECT_TRUE(handle_input(terminal.session, "cd nowhere"));
  EXPECT_EQ(terminal.session.last_status, status::FAILURE);
  EXPECT_TRUE(handle_input(terminal.session, "pwd"));
  EXPECT_EQ(terminal.session.last_status, status::SUCCESS);
  EXPECT_EQ(terminal.take_out(), dir.path().string() + "\n");
}

TEST_F(ShellTest, QuotedArgumentsReachHandlers) {
  EXPECT_TRUE(handle_input(terminal.session, "touch 'with space.txt'"));
  EXPECT_TRUE(fs::exists(dir.path() / "with space.txt"));
}

TEST_F(ShellTest, UnknownCommandIsReportedAsNotFound) {
  EXPECT_TRUE(handle_input(terminal.session, "nosuchcommand_xyz --flag"));
  EXPECT_EQ(terminal.session.last_status, status::NOT_FOUND);
  EXPECT_EQ(terminal.take_err(), "nosuchcommand_xyz: command not found\n");
}

TEST_F(ShellTest, BuiltinMatchingIsCaseSensitive) {
  EXPECT_TRUE(handle_input(terminal.session, "PWD"));
  EXPECT_EQ(terminal.session.last_status, status::NOT_FOUND);
  EXPECT_TRUE(terminal.take_out().empty());
}

TEST_F(ShellTest, ExternalExitCodeIsSurfacedUnchanged) {
  EXPECT_TRUE(handle_input(terminal.session, "sh -c 'exit 5'"));
  EXPECT_EQ(terminal.session.last_status, 5);
  EXPECT_EQ(terminal.take_err(), "sh: exited with status 5\n");

  EXPECT_TRUE(handle_input(terminal.session, "sh -c 'exit 0'"));
  EXPECT_EQ(terminal.session.last_status, 0);
  EXPECT_TRUE(terminal.take_err().empty());
}

TEST_F(ShellTest, ExternalCommandsRunInSessionCwd) {
  fs::create_directory(dir.path() / "work");
  handle_input(terminal.session, "cd work");
  handle_input(terminal.session, "sh -c 'echo made > out.txt; pwd -P'");

  EXPECT_EQ(terminal.take_out(), (dir.path() / "work").string() + "\n");
  EXPECT_EQ(read_file(dir.path() / "work" / "out.txt"), "made\n");
}

TEST_F(ShellTest, HistoryFileSurvivesRestart) {
  fs::path histfile = dir.path() / "history";
  {
    TestSession first(dir.path(), HistoryStore(histfile.string()));
    ScriptedLineReader reader({"mkdir logs", "ls"});
    repl_loop(first.session, reader);
  }

  HistoryStore store(histfile.string());
  store.load();
  TestSession second(dir.path(), std::move(store));
  ScriptedLineReader reader(Lines{});
  load_history(second.session, reader);

  EXPECT_EQ(reader.history, (Lines{"mkdir logs", "ls"}));
  EXPECT_EQ(read_file(histfile), "mkdir logs\nls\n");
}

} // namespace
} // namespace minterm
