#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/CompactionEngine.hpp"
#include "test_utils.hpp"
#include "util/TextUtil.hpp"

using namespace vcstrim;
using namespace vcstrim::test;
using namespace vcstrim::test::utils;

namespace {

const char* const kCleanStatus =
    "The working copy has no changes.\n"
    "Working copy  (@) : kntqzsqt d7439b06 (empty) (no description set)\n"
    "Parent commit (@-): orrkosyo 7fd1a60b master | (empty) Merge pull request #6 from user/branch\n";

const char* const kChangedStatus =
    "Working copy changes:\n"
    "M src/main.rs\n"
    "A new_file.rs\n"
    "Working copy  (@) : kntqzsqt d7439b06 wip\n"
    "Parent commit (@-): orrkosyo 7fd1a60b master | (empty) Merge pull request #6 from user/branch\n";

const char* const kOpLog =
    "@  d3b77addea49 user@host 3 minutes ago, lasted 3 milliseconds\n"
    "│  squash commits into f7fb5943a1b2c3d4e5f6\n"
    "│  args: jj squash\n";

const char* const kConflictStderr =
    "Error: Failed to rebase\n"
    "Caused by: merge conflict in src/main.rs\n"
    "Hint: run `jj resolve` after the rebase\n";

std::string sevenEntryLog() {
    std::string text;
    const char* ids[] = {"kkkkkkkk", "llllllll", "mmmmmmmm", "nnnnnnnn", "oooooooo", "pppppppp", "qqqqqqqq"};
    for (int i = 0; i < 7; ++i) {
        text += std::string("○  ") + ids[i] + " jane@example.com 2024-01-0" + std::to_string(i + 1) +
                " 10:00:00 " + std::to_string(1000000 + i) + "ab\n";
        text += "│  change by jane@example.com number " + std::to_string(i) + "\n";
    }
    return text;
}

class CompactionEngineTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;
    FilterConfig config;

    Expected<CompactResult> run(const std::string& command, const std::vector<std::string>& args) {
        CompactionEngine engine(runner, "jj", config);
        return engine.run(Invocation{command, args});
    }
};

}

// Test: Clean status compacts to two lines without the "no changes" message
TEST_F(CompactionEngineTest, CleanStatusScenario) {
    runner.reply("jj status --color=never", ok(kCleanStatus));
    auto res = run("status", {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().text, "@ kntqzsqt d7439b06 (empty)\n@- orrkosyo master\n");
    EXPECT_EQ(res.value().exitCode, 0);
    EXPECT_FALSE(res.value().degradedToRaw);
}

// Test: Seven log entries render five plus "… 2 more"
TEST_F(CompactionEngineTest, LogTruncationScenario) {
    runner.reply("jj log --color=never", ok(sevenEntryLog()));
    auto res = run("log", {});
    ASSERT_TRUE(res.has_value());
    auto lines = TextUtil::splitLines(res.value().text);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines.back(), "\xE2\x80\xA6 2 more");
    EXPECT_FALSE(res.value().degradedToRaw);
}

// Test: Modified and added files appear with their op letters
TEST_F(CompactionEngineTest, ChangedStatusScenario) {
    runner.reply("jj st --color=never", ok(kChangedStatus));
    auto res = run("st", {});
    ASSERT_TRUE(res.has_value());
    const std::string& text = res.value().text;
    EXPECT_NE(text.find("\nM src/main.rs\n"), std::string::npos);
    EXPECT_NE(text.find("\nA new_file.rs\n"), std::string::npos);
    EXPECT_NE(text.find("@ kntqzsqt d7439b06"), std::string::npos);
    EXPECT_NE(text.find("@- orrkosyo master"), std::string::npos);
}

// Test: Op log entry shortens the id and time and strips the user
TEST_F(CompactionEngineTest, OpLogScenario) {
    runner.reply("jj op --color=never log", ok(kOpLog));
    auto res = run("op", {"log"});
    ASSERT_TRUE(res.has_value());
    const std::string& text = res.value().text;
    EXPECT_NE(text.find("d3b77ad 3m ago squash"), std::string::npos);
    EXPECT_EQ(text.find("d3b77addea49"), std::string::npos);
    EXPECT_EQ(text.find("user@host"), std::string::npos);
}

// Test: new acknowledges with the new change id
TEST_F(CompactionEngineTest, NewScenario) {
    runner.reply("jj new --color=never",
                 ok("", "Working copy  (@) now at: puqltutt 3a4b5c6d (empty) (no description set)\n"
                        "Parent commit (@-)      : kntqzsqt d7439b06 wip\n"));
    auto res = run("new", {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().text, "ok \xE2\x9C\x93 puqltutt\n");
    EXPECT_EQ(res.value().diagnostics, "");
}

// Test: Failed rebase surfaces stderr untouched and mirrors the exit code
TEST_F(CompactionEngineTest, FailedRebaseScenario) {
    runner.reply("jj rebase --color=never -s kntqzsqt -d main", failed(1, kConflictStderr));
    auto res = run("rebase", {"-s", "kntqzsqt", "-d", "main"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().diagnostics, std::string("FAILED: rebase\n") + kConflictStderr);
    EXPECT_EQ(res.value().exitCode, 1);
    EXPECT_EQ(res.value().text, "");
}

// Test: Read-path failures keep stdout and stderr byte for byte
TEST_F(CompactionEngineTest, FailedReadKeepsOutput) {
    runner.reply("jj log --color=never -r bogus", failed(2, "Error: Revision \"bogus\" doesn't exist\n", "partial\n"));
    auto res = run("log", {"-r", "bogus"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().text, "partial\n");
    EXPECT_EQ(res.value().diagnostics, "FAILED: log\nError: Revision \"bogus\" doesn't exist\n");
    EXPECT_EQ(res.value().exitCode, 2);
}

// Test: An unavailable exit code is reported as 1
TEST_F(CompactionEngineTest, UnknownExitStatusDefaultsToOne) {
    CompactionEngine engine(runner, "jj", config);
    Route route = Classifier::classify("new", {});
    auto result = engine.compact(route, Invocation{"new", {}}, failed(-1, "killed\n"));
    EXPECT_EQ(result.exitCode, 1);
}

// Test: Mostly unrecognized output falls back to raw text
TEST_F(CompactionEngineTest, UnparsedRatioDegradesToRaw) {
    std::string raw = "Something new\nthat this version\ndoes not know\n"
                      "@  kntqzsqt jane@example.com 2023-02-12 14:56:59 d7439b06\n";
    runner.reply("jj log --color=never", ok(raw, "warning text\n"));
    auto res = run("log", {});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().degradedToRaw);
    EXPECT_EQ(res.value().text, raw);
    EXPECT_EQ(res.value().diagnostics, "warning text\n");
    EXPECT_EQ(res.value().exitCode, 0);
}

// Test: Op ids cut to an ambiguous prefix fall back to raw text
TEST_F(CompactionEngineTest, GuardSeesAmbiguousPrefixes) {
    config.shortOpIdLength = 4;
    std::string opLog =
        "@  d3b77addea49 user@host 3 minutes ago, lasted 3 milliseconds\n"
        "│  first\n"
        "○  d3b7ffeeaa11 user@host 4 minutes ago, lasted 3 milliseconds\n"
        "│  second\n";
    runner.reply("jj op --color=never log", ok(opLog));
    auto res = run("op", {"log"});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().degradedToRaw);
    EXPECT_EQ(res.value().text, opLog);
}

// Test: Log output never carries author emails
TEST_F(CompactionEngineTest, Redaction) {
    runner.reply("jj log --color=never", ok(sevenEntryLog()));
    auto res = run("log", {});
    ASSERT_TRUE(res.has_value());
    for (const auto& word : TextUtil::splitWhitespace(res.value().text)) {
        EXPECT_FALSE(TextUtil::isEmailLike(word)) << word;
    }
}

// Test: Same input, same output
TEST_F(CompactionEngineTest, Idempotent) {
    runner.reply("jj status --color=never", ok(kCleanStatus));
    auto a = run("status", {});
    auto b = run("status", {});
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a.value().text, b.value().text);
}

// Test: Passthrough runs attached and mirrors the exit code
TEST_F(CompactionEngineTest, PassthroughRunsInteractive) {
    runner.replyInteractive("jj log -T builtin_log_oneline", 3);
    auto res = run("log", {"-T", "builtin_log_oneline"});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().passthrough);
    EXPECT_EQ(res.value().exitCode, 3);
    EXPECT_TRUE(runner.captured.empty());
    ASSERT_EQ(runner.interactiveRuns.size(), 1u);
}

// Test: Unknown commands pass through with their arguments untouched
TEST_F(CompactionEngineTest, UnknownCommandPassthrough) {
    auto res = run("workspace", {"add", "--name", "x", "../x"});
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(runner.interactiveRuns.size(), 1u);
    EXPECT_EQ(joinArgv(runner.interactiveRuns[0]), "jj workspace add --name x ../x");
}

// Test: Captured runs get --color=never, and --git for diff/show
TEST_F(CompactionEngineTest, BuildArgv) {
    CompactionEngine engine(runner, "/opt/jj", config);
    Invocation diff{"diff", {"-r", "@-", "--", "src/a.rs"}};
    auto argv = engine.buildArgv(Classifier::classify(diff.command, diff.args), diff);
    EXPECT_EQ(joinArgv(argv), "/opt/jj diff --git --color=never -r @- -- src/a.rs");

    Invocation gitDiff{"diff", {"--git"}};
    EXPECT_EQ(joinArgv(engine.buildArgv(Classifier::classify("diff", gitDiff.args), gitDiff)),
              "/opt/jj diff --color=never --git");

    Invocation status{"status", {}};
    EXPECT_EQ(joinArgv(engine.buildArgv(Classifier::classify("status", {}), status)), "/opt/jj status --color=never");
}

// Test: Spawn failure is an error, not a result
TEST_F(CompactionEngineTest, SpawnFailure) {
    runner.failSpawn();
    auto res = run("status", {});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SpawnFailed);
}

// Test: Successful filtered runs forward jj's stderr
TEST_F(CompactionEngineTest, ForwardsStderrOnSuccess) {
    runner.reply("jj status --color=never", ok(kCleanStatus, "Warning: stale working copy\n"));
    auto res = run("status", {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().diagnostics, "Warning: stale working copy\n");
}
