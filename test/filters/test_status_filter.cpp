#include <gtest/gtest.h>
#include <string>
#include "filters/StatusFilter.hpp"
#include "util/TextUtil.hpp"

using namespace vcstrim;

namespace {

const char* const kClean = R"(The working copy has no changes.
Working copy  (@) : kntqzsqt d7439b06 (empty) (no description set)
Parent commit (@-): orrkosyo 7fd1a60b master | (empty) Merge pull request #6 from user/branch
)";

const char* const kChanged = R"(Working copy changes:
M src/main.rs
A new_file.rs
Working copy  (@) : kntqzsqt d7439b06 wip on parser
Parent commit (@-): orrkosyo 7fd1a60b master | (empty) Merge pull request #6 from user/branch
)";

const char* const kConflicted = R"(Working copy changes:
M src/lib.rs
C src/copy.rs
Warning: There are unresolved conflicts at these paths:
src/lib.rs    2-sided conflict
docs/a.md    3-sided conflict including 1 deletion
Working copy  (@) : kntqzsqt d7439b06 (conflict) merge attempt
Parent commit (@-): orrkosyo 7fd1a60b master | Merge
Parent commit (@-): ptwlsrzq 9a0b1c2d feature branch tip
)";

}

// Test: Clean working copy renders as the working-copy line and the parent line
TEST(StatusFilterTest, CleanWorkingCopy) {
    auto rec = StatusFilter::parse(kClean);
    EXPECT_FALSE(rec.hasChanges);
    ASSERT_TRUE(rec.workingCopy.has_value());
    EXPECT_TRUE(rec.workingCopy->isEmpty);
    ASSERT_EQ(rec.parents.size(), 1u);
    EXPECT_EQ(rec.parents[0].bookmarks.size(), 1u);

    FilterConfig cfg;
    auto out = StatusFilter::format(rec, cfg);
    EXPECT_EQ(out.text, "@ kntqzsqt d7439b06 (empty)\n@- orrkosyo master");
    EXPECT_EQ(out.text.find("no changes"), std::string::npos);
}

// Test: Filtering the same clean status twice gives identical output
TEST(StatusFilterTest, Idempotent) {
    FilterConfig cfg;
    auto first = StatusFilter::format(StatusFilter::parse(kClean), cfg);
    auto second = StatusFilter::format(StatusFilter::parse(kClean), cfg);
    EXPECT_EQ(first.text, second.text);
}

// Test: File changes sit between the working-copy line and the parent line
TEST(StatusFilterTest, ChangedFiles) {
    auto rec = StatusFilter::parse(kChanged);
    EXPECT_TRUE(rec.hasChanges);
    ASSERT_EQ(rec.fileChanges.size(), 2u);
    EXPECT_EQ(rec.workingCopy->description, "wip on parser");

    FilterConfig cfg;
    auto out = StatusFilter::format(rec, cfg);
    EXPECT_EQ(out.text, "@ kntqzsqt d7439b06\nM src/main.rs\nA new_file.rs\n@- orrkosyo master");
}

// Test: Conflicts render as a header plus one line per path; conflicted files use U
TEST(StatusFilterTest, Conflicts) {
    auto rec = StatusFilter::parse(kConflicted);
    ASSERT_EQ(rec.conflicts.size(), 2u);
    EXPECT_EQ(rec.conflicts[0].path, "src/lib.rs");
    EXPECT_EQ(rec.conflicts[0].sideCount, 2);
    EXPECT_EQ(rec.conflicts[1].sideCount, 3);
    EXPECT_EQ(rec.fileChanges[0].op, FileOp::Conflicted);
    EXPECT_EQ(rec.fileChanges[1].op, FileOp::Copied);
    EXPECT_TRUE(rec.workingCopy->isConflicted);
    ASSERT_EQ(rec.parents.size(), 2u);
    EXPECT_TRUE(rec.unparsed.empty());

    FilterConfig cfg;
    auto lines = TextUtil::splitLines(StatusFilter::format(rec, cfg).text);
    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[0], "@ kntqzsqt d7439b06 (conflict)");
    EXPECT_EQ(lines[1], "U src/lib.rs");
    EXPECT_EQ(lines[2], "C src/copy.rs");
    EXPECT_EQ(lines[3], "@- orrkosyo master");
    EXPECT_EQ(lines[4], "@- ptwlsrzq 9a0b1c2d");
    EXPECT_EQ(lines[5], "Conflicts: 2 files");
    EXPECT_EQ(lines[6], "  src/lib.rs (2-sided)");
    EXPECT_EQ(lines[7], "  docs/a.md (3-sided)");
}

// Test: Conflict list is capped while the header keeps the full count
TEST(StatusFilterTest, ConflictLimit) {
    std::string text = "There are unresolved conflicts at these paths:\n";
    for (int i = 0; i < 15; ++i) text += "f" + std::to_string(i) + ".rs    2-sided conflict\n";
    text += "Working copy  (@) : kntqzsqt d7439b06 (conflict) merge attempt\n";
    auto rec = StatusFilter::parse(text);
    ASSERT_EQ(rec.conflicts.size(), 15u);

    FilterConfig cfg;
    auto lines = TextUtil::splitLines(StatusFilter::format(rec, cfg).text);
    ASSERT_EQ(lines.size(), 13u);
    EXPECT_EQ(lines[1], "Conflicts: 15 files");
    EXPECT_EQ(lines[11], "  f9.rs (2-sided)");
    EXPECT_EQ(lines[12], "  \xE2\x80\xA6 5 more");
}

// Test: Verbose mode keeps the parent hash next to its bookmark
TEST(StatusFilterTest, VerboseParentHash) {
    FilterConfig cfg;
    cfg.verbose = true;
    auto out = StatusFilter::format(StatusFilter::parse(kClean), cfg);
    EXPECT_NE(out.text.find("@- orrkosyo 7fd1a60b master"), std::string::npos);
}

// Test: File list is capped with a marker
TEST(StatusFilterTest, FileLimit) {
    std::string text = "Working copy changes:\n";
    for (int i = 0; i < 13; ++i) text += "M file" + std::to_string(i) + ".txt\n";
    text += "Working copy  (@) : kntqzsqt d7439b06 edits\n";
    FilterConfig cfg;
    auto lines = TextUtil::splitLines(StatusFilter::format(StatusFilter::parse(text), cfg).text);
    ASSERT_EQ(lines.size(), 12u);
    EXPECT_EQ(lines[10], "M file9.txt");
    EXPECT_EQ(lines[11], "\xE2\x80\xA6 3 more");
}

// Test: Commit line parsing with and without the bookmark separator
TEST(StatusFilterTest, ParseCommitLine) {
    LogEntry e;
    ASSERT_TRUE(StatusFilter::parseCommitLine("Parent commit (@-): orrkosyo 7fd1a60b main dev | Fix bug", "@-", e));
    ASSERT_EQ(e.bookmarks.size(), 2u);
    EXPECT_EQ(e.description, "Fix bug");
    EXPECT_EQ(e.rawHeader, "orrkosyo 7fd1a60b main dev");

    LogEntry plain;
    ASSERT_TRUE(StatusFilter::parseCommitLine("Working copy  (@) : kntqzsqt d7439b06 Fix | pipes in text", "@", plain));
    EXPECT_EQ(plain.shortId, "kntqzsqt");

    LogEntry bad;
    EXPECT_FALSE(StatusFilter::parseCommitLine("Working copy (@): not an id line", "@", bad));
}

// Test: Unrecognized lines are echoed and counted
TEST(StatusFilterTest, UnparsedLines) {
    std::string text = std::string(kClean) + "Something jj added in a later release\n";
    auto rec = StatusFilter::parse(text);
    ASSERT_EQ(rec.unparsed.size(), 1u);
    EXPECT_GT(StatusFilter::unparsedRatio(rec), 0.0);
    EXPECT_LT(StatusFilter::unparsedRatio(rec), 0.30);
    FilterConfig cfg;
    EXPECT_NE(StatusFilter::format(rec, cfg).text.find("Something jj added"), std::string::npos);
}
