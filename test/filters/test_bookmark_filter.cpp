#include <gtest/gtest.h>
#include <string>
#include "core/FidelityGuard.hpp"
#include "filters/BookmarkFilter.hpp"
#include "util/TextUtil.hpp"

using namespace vcstrim;

namespace {

const char* const kBookmarks = R"(feature: kmtpwvqq 3e1d4c2a Add login
  @origin (behind by 1 commits): ptwlsrzq 9a0b1c2d Older feature
main: orrkosyo 7fd1a60b (empty) Merge pull request #6
  @git: orrkosyo 7fd1a60b (empty) Merge pull request #6
  @origin: orrkosyo 7fd1a60b (empty) Merge pull request #6
old-topic (deleted)
  @origin: zsuskuln 1f2e3d4c old topic
  (this bookmark will be *deleted permanently* on the remote on the next `jj git push`. Use `jj bookmark forget` to prevent this)
stale (conflicted):
  - qpvuntsm 230dd059 base
  + kkmpptxz 5e6f7a8b side one
  + zsuskuln 1f2e3d4c side two
upstream@origin: ptwlsrzq 9a0b1c2d untracked remote
)";

}

// Test: Local bookmarks, remotes, deleted and conflicted entries
TEST(BookmarkFilterTest, Parse) {
    auto parsed = BookmarkFilter::parse(kBookmarks);
    ASSERT_EQ(parsed.entryCount(), 5u);
    EXPECT_EQ(parsed.unparsedCount(), 0u);

    const BookmarkEntry& feature = parsed.items[0].entry;
    EXPECT_EQ(feature.name, "feature");
    EXPECT_EQ(feature.changeId, "kmtpwvqq");
    EXPECT_EQ(feature.commitHash, "3e1d4c2a");
    ASSERT_EQ(feature.remotes.size(), 1u);
    EXPECT_EQ(feature.remotes[0].remote, "origin");
    EXPECT_EQ(feature.remotes[0].state, "behind by 1 commits");
    EXPECT_EQ(feature.remotes[0].changeId, "ptwlsrzq");
    EXPECT_EQ(feature.remotes[0].commitHash, "9a0b1c2d");

    EXPECT_EQ(parsed.items[1].entry.remotes.size(), 2u);
    EXPECT_TRUE(parsed.items[2].entry.deleted);

    const BookmarkEntry& stale = parsed.items[3].entry;
    EXPECT_TRUE(stale.conflicted);
    EXPECT_EQ(stale.conflictTargets.size(), 3u);
}

// Test: Tracked remotes fold into the local line; @git is not shown
TEST(BookmarkFilterTest, Format) {
    FilterConfig cfg;
    auto out = BookmarkFilter::format(BookmarkFilter::parse(kBookmarks), cfg);
    auto lines = TextUtil::splitLines(out.text);
    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[0], "feature: kmtpwvqq 3e1d4c2a (tracked @origin behind by 1 commits: ptwlsrzq)");
    EXPECT_EQ(lines[1], "main: orrkosyo 7fd1a60b (tracked @origin)");
    EXPECT_EQ(lines[2], "old-topic (deleted) (tracked @origin: zsuskuln)");
    EXPECT_EQ(lines[3], "stale (conflicted)");
    EXPECT_EQ(lines[4], "  - qpvuntsm 230dd059");
    EXPECT_EQ(lines[7], "upstream@origin: ptwlsrzq 9a0b1c2d");
    EXPECT_EQ(out.text.find("Merge pull request"), std::string::npos);
    EXPECT_EQ(out.sources.size(), 5u);
}

// Test: Bookmark limit and marker
TEST(BookmarkFilterTest, Limit) {
    FilterConfig cfg;
    cfg.bookmarkLimit = 2;
    auto lines = TextUtil::splitLines(BookmarkFilter::format(BookmarkFilter::parse(kBookmarks), cfg).text);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "\xE2\x80\xA6 3 more");
}

// Test: Lines that fit no form are kept as unparsed
TEST(BookmarkFilterTest, Unparsed) {
    auto parsed = BookmarkFilter::parse("main: orrkosyo 7fd1a60b x\nHint: something new\n");
    EXPECT_EQ(parsed.entryCount(), 1u);
    EXPECT_EQ(parsed.unparsedCount(), 1u);
    FilterConfig cfg;
    EXPECT_NE(BookmarkFilter::format(parsed, cfg).text.find("Hint: something new"), std::string::npos);
}

// Test: No bookmarks
TEST(BookmarkFilterTest, Empty) {
    FilterConfig cfg;
    EXPECT_EQ(BookmarkFilter::format(BookmarkFilter::parse(""), cfg).text, "No bookmarks");
}

// Test: A remote behind the local bookmark keeps its own change id in view
TEST(BookmarkFilterTest, RemoteTargetIsKept) {
    const char* text =
        "main: kntqzsqt 5d39e19d Newer\n"
        "  @origin (behind by 1 commits): orrkosyo 7fd1a60b Older\n";
    FilterConfig cfg;
    auto parsed = BookmarkFilter::parse(text);
    auto out = BookmarkFilter::format(parsed, cfg);
    EXPECT_EQ(out.text, "main: kntqzsqt 5d39e19d (tracked @origin behind by 1 commits: orrkosyo)");

    ASSERT_EQ(out.sources.size(), 1u);
    EXPECT_NE(out.sources[0].rawIds.find("orrkosyo 7fd1a60b"), std::string::npos);
    EXPECT_TRUE(FidelityGuard::check(out.sources, out.text, cfg).ok);

    // Dropping the remote target must be visible to the guard
    EXPECT_FALSE(FidelityGuard::check(out.sources, "main: kntqzsqt 5d39e19d (tracked @origin)", cfg).ok);
}

// Test: Same change, rewritten commit: the remote hash is shown instead
TEST(BookmarkFilterTest, RemoteHashDiffers) {
    const char* text =
        "main: kntqzsqt 5d39e19d Newer\n"
        "  @origin (ahead by 1 commits): kntqzsqt 0a1b2c3d Older\n";
    FilterConfig cfg;
    auto out = BookmarkFilter::format(BookmarkFilter::parse(text), cfg);
    EXPECT_EQ(out.text, "main: kntqzsqt 5d39e19d (tracked @origin ahead by 1 commits: 0a1b2c3d)");
}

// Test: Unrecognized entries past the limit are counted, not printed
TEST(BookmarkFilterTest, UnparsedPastLimitIsCut) {
    std::string text;
    for (int i = 0; i < 4; ++i) {
        text += "b" + std::to_string(i) + ": kntqzsq" + std::string(1, static_cast<char>('k' + i)) + " 5d39e19" +
                std::to_string(i) + " work\n";
    }
    text += "weird entry by dev@example.com\n";
    text += "  continuation of the weird entry\n";
    FilterConfig cfg;
    cfg.bookmarkLimit = 3;
    auto out = BookmarkFilter::format(BookmarkFilter::parse(text), cfg);
    auto lines = TextUtil::splitLines(out.text);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[3], "\xE2\x80\xA6 2 more");
    EXPECT_EQ(out.text.find("dev@example.com"), std::string::npos);
    EXPECT_EQ(out.text.find("continuation"), std::string::npos);
}
