#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/FidelityGuard.hpp"

using namespace vcstrim;

namespace {

GuardSource source(const std::string& ids, std::vector<std::string> names = {}) {
    GuardSource s;
    s.rawIds = ids;
    s.names = std::move(names);
    return s;
}

}

// Test: Identifier scan picks change ids, hashes and names, ignores the rest
TEST(FidelityGuardTest, ScanIdentifiers) {
    auto tokens = FidelityGuard::scanIdentifiers(
        source("kntqzsqt jane@example.com 2024-02-28 14:56:59 main d7439b06", {"main"}));
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, IdentifierKind::ChangeId);
    EXPECT_EQ(tokens[0].text, "kntqzsqt");
    EXPECT_EQ(tokens[1].kind, IdentifierKind::Hash);
    EXPECT_EQ(tokens[1].text, "d7439b06");
    EXPECT_EQ(tokens[2].kind, IdentifierKind::Name);
}

// Test: Words split on identifier-adjacent punctuation
TEST(FidelityGuardTest, Words) {
    auto w = FidelityGuard::words("@ kntqzsqt d7439b06 (empty) main: x|y");
    std::vector<std::string> expected = {"@", "kntqzsqt", "d7439b06", "empty", "main", "x", "y"};
    EXPECT_EQ(w, expected);
}

// Test: Exact identifiers pass
TEST(FidelityGuardTest, ExactTokensPass) {
    FilterConfig cfg;
    auto report = FidelityGuard::check({source("kntqzsqt d7439b06")}, "@ kntqzsqt d7439b06 (empty)", cfg);
    EXPECT_TRUE(report.ok);
    EXPECT_TRUE(report.missing.empty());
}

// Test: A dropped identifier fails and is reported
TEST(FidelityGuardTest, MissingTokenFails) {
    FilterConfig cfg;
    auto report = FidelityGuard::check({source("kntqzsqt d7439b06"), source("orrkosyo 7fd1a60b")},
                                       "@ kntqzsqt d7439b06", cfg);
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.missing.size(), 2u);
    EXPECT_EQ(report.missing[0], "orrkosyo");
    EXPECT_EQ(report.missing[1], "7fd1a60b");
}

// Test: An unambiguous prefix of sufficient length counts as preserved
TEST(FidelityGuardTest, UnambiguousPrefixPasses) {
    FilterConfig cfg;
    auto report = FidelityGuard::check({source("d3b77addea49")}, "d3b77ad 3m ago", cfg);
    EXPECT_TRUE(report.ok);

    // Shorter than the minimum prefix
    auto tooShort = FidelityGuard::check({source("d3b77addea49")}, "d3b 3m ago", cfg);
    EXPECT_FALSE(tooShort.ok);
}

// Test: A prefix shared by two collected tokens is ambiguous
TEST(FidelityGuardTest, AmbiguousPrefixFails) {
    FilterConfig cfg;
    auto report = FidelityGuard::check({source("d3b77addea49"), source("d3b77ad0ffee")},
                                       "d3b77ad one\nd3b77ad0ffee two", cfg);
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.missing.size(), 1u);
    EXPECT_EQ(report.missing[0], "d3b77addea49");
}

// Test: The commit hash may be dropped when the entry's change id is kept
TEST(FidelityGuardTest, HashCoveredByChangeId) {
    FilterConfig cfg;
    auto report = FidelityGuard::check({source("orrkosyo 7fd1a60b", {"master"})}, "@- orrkosyo master", cfg);
    EXPECT_TRUE(report.ok);
}

// Test: Bookmark names must appear in full
TEST(FidelityGuardTest, NamesMustAppear) {
    FilterConfig cfg;
    auto report = FidelityGuard::check({source("orrkosyo", {"feature/login"})}, "orrkosyo feature/log", cfg);
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.missing.front(), "feature/login");
}

// Test: No sources means nothing to check
TEST(FidelityGuardTest, EmptySources) {
    FilterConfig cfg;
    EXPECT_TRUE(FidelityGuard::check({}, "No commits", cfg).ok);
}
