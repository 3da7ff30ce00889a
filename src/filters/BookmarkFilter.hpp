#pragma once

#include <string>

#include "core/FilterConfig.hpp"
#include "core/Records.hpp"

namespace vcstrim {

/**
 * @brief `jj bookmark list` compaction
 *
 * Input:
 *   main: orrkosyo 7fd1a60b (empty) Merge pull request #6
 *     @origin: orrkosyo 7fd1a60b (empty) Merge pull request #6
 *   feature: kmtpwvqq 3e1d4c2a Add feature
 *     @origin (behind by 1 commits): ptwlsrzq 9a0b1c2d Older feature
 *
 * Output:
 *   main: orrkosyo 7fd1a60b (tracked @origin)
 *   feature: kmtpwvqq 3e1d4c2a (tracked @origin behind by 1 commits: ptwlsrzq)
 *
 * A remote target is named only when it differs from the local one.
 */
namespace BookmarkFilter {

ParseResult<BookmarkEntry> parse(const std::string& text);

Rendering format(const ParseResult<BookmarkEntry>& parsed, const FilterConfig& config);

}  // namespace BookmarkFilter

}  // namespace vcstrim
