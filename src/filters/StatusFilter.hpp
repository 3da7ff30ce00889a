#pragma once

#include <string>

#include "core/FilterConfig.hpp"
#include "core/Records.hpp"

namespace vcstrim {

/**
 * @brief `jj status` compaction
 *
 * Input:
 *   Working copy changes:
 *   M src/main.rs
 *   A new_file.rs
 *   Working copy  (@) : kntqzsqt d7439b06 (empty) (no description set)
 *   Parent commit (@-): orrkosyo 7fd1a60b master | (empty) Merge pull request #6
 *
 * Output:
 *   @ kntqzsqt d7439b06 (empty)
 *   M src/main.rs
 *   A new_file.rs
 *   @- orrkosyo master
 */
namespace StatusFilter {

StatusRecord parse(const std::string& text);

/**
 * @brief Parse "Working copy  (@) : <id> <hash> [bookmarks |] <description>"
 * @return false when the id/hash pair is missing
 */
bool parseCommitLine(const std::string& line, const std::string& glyph, LogEntry& out);

/// Letter used in compact output: M A D R C U ?
char opLetter(FileOp op);

double unparsedRatio(const StatusRecord& record);

Rendering format(const StatusRecord& record, const FilterConfig& config);

}  // namespace StatusFilter

}  // namespace vcstrim
