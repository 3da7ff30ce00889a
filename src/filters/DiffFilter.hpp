#pragma once

#include <string>

#include "core/FilterConfig.hpp"
#include "core/Records.hpp"

namespace vcstrim {

/**
 * @brief `jj diff --git` / `jj show --git` compaction
 *
 * Output: a stat block first ("path | +added -removed"), then each file's
 * "@@" headers with changed lines only. Context lines are dropped, hunks
 * are cut at hunkLineLimit changed lines and the whole body at
 * diffLineLimit; every cut leaves a "… N more lines" marker.
 */
namespace DiffFilter {

/// Parse a unified diff body; lines outside any "diff --git" section are kept as unparsed
DiffRecord parse(const std::string& text);

/**
 * @brief Parse `jj show --git`: commit header block followed by the diff
 *
 *   Commit ID: 5d39e19d...
 *   Change ID: kntqzsqt...
 *   Bookmarks: main
 *   Author   : Jane Doe <jane@example.com> (2023-02-12 14:56:59)
 *   Committer: Jane Doe <jane@example.com> (2023-02-12 14:56:59)
 *
 *       Say goodbye
 */
ShowRecord parseShow(const std::string& text, const FilterConfig& config);

double unparsedRatio(const DiffRecord& record);

/**
 * @brief Cut each file's lines down to "@@" headers, notes and changed lines
 * within the per-hunk and total caps, inserting "… N more lines" markers
 * and setting DiffHunk::truncated where anything was cut
 */
void applyCaps(DiffRecord& record, const FilterConfig& config);
double unparsedRatio(const ShowRecord& record);

/// Stat block plus capped hunks
Rendering format(const DiffRecord& record, const FilterConfig& config);

/// One-line commit summary followed by format() of the diff
Rendering formatShow(const ShowRecord& record, const FilterConfig& config);

}  // namespace DiffFilter

}  // namespace vcstrim
