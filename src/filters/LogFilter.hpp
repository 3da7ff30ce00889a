#pragma once

#include <string>

#include "core/FilterConfig.hpp"
#include "core/Records.hpp"

namespace vcstrim {

/**
 * @brief `jj log` compaction
 *
 * Input (default template):
 *   @  mpqrykyp user@email.com 2023-02-12 15:00:22 aef4df99
 *   │  (empty) (no description set)
 *   ○  kntqzsqt user@email.com 2023-02-12 14:56:59 main 5d39e19d
 *   │  Say goodbye
 *
 * Output:
 *   @ mpqrykyp aef4df99 (empty)
 *   ○ kntqzsqt 5d39e19d main Say goodbye
 */
namespace LogFilter {

ParseResult<LogEntry> parse(const std::string& text);

/**
 * @brief Parse the text after the node glyph of a header line
 * @return false when no change id / commit hash pair can be found
 */
bool parseHeader(const std::string& glyph, const std::string& content, LogEntry& out);

/// Apply a description line: "(empty)", "(no description set)", "(conflict)" flags and text
void applyDescription(const std::string& content, LogEntry& entry);

/// Single compact line for one entry (shared with status/show)
std::string formatEntry(const LogEntry& entry, const FilterConfig& config);

Rendering format(const ParseResult<LogEntry>& parsed, const FilterConfig& config);

}  // namespace LogFilter

}  // namespace vcstrim
