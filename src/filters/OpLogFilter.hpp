#pragma once

#include <string>

#include "core/FilterConfig.hpp"
#include "core/Records.hpp"

namespace vcstrim {

/**
 * @brief `jj op log` compaction
 *
 * Input:
 *   @  d3b77addea49 user@host 3 minutes ago, lasted 3 milliseconds
 *   │  squash commits into f7fb5943a6b9460eb106dba2fac5cac1625c6f7a
 *   │  args: jj squash
 *
 * Output:
 *   @ d3b77ad 3m ago squash commits into f7fb5943a…
 */
namespace OpLogFilter {

ParseResult<OpLogEntry> parse(const std::string& text);

/**
 * @brief Shorten the relative time of a header line
 *
 * "user@host 3 minutes ago, lasted 3 milliseconds" -> "3m ago";
 * "less than a minute ago" -> "now"; absolute stamps keep date and HH:MM.
 * Empty when the line carries no time at all.
 */
std::string extractRelativeTime(const std::string& header);

Rendering format(const ParseResult<OpLogEntry>& parsed, const FilterConfig& config);

}  // namespace OpLogFilter

}  // namespace vcstrim
