#pragma once

#include <string>
#include <vector>

namespace vcstrim {

/**
 * @brief String helpers shared by the parsers and formatters
 *
 * jj output mixes ASCII with UTF-8 graph glyphs (│ ○ ◆ …), so anything
 * that counts or cuts characters works on code points, not bytes.
 */
namespace TextUtil {

/// Split text into lines; strips "\r\n" endings, drops the empty tail after a final newline
std::vector<std::string> splitLines(const std::string& text);

std::string trim(const std::string& s);
std::string trimLeft(const std::string& s);
std::vector<std::string> splitWhitespace(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);

/// Byte length of the UTF-8 sequence starting with lead byte `c` (1 for invalid leads)
size_t codePointLength(unsigned char c);

/// Code point at byte offset `pos`, or "" past the end
std::string codePointAt(const std::string& s, size_t pos);

/// Number of code points in `s`
size_t charCount(const std::string& s);

/**
 * @brief Cut `s` to at most `maxChars` code points
 *
 * When cut, the last kept position is replaced by "…" so the result is
 * still at most `maxChars` long. maxChars == 0 disables the cap.
 */
std::string truncateChars(const std::string& s, size_t maxChars);

/// Lowercase hex token of at least minLen chars (commit hashes, operation ids)
bool isHexToken(const std::string& s, size_t minLen);

/// Token in jj's reverse-hex change id alphabet k..z, at least minLen chars
bool isChangeIdToken(const std::string& s, size_t minLen);

/// Plain alphanumeric token (change ids of foreign backends, short prefixes)
bool isAlnumToken(const std::string& s);

/// local@domain.tld, optionally wrapped in <...>
bool isEmailLike(const std::string& s);

/// YYYY-MM-DD
bool isDateToken(const std::string& s);

/// HH:MM or HH:MM:SS with optional fractional seconds
bool isTimeToken(const std::string& s);

/// +HH:MM / -HH:MM timezone offsets
bool isZoneToken(const std::string& s);

/// Remove email-like words; spacing is collapsed only when something was removed
std::string redactEmails(const std::string& s);

/// Strict non-negative integer parse; false on any trailing garbage
bool parseCount(const std::string& s, size_t& out);

}  // namespace TextUtil

}  // namespace vcstrim
