#pragma once

#include <cstddef>

/**
 * @brief Default limits used when neither environment nor CLI override them
 *
 * Centralizes magic numbers so parsers and formatters agree on them.
 */
namespace vcstrim {

namespace Constants {
    // Entry-count limits
    constexpr size_t LOG_LIMIT = 5;               // jj log entries rendered
    constexpr size_t OP_LOG_LIMIT = 5;            // jj op log entries rendered
    constexpr size_t BOOKMARK_LIMIT = 10;         // local bookmarks rendered
    constexpr size_t STATUS_FILE_LIMIT = 10;      // file changes listed by status

    // Diff caps
    constexpr size_t HUNK_LINE_LIMIT = 10;        // changed lines kept per hunk
    constexpr size_t DIFF_LINE_LIMIT = 100;       // hunk lines kept across the whole diff

    // Text widths (code points)
    constexpr size_t MESSAGE_WIDTH = 60;          // log/show descriptions
    constexpr size_t OP_SUMMARY_WIDTH = 30;       // op log summaries

    // Identifier lengths
    constexpr size_t SHORT_OP_ID_LENGTH = 7;      // op ids are printed with 12 hex chars
    constexpr size_t SHORT_ID_LENGTH = 8;         // change ids / commit hashes from full forms
    constexpr size_t GUARD_MIN_PREFIX = 4;        // shortest prefix accepted as an identifier reference
    constexpr size_t MIN_HASH_LENGTH = 6;         // hex tokens shorter than this are not hashes

    // Fraction of unparsed lines that turns a compaction into a raw fallback
    constexpr double UNPARSED_RATIO = 0.30;
}
}
