#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vcstrim {

/**
 * @brief Raw text an entry's identifiers were read from
 *
 * Filled by the parsers and handed to the FidelityGuard for every entry
 * the formatter actually rendered. `names` carries tokens the guard cannot
 * recognize lexically (bookmark names).
 */
struct GuardSource {
    std::string rawIds;
    std::vector<std::string> names;
};

/**
 * @brief One change as printed by `jj log` / `jj status` / `jj show`
 *
 * Log header layout:
 *   <glyph>  <change id> [<email>] [<date> <time>] [<bookmarks>...] <commit hash> [markers]
 *   │  <description | (empty) | (no description set)>
 */
struct LogEntry {
    std::string glyph;                  // node glyph ("@", "○", "◆", ...)
    std::string shortId;                // change id as printed
    std::string commitHash;             // commit hash as printed
    std::optional<std::string> fullId;  // full change id, `jj show` only
    std::optional<std::string> author;  // email or name; never rendered by default
    std::optional<std::string> timestamp;
    std::vector<std::string> bookmarks;
    std::vector<std::string> markers;   // divergent, hidden, ...
    std::string description;            // first description line, raw
    bool isEmpty{false};
    bool isConflicted{false};
    std::string rawHeader;
};

enum class FileOp { Modified, Added, Deleted, Renamed, Copied, Conflicted };

struct FileChange {
    FileOp op{FileOp::Modified};
    std::string path;
};

struct Conflict {
    std::string path;
    int sideCount{2};
};

/**
 * @brief Parsed `jj status`
 *
 * A conflicted path may appear in both fileChanges (op Conflicted) and
 * conflicts (with its side count).
 */
struct StatusRecord {
    std::optional<LogEntry> workingCopy;
    std::vector<LogEntry> parents;      // more than one for merges
    std::vector<FileChange> fileChanges;
    std::vector<Conflict> conflicts;
    bool hasChanges{false};
    std::vector<std::string> unparsed;
    size_t recognizedLines{0};
};

struct DiffStat {
    int added{0};
    int removed{0};
};

/**
 * @brief One file section of a unified (--git) diff
 *
 * `lines` holds the raw body: "@@" headers, +/-/context lines and
 * "Binary files ..." notes, in upstream order.
 */
struct DiffHunk {
    std::string filePath;
    DiffStat stat;
    std::vector<std::string> lines;
    bool truncated{false};
};

struct DiffRecord {
    std::vector<DiffHunk> files;
    std::vector<std::string> unparsed;
    size_t recognizedLines{0};
    size_t omittedLines{0};     // changed lines dropped by the total cap
};

struct ShowRecord {
    LogEntry commit;
    bool hasCommit{false};
    std::vector<std::string> descriptionLines;
    DiffRecord diff;
};

struct OpLogEntry {
    std::string glyph;
    std::string fullOpId;
    std::string relativeTime;
    std::string summary;
    std::optional<std::string> args;
    std::string rawHeader;
};

struct RemoteRef {
    std::string remote;     // "origin"
    std::string state;      // "ahead by 1 commits", "behind by 2 commits" or empty
    std::string changeId;   // remote target, empty for "@origin (deleted)"
    std::string commitHash;
    bool deleted{false};
};

struct BookmarkEntry {
    std::string name;
    std::string changeId;
    std::string commitHash;
    std::vector<RemoteRef> remotes;
    std::vector<std::string> conflictTargets;  // "+ <id> <hash>" lines of a conflicted bookmark
    bool deleted{false};
    bool conflicted{false};
    std::string rawHeader;
};

/**
 * @brief Parser output for line-oriented listings
 *
 * Keeps upstream order; a line the parser could not make sense of is kept
 * verbatim in `raw` so the formatter can echo it in place. An unparsed
 * line standing where an entry header belongs has `startsEntry` set and
 * counts against the entry limit like a parsed entry.
 */
template <typename T>
struct ParsedItem {
    bool parsed{false};
    bool startsEntry{false};
    T entry{};
    std::string raw;
};

template <typename T>
struct ParseResult {
    std::vector<ParsedItem<T>> items;

    size_t entryCount() const {
        size_t n = 0;
        for (const auto& item : items) {
            if (item.parsed) ++n;
        }
        return n;
    }

    size_t unparsedCount() const { return items.size() - entryCount(); }

    double unparsedRatio() const {
        return items.empty() ? 0.0 : static_cast<double>(unparsedCount()) / static_cast<double>(items.size());
    }
};

/**
 * @brief Formatter output: compact text plus the identifier sources of
 * every entry that made it into the text
 */
struct Rendering {
    std::string text;
    std::vector<GuardSource> sources;
};

/**
 * @brief What the harness hands back to the CLI for one invocation
 *
 * `text` goes to stdout and `diagnostics` to stderr, both verbatim.
 * `passthrough` means the child already wrote to the terminal itself.
 */
struct CompactResult {
    std::string text;
    std::string diagnostics;
    int exitCode{0};
    bool degradedToRaw{false};
    bool passthrough{false};
};

}
