#include "filters/BookmarkFilter.hpp"

#include <utility>
#include <vector>

#include "core/Constants.hpp"
#include "filters/Truncation.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {
namespace BookmarkFilter {

namespace {

// "<change> <hash> ..." -> (change, hash)
bool parseTarget(const std::string& text, std::string& changeId, std::string& commitHash) {
    auto words = TextUtil::splitWhitespace(text);
    if (words.size() < 2) return false;
    if (!TextUtil::isAlnumToken(words[0]) || !TextUtil::isHexToken(words[1], Constants::MIN_HASH_LENGTH)) return false;
    changeId = words[0];
    commitHash = words[1];
    return true;
}

// "  @origin (ahead by 1 commits): ..." / "  @origin: ..." / "  @git (deleted)"
bool parseRemote(const std::string& trimmed, RemoteRef& out) {
    if (trimmed.size() < 2 || trimmed[0] != '@') return false;
    size_t end = 1;
    while (end < trimmed.size() && trimmed[end] != ':' && trimmed[end] != ' ') ++end;
    out.remote = trimmed.substr(1, end - 1);
    if (out.remote.empty()) return false;
    size_t open = trimmed.find('(', end);
    size_t colon = trimmed.find(':', end);
    if (colon != std::string::npos) parseTarget(trimmed.substr(colon + 1), out.changeId, out.commitHash);
    if (open != std::string::npos && (colon == std::string::npos || open < colon)) {
        size_t close = trimmed.find(')', open);
        if (close != std::string::npos) {
            std::string state = trimmed.substr(open + 1, close - open - 1);
            if (state == "deleted") {
                out.deleted = true;
            } else {
                out.state = state;
            }
        }
    }
    return true;
}

std::string renderRemotes(const BookmarkEntry& entry) {
    std::vector<std::string> parts;
    for (const auto& r : entry.remotes) {
        if (r.remote == "git") continue;  // colocated repos mirror every bookmark to @git
        std::string part = "@" + r.remote;
        if (r.deleted) part += " deleted";
        if (!r.state.empty()) part += " " + r.state;
        // Name the remote target only where it differs from the local one
        if (!r.changeId.empty() && r.changeId != entry.changeId) {
            part += ": " + r.changeId;
        } else if (!r.commitHash.empty() && r.commitHash != entry.commitHash) {
            part += ": " + r.commitHash;
        }
        parts.push_back(part);
    }
    if (parts.empty()) return "";
    return " (tracked " + TextUtil::join(parts, ", ") + ")";
}

}

ParseResult<BookmarkEntry> parse(const std::string& text) {
    ParseResult<BookmarkEntry> result;
    bool haveCurrent = false;
    size_t currentIdx = 0;

    for (const auto& line : TextUtil::splitLines(text)) {
        std::string trimmed = TextUtil::trim(line);
        if (trimmed.empty()) continue;
        bool indented = line[0] == ' ' || line[0] == '\t';

        if (indented && haveCurrent) {
            BookmarkEntry& current = result.items[currentIdx].entry;
            RemoteRef remote;
            if (parseRemote(trimmed, remote)) {
                if (!remote.changeId.empty()) current.rawHeader += " " + remote.changeId + " " + remote.commitHash;
                current.remotes.push_back(std::move(remote));
                continue;
            }
            // "(this bookmark will be *deleted permanently* ...)" hints
            if (trimmed[0] == '(') continue;
            if (current.conflicted && (trimmed[0] == '+' || trimmed[0] == '-')) {
                std::string changeId;
                std::string hash;
                if (parseTarget(trimmed.substr(1), changeId, hash)) {
                    current.conflictTargets.push_back(std::string(1, trimmed[0]) + " " + changeId + " " + hash);
                    current.rawHeader += " " + changeId + " " + hash;
                    continue;
                }
            }
        }

        ParsedItem<BookmarkEntry> item;
        item.raw = line;
        item.startsEntry = !indented;
        if (!indented) {
            BookmarkEntry& e = item.entry;
            if (TextUtil::endsWith(trimmed, " (deleted)")) {
                e.name = trimmed.substr(0, trimmed.size() - 10);
                e.deleted = true;
                e.rawHeader = e.name;
                item.parsed = true;
            } else if (TextUtil::endsWith(trimmed, " (conflicted):")) {
                e.name = trimmed.substr(0, trimmed.size() - 14);
                e.conflicted = true;
                e.rawHeader = e.name;
                item.parsed = true;
            } else {
                size_t colon = trimmed.find(": ");
                if (colon != std::string::npos && colon > 0 &&
                    parseTarget(trimmed.substr(colon + 2), e.changeId, e.commitHash)) {
                    e.name = trimmed.substr(0, colon);
                    e.rawHeader = e.name + ": " + e.changeId + " " + e.commitHash;
                    item.parsed = true;
                }
            }
        }
        if (item.parsed) {
            haveCurrent = true;
            currentIdx = result.items.size();
        } else if (!indented) {
            haveCurrent = false;
        }
        result.items.push_back(std::move(item));
    }
    return result;
}

Rendering format(const ParseResult<BookmarkEntry>& parsed, const FilterConfig& config) {
    Rendering out;
    std::vector<std::string> lines;

    size_t omitted = renderLimited(parsed, config.bookmarkLimit, lines, [&](const BookmarkEntry& e) {
        if (e.conflicted) {
            lines.push_back(e.name + " (conflicted)");
            for (const auto& target : e.conflictTargets) lines.push_back("  " + target);
        } else if (e.deleted) {
            lines.push_back(e.name + " (deleted)" + renderRemotes(e));
        } else {
            lines.push_back(e.name + ": " + e.changeId + " " + e.commitHash + renderRemotes(e));
        }
        out.sources.push_back(GuardSource{e.rawHeader, {e.name}});
    });
    if (omitted > 0) lines.push_back(moreMarker(omitted));
    if (lines.empty()) lines.push_back("No bookmarks");

    out.text = TextUtil::join(lines, "\n");
    return out;
}

}  // namespace BookmarkFilter
}  // namespace vcstrim
