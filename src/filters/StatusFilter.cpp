#include "filters/StatusFilter.hpp"

#include <unordered_set>
#include <vector>

#include "core/Constants.hpp"
#include "filters/LogFilter.hpp"
#include "filters/Truncation.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {
namespace StatusFilter {

namespace {

bool parseFileChange(const std::string& line, FileChange& out) {
    if (line.size() < 3 || line[1] != ' ') return false;
    switch (line[0]) {
        case 'M': out.op = FileOp::Modified; break;
        case 'A': out.op = FileOp::Added; break;
        case 'D': out.op = FileOp::Deleted; break;
        case 'R': out.op = FileOp::Renamed; break;
        case 'C': out.op = FileOp::Copied; break;
        default: return false;
    }
    out.path = TextUtil::trim(line.substr(2));
    return !out.path.empty();
}

// "src/file.rs    2-sided conflict including 1 deletion"
bool parseConflict(const std::string& line, Conflict& out) {
    size_t pos = line.find("-sided conflict");
    if (pos == std::string::npos) return false;
    size_t numEnd = pos;
    size_t numBegin = numEnd;
    while (numBegin > 0 && line[numBegin - 1] >= '0' && line[numBegin - 1] <= '9') --numBegin;
    size_t sides = 0;
    if (numBegin == numEnd || !TextUtil::parseCount(line.substr(numBegin, numEnd - numBegin), sides)) return false;
    std::string path = TextUtil::trim(line.substr(0, numBegin));
    if (path.empty()) return false;
    out.path = path;
    out.sideCount = static_cast<int>(sides);
    return true;
}

bool isNoise(const std::string& trimmed) {
    return TextUtil::startsWith(trimmed, "The working copy has no changes") ||
           TextUtil::startsWith(trimmed, "The working copy is clean") ||
           TextUtil::startsWith(trimmed, "Hint:") ||
           TextUtil::startsWith(trimmed, "Rebased ") ||
           TextUtil::startsWith(trimmed, "Working copy changes:") ||
           TextUtil::startsWith(trimmed, "Untracked paths:");
}

}

bool parseCommitLine(const std::string& line, const std::string& glyph, LogEntry& out) {
    size_t close = line.find(')');
    if (close == std::string::npos) return false;
    size_t colon = line.find(':', close);
    if (colon == std::string::npos) return false;
    std::string rest = TextUtil::trim(line.substr(colon + 1));

    std::string idPart = rest;
    std::string descPart;
    size_t pipe = rest.find(" | ");
    bool hasPipe = pipe != std::string::npos;
    if (hasPipe) {
        idPart = rest.substr(0, pipe);
        descPart = rest.substr(pipe + 3);
    }

    auto tokens = TextUtil::splitWhitespace(idPart);
    if (tokens.size() < 2) return false;
    if (!TextUtil::isAlnumToken(tokens[0]) || !TextUtil::isHexToken(tokens[1], Constants::MIN_HASH_LENGTH)) {
        return false;
    }

    LogEntry entry;
    entry.glyph = glyph;
    entry.shortId = tokens[0];
    entry.commitHash = tokens[1];
    if (hasPipe) {
        // "<id> <hash> <bookmark>... | <description>"
        for (size_t i = 2; i < tokens.size(); ++i) entry.bookmarks.push_back(tokens[i]);
    } else {
        // "<id> <hash> <description>": everything after the hash is description
        size_t hashPos = idPart.find(tokens[1]);
        descPart = idPart.substr(hashPos + tokens[1].size());
    }
    LogFilter::applyDescription(descPart, entry);

    std::vector<std::string> ids = {entry.shortId, entry.commitHash};
    ids.insert(ids.end(), entry.bookmarks.begin(), entry.bookmarks.end());
    entry.rawHeader = TextUtil::join(ids, " ");

    out = std::move(entry);
    return true;
}

StatusRecord parse(const std::string& text) {
    StatusRecord rec;
    bool inConflicts = false;

    for (const auto& line : TextUtil::splitLines(text)) {
        std::string trimmed = TextUtil::trim(line);
        if (trimmed.empty()) continue;

        if (trimmed.find("unresolved conflicts at these paths") != std::string::npos) {
            inConflicts = true;
            ++rec.recognizedLines;
            continue;
        }
        if (TextUtil::startsWith(trimmed, "Working copy") && trimmed.find("(@)") != std::string::npos) {
            inConflicts = false;
            LogEntry wc;
            if (parseCommitLine(trimmed, "@", wc)) {
                rec.workingCopy = std::move(wc);
                ++rec.recognizedLines;
            } else {
                rec.unparsed.push_back(line);
            }
            continue;
        }
        if (TextUtil::startsWith(trimmed, "Parent commit")) {
            inConflicts = false;
            LogEntry parent;
            if (parseCommitLine(trimmed, "@-", parent)) {
                rec.parents.push_back(std::move(parent));
                ++rec.recognizedLines;
            } else {
                rec.unparsed.push_back(line);
            }
            continue;
        }
        if (inConflicts) {
            Conflict c;
            if (parseConflict(trimmed, c)) {
                rec.conflicts.push_back(std::move(c));
                ++rec.recognizedLines;
                continue;
            }
            inConflicts = false;
        }
        if (isNoise(trimmed)) {
            ++rec.recognizedLines;
            continue;
        }
        FileChange change;
        if (parseFileChange(trimmed, change)) {
            rec.fileChanges.push_back(std::move(change));
            ++rec.recognizedLines;
            continue;
        }
        if (TextUtil::startsWith(trimmed, "? ") && trimmed.size() > 2) {
            // Untracked paths carry no identifiers; count them as understood
            ++rec.recognizedLines;
            continue;
        }
        rec.unparsed.push_back(line);
    }

    std::unordered_set<std::string> conflicted;
    for (const auto& c : rec.conflicts) conflicted.insert(c.path);
    for (auto& change : rec.fileChanges) {
        if (conflicted.count(change.path)) change.op = FileOp::Conflicted;
    }
    rec.hasChanges = !rec.fileChanges.empty();
    return rec;
}

char opLetter(FileOp op) {
    switch (op) {
        case FileOp::Modified: return 'M';
        case FileOp::Added: return 'A';
        case FileOp::Deleted: return 'D';
        case FileOp::Renamed: return 'R';
        case FileOp::Copied: return 'C';
        case FileOp::Conflicted: return 'U';
    }
    return '?';
}

double unparsedRatio(const StatusRecord& record) {
    size_t total = record.recognizedLines + record.unparsed.size();
    return total == 0 ? 0.0 : static_cast<double>(record.unparsed.size()) / static_cast<double>(total);
}

Rendering format(const StatusRecord& record, const FilterConfig& config) {
    Rendering out;
    std::vector<std::string> lines;

    if (record.workingCopy) {
        const LogEntry& wc = *record.workingCopy;
        std::vector<std::string> parts = {"@", wc.shortId, wc.commitHash};
        parts.insert(parts.end(), wc.bookmarks.begin(), wc.bookmarks.end());
        if (wc.isEmpty) parts.push_back("(empty)");
        if (wc.isConflicted) parts.push_back("(conflict)");
        lines.push_back(TextUtil::join(parts, " "));
        out.sources.push_back(GuardSource{wc.rawHeader, wc.bookmarks});
    }

    size_t shown = 0;
    for (const auto& change : record.fileChanges) {
        if (shown >= config.statusFileLimit) break;
        lines.push_back(std::string(1, opLetter(change.op)) + " " + change.path);
        ++shown;
    }
    if (record.fileChanges.size() > shown) lines.push_back(moreMarker(record.fileChanges.size() - shown));

    for (const auto& parent : record.parents) {
        std::vector<std::string> parts = {"@-", parent.shortId};
        // The change id resolves the commit; the hash is only repeated when nothing else names it
        if (config.verbose || parent.bookmarks.empty()) parts.push_back(parent.commitHash);
        parts.insert(parts.end(), parent.bookmarks.begin(), parent.bookmarks.end());
        if (parent.isConflicted) parts.push_back("(conflict)");
        lines.push_back(TextUtil::join(parts, " "));
        out.sources.push_back(GuardSource{parent.rawHeader, parent.bookmarks});
    }

    if (!record.conflicts.empty()) {
        lines.push_back("Conflicts: " + std::to_string(record.conflicts.size()) +
                        (record.conflicts.size() == 1 ? " file" : " files"));
        size_t listed = 0;
        for (const auto& c : record.conflicts) {
            if (listed >= config.statusFileLimit) break;
            lines.push_back("  " + c.path + " (" + std::to_string(c.sideCount) + "-sided)");
            ++listed;
        }
        if (record.conflicts.size() > listed) lines.push_back("  " + moreMarker(record.conflicts.size() - listed));
    }

    for (const auto& raw : record.unparsed) lines.push_back(raw);
    if (lines.empty()) lines.push_back("Clean working copy");

    out.text = TextUtil::join(lines, "\n");
    return out;
}

}  // namespace StatusFilter
}  // namespace vcstrim
