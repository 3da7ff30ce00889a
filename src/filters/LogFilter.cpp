#include "filters/LogFilter.hpp"

#include <vector>

#include "core/Constants.hpp"
#include "filters/GraphLine.hpp"
#include "filters/Truncation.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {
namespace LogFilter {

namespace {

bool isParenthetical(const std::string& token) {
    return token.size() >= 2 && token.front() == '(' && token.back() == ')';
}

// Rejoin "(no email set)" style groups that whitespace splitting tore apart
std::vector<std::string> groupTokens(const std::vector<std::string>& words) {
    std::vector<std::string> out;
    for (size_t i = 0; i < words.size(); ++i) {
        std::string tok = words[i];
        if (tok.front() == '(' && tok.back() != ')') {
            size_t j = i + 1;
            while (j < words.size() && words[j].back() != ')') ++j;
            if (j < words.size()) {
                for (size_t k = i + 1; k <= j; ++k) tok += " " + words[k];
                i = j;
            }
        }
        out.push_back(tok);
    }
    return out;
}

// Divergent changes print as "kntqzsqt??" (older jj) or "kntqzsqt/0"
std::string stripDivergentSuffix(const std::string& id) {
    size_t slash = id.find('/');
    if (slash != std::string::npos && slash > 0) {
        size_t n = 0;
        if (TextUtil::parseCount(id.substr(slash + 1), n)) return id.substr(0, slash);
        return id;
    }
    size_t end = id.size();
    while (end > 0 && id[end - 1] == '?') --end;
    return id.substr(0, end);
}

bool isElision(const GraphLine& g) {
    return g.glyph == "~" && (g.content.empty() || g.content == "(elided revisions)");
}

}

bool parseHeader(const std::string& glyph, const std::string& content, LogEntry& out) {
    auto tokens = groupTokens(TextUtil::splitWhitespace(content));
    if (tokens.size() < 2) return false;

    const std::string& changeId = tokens[0];
    if (!TextUtil::isAlnumToken(stripDivergentSuffix(changeId))) return false;

    // Commit hash: last hex token after the change id; anything later is a marker
    size_t hashIdx = 0;
    for (size_t i = tokens.size(); i-- > 1;) {
        if (TextUtil::isHexToken(tokens[i], Constants::MIN_HASH_LENGTH)) {
            hashIdx = i;
            break;
        }
    }
    if (hashIdx == 0) return false;

    LogEntry entry;
    entry.glyph = glyph;
    entry.shortId = changeId;
    entry.commitHash = tokens[hashIdx];
    entry.isConflicted = glyph == "\xC3\x97";  // ×
    entry.rawHeader = content;

    std::vector<std::string> stamp;
    for (size_t i = 1; i < hashIdx; ++i) {
        const std::string& tok = tokens[i];
        if (TextUtil::isEmailLike(tok) || tok == "root()" || tok == "(no email set)") {
            entry.author = tok;
        } else if (TextUtil::isDateToken(tok) || TextUtil::isTimeToken(tok) || TextUtil::isZoneToken(tok)) {
            stamp.push_back(tok);
        } else if (isParenthetical(tok)) {
            entry.markers.push_back(tok);
        } else {
            entry.bookmarks.push_back(tok);
        }
    }
    if (!stamp.empty()) entry.timestamp = TextUtil::join(stamp, " ");

    for (size_t i = hashIdx + 1; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        if (tok == "conflict" || tok == "(conflict)") {
            entry.isConflicted = true;
        } else if (tok == "(empty)") {
            entry.isEmpty = true;
        } else {
            entry.markers.push_back(tok);
        }
    }

    out = std::move(entry);
    return true;
}

void applyDescription(const std::string& content, LogEntry& entry) {
    std::string rest = TextUtil::trim(content);
    for (;;) {
        if (TextUtil::startsWith(rest, "(empty)")) {
            entry.isEmpty = true;
            rest = TextUtil::trim(rest.substr(7));
        } else if (TextUtil::startsWith(rest, "(conflict)")) {
            entry.isConflicted = true;
            rest = TextUtil::trim(rest.substr(10));
        } else if (TextUtil::startsWith(rest, "(no description set)")) {
            rest = TextUtil::trim(rest.substr(20));
        } else {
            break;
        }
    }
    entry.description = rest;
}

ParseResult<LogEntry> parse(const std::string& text) {
    ParseResult<LogEntry> result;
    bool haveCurrent = false;
    bool descriptionSeen = false;

    for (const auto& line : TextUtil::splitLines(text)) {
        if (TextUtil::trim(line).empty()) continue;
        GraphLine g = splitGraphLine(line);

        if (!g.glyph.empty()) {
            if (isElision(g)) {
                // "~  (elided revisions)" carries no identifiers
                haveCurrent = false;
                continue;
            }
            ParsedItem<LogEntry> item;
            bool header = g.glyph != "~" && parseHeader(g.glyph, g.content, item.entry);
            if (!header && haveCurrent && !descriptionSeen) {
                // "│  ~ approx fix": a description that starts like a node
                applyDescription(g.glyph + " " + g.content, result.items.back().entry);
                descriptionSeen = true;
                continue;
            }
            item.startsEntry = true;
            if (header) {
                item.parsed = true;
                haveCurrent = true;
                descriptionSeen = false;
            } else {
                item.raw = line;
                haveCurrent = false;
            }
            result.items.push_back(std::move(item));
            continue;
        }

        if (g.content.empty()) continue;  // pure edges: "├─╯", "│"

        if (haveCurrent) {
            if (!descriptionSeen) {
                applyDescription(g.content, result.items.back().entry);
                descriptionSeen = true;
            }
            // Further description lines are folded into the truncated first line
            continue;
        }

        ParsedItem<LogEntry> item;
        item.raw = line;
        result.items.push_back(std::move(item));
    }
    return result;
}

std::string formatEntry(const LogEntry& entry, const FilterConfig& config) {
    std::vector<std::string> parts;
    if (!entry.glyph.empty()) parts.push_back(entry.glyph);
    parts.push_back(entry.shortId);
    if (!entry.commitHash.empty()) parts.push_back(entry.commitHash);
    for (const auto& b : entry.bookmarks) parts.push_back(b);
    if (entry.isEmpty) parts.push_back("(empty)");
    if (entry.isConflicted) parts.push_back("(conflict)");
    for (const auto& m : entry.markers) parts.push_back(m);
    if (config.verbose && entry.timestamp) parts.push_back(*entry.timestamp);

    std::string desc = TextUtil::redactEmails(entry.description);
    if (!desc.empty()) parts.push_back(TextUtil::truncateChars(desc, config.messageWidth));
    return TextUtil::join(parts, " ");
}

Rendering format(const ParseResult<LogEntry>& parsed, const FilterConfig& config) {
    Rendering out;
    std::vector<std::string> lines;

    size_t omitted = renderLimited(parsed, config.logLimit, lines, [&](const LogEntry& e) {
        lines.push_back(formatEntry(e, config));
        out.sources.push_back(GuardSource{e.rawHeader, e.bookmarks});
    });
    if (omitted > 0) lines.push_back(moreMarker(omitted));
    if (lines.empty()) lines.push_back("No commits");

    out.text = TextUtil::join(lines, "\n");
    return out;
}

}  // namespace LogFilter
}  // namespace vcstrim
