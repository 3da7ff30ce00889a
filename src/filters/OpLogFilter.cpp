#include "filters/OpLogFilter.hpp"

#include <utility>
#include <vector>

#include "filters/GraphLine.hpp"
#include "filters/Truncation.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {
namespace OpLogFilter {

namespace {

// Minimum printed op id length jj uses is 12; accept anything that still looks like a hash
constexpr size_t kMinOpIdLength = 7;

const std::vector<std::pair<std::string, std::string>>& timeUnits() {
    static const std::vector<std::pair<std::string, std::string>> units = {
        {"second", "s"}, {"minute", "m"}, {"hour", "h"}, {"day", "d"},
        {"week", "w"}, {"month", "mo"}, {"year", "y"},
    };
    return units;
}

}

std::string extractRelativeTime(const std::string& header) {
    if (header.find("less than a minute ago") != std::string::npos) return "now";

    auto words = TextUtil::splitWhitespace(header);
    for (size_t i = 0; i + 2 < words.size(); ++i) {
        size_t n = 0;
        if (!TextUtil::parseCount(words[i], n)) continue;
        std::string ago = words[i + 2];
        while (!ago.empty() && (ago.back() == ',' || ago.back() == ')')) ago.pop_back();
        if (ago != "ago") continue;
        std::string unit = words[i + 1];
        if (!unit.empty() && unit.back() == 's') unit.pop_back();
        for (const auto& [longName, shortName] : timeUnits()) {
            if (unit == longName) return words[i] + shortName + " ago";
        }
    }

    for (size_t i = 0; i < words.size(); ++i) {
        if (!TextUtil::isDateToken(words[i])) continue;
        std::string stamp = words[i];
        if (i + 1 < words.size() && TextUtil::isTimeToken(words[i + 1])) stamp += " " + words[i + 1].substr(0, 5);
        return stamp;
    }
    return "";
}

ParseResult<OpLogEntry> parse(const std::string& text) {
    ParseResult<OpLogEntry> result;
    bool haveCurrent = false;

    for (const auto& line : TextUtil::splitLines(text)) {
        if (TextUtil::trim(line).empty()) continue;
        GraphLine g = splitGraphLine(line);

        if (!g.glyph.empty() && g.glyph != "~") {
            ParsedItem<OpLogEntry> item;
            item.startsEntry = true;
            auto words = TextUtil::splitWhitespace(g.content);
            if (!words.empty() && TextUtil::isHexToken(words[0], kMinOpIdLength)) {
                item.parsed = true;
                item.entry.glyph = g.glyph;
                item.entry.fullOpId = words[0];
                item.entry.relativeTime = extractRelativeTime(g.content);
                item.entry.rawHeader = g.content;
                haveCurrent = true;
            } else {
                item.raw = line;
                haveCurrent = false;
            }
            result.items.push_back(std::move(item));
            continue;
        }
        if (g.content.empty() || g.glyph == "~") continue;

        if (!haveCurrent) {
            ParsedItem<OpLogEntry> item;
            item.raw = line;
            result.items.push_back(std::move(item));
            continue;
        }
        OpLogEntry& entry = result.items.back().entry;
        if (TextUtil::startsWith(g.content, "args:")) {
            entry.args = TextUtil::trim(g.content.substr(5));
        } else if (entry.summary.empty()) {
            entry.summary = g.content;
        }
    }
    return result;
}

Rendering format(const ParseResult<OpLogEntry>& parsed, const FilterConfig& config) {
    Rendering out;
    std::vector<std::string> lines;

    size_t omitted = renderLimited(parsed, config.opLogLimit, lines, [&](const OpLogEntry& e) {
        std::string opId = config.verbose ? e.fullOpId : e.fullOpId.substr(0, config.shortOpIdLength);

        std::vector<std::string> parts = {e.glyph, opId};
        if (!e.relativeTime.empty()) parts.push_back(e.relativeTime);
        std::string summary = TextUtil::redactEmails(e.summary);
        if (!summary.empty()) parts.push_back(TextUtil::truncateChars(summary, config.opSummaryWidth));
        lines.push_back(TextUtil::join(parts, " "));
        if (config.verbose && e.args) lines.push_back("  args: " + *e.args);

        out.sources.push_back(GuardSource{e.rawHeader, {}});
    });
    if (omitted > 0) lines.push_back(moreMarker(omitted));
    if (lines.empty()) lines.push_back("No operations");

    out.text = TextUtil::join(lines, "\n");
    return out;
}

}  // namespace OpLogFilter
}  // namespace vcstrim
