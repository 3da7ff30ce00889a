#include "filters/DiffFilter.hpp"

#include <utility>
#include <vector>

#include "filters/LogFilter.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {
namespace DiffFilter {

namespace {

const char* const kEllipsis = "\xE2\x80\xA6";

// "diff --git a/src/x y.rs b/src/x y.rs" -> "src/x y.rs"
std::string pathFromGitHeader(const std::string& line) {
    std::string rest = line.substr(std::string("diff --git ").size());
    size_t split = rest.rfind(" b/");
    if (split != std::string::npos) return rest.substr(split + 3);
    auto words = TextUtil::splitWhitespace(rest);
    return words.empty() ? rest : words.back();
}

bool isHeaderMetadata(const std::string& line) {
    static const char* const prefixes[] = {
        "index ", "new file mode", "deleted file mode", "old mode", "new mode",
        "similarity index", "dissimilarity index", "rename from", "rename to",
        "copy from", "copy to", "--- ", "+++ ",
    };
    for (const char* p : prefixes) {
        if (TextUtil::startsWith(line, p)) return true;
    }
    return false;
}

bool isChangedLine(const std::string& line) {
    return !line.empty() && (line[0] == '+' || line[0] == '-');
}

std::string moreLines(size_t n) {
    return std::string(kEllipsis) + " " + std::to_string(n) + " more lines";
}

}

DiffRecord parse(const std::string& text) {
    DiffRecord rec;
    DiffHunk* current = nullptr;
    bool inHunk = false;

    for (const auto& line : TextUtil::splitLines(text)) {
        if (TextUtil::startsWith(line, "diff --git ")) {
            rec.files.push_back(DiffHunk{});
            current = &rec.files.back();
            current->filePath = pathFromGitHeader(line);
            inHunk = false;
            ++rec.recognizedLines;
            continue;
        }
        if (!current) {
            if (!TextUtil::trim(line).empty()) rec.unparsed.push_back(line);
            continue;
        }
        if (!inHunk && isHeaderMetadata(line)) {
            if (TextUtil::startsWith(line, "rename to ")) current->filePath = line.substr(10);
            ++rec.recognizedLines;
            continue;
        }
        if (TextUtil::startsWith(line, "@@")) {
            current->lines.push_back(line);
            inHunk = true;
            ++rec.recognizedLines;
            continue;
        }
        if (TextUtil::startsWith(line, "Binary files ")) {
            current->lines.push_back(line);
            ++rec.recognizedLines;
            continue;
        }
        if (inHunk) {
            if (!line.empty() && line[0] == '+') ++current->stat.added;
            if (!line.empty() && line[0] == '-') ++current->stat.removed;
            current->lines.push_back(line);
            ++rec.recognizedLines;
            continue;
        }
        if (!TextUtil::trim(line).empty()) rec.unparsed.push_back(line);
    }
    return rec;
}

ShowRecord parseShow(const std::string& text, const FilterConfig& config) {
    ShowRecord rec;
    std::string header;
    std::string body;
    bool inDiff = false;
    for (const auto& line : TextUtil::splitLines(text)) {
        if (!inDiff && TextUtil::startsWith(line, "diff --git ")) inDiff = true;
        (inDiff ? body : header) += line + "\n";
    }
    rec.diff = parse(body);

    std::vector<std::string> idLines;
    for (const auto& line : TextUtil::splitLines(header)) {
        std::string trimmed = TextUtil::trim(line);
        if (trimmed.empty()) continue;
        if (TextUtil::startsWith(line, "    ")) {
            rec.descriptionLines.push_back(trimmed);
            ++rec.diff.recognizedLines;
            continue;
        }
        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            rec.diff.unparsed.push_back(line);
            continue;
        }
        std::string key = TextUtil::trim(trimmed.substr(0, colon));
        std::string value = TextUtil::trim(trimmed.substr(colon + 1));
        if (key == "Commit ID" && TextUtil::isHexToken(value, 6)) {
            rec.commit.commitHash = value.substr(0, config.shortIdLength);
            idLines.push_back(trimmed);
        } else if (key == "Change ID" && TextUtil::isAlnumToken(value)) {
            rec.commit.fullId = value;
            rec.commit.shortId = value.substr(0, config.shortIdLength);
            idLines.push_back(trimmed);
        } else if (key == "Bookmarks" || key == "Branches") {
            rec.commit.bookmarks = TextUtil::splitWhitespace(value);
        } else if (key == "Author") {
            // "Jane Doe <jane@example.com> (2023-02-12 14:56:59)"
            size_t lt = value.find('<');
            std::string name = TextUtil::trim(lt == std::string::npos ? value : value.substr(0, lt));
            if (!name.empty()) rec.commit.author = name;
            size_t open = value.rfind('(');
            size_t close = value.rfind(')');
            if (open != std::string::npos && close != std::string::npos && close > open) {
                rec.commit.timestamp = value.substr(open + 1, close - open - 1);
            }
        } else if (key != "Committer" && key != "Tags") {
            rec.diff.unparsed.push_back(line);
            continue;
        }
        ++rec.diff.recognizedLines;
    }

    rec.hasCommit = !rec.commit.shortId.empty();
    if (!rec.descriptionLines.empty()) rec.commit.description = rec.descriptionLines.front();
    rec.commit.rawHeader = TextUtil::join(idLines, " ");
    return rec;
}

double unparsedRatio(const DiffRecord& record) {
    size_t total = record.recognizedLines + record.unparsed.size();
    return total == 0 ? 0.0 : static_cast<double>(record.unparsed.size()) / static_cast<double>(total);
}

double unparsedRatio(const ShowRecord& record) { return unparsedRatio(record.diff); }

void applyCaps(DiffRecord& record, const FilterConfig& config) {
    size_t emitted = 0;
    record.omittedLines = 0;
    for (auto& file : record.files) {
        std::vector<std::string> kept;
        size_t inHunk = 0;
        size_t hunkOmitted = 0;

        auto closeHunk = [&]() {
            if (hunkOmitted > 0) {
                kept.push_back("  " + moreLines(hunkOmitted));
                file.truncated = true;
            }
            hunkOmitted = 0;
            inHunk = 0;
        };

        for (const auto& raw : file.lines) {
            bool changed = isChangedLine(raw);
            bool hunkHeader = TextUtil::startsWith(raw, "@@");
            if (!changed && !hunkHeader && !TextUtil::startsWith(raw, "Binary files ")) continue;

            if (emitted >= config.diffLineLimit) {
                if (changed) {
                    ++record.omittedLines;
                    file.truncated = true;
                }
                continue;
            }
            if (hunkHeader) {
                closeHunk();
                kept.push_back(raw);
                continue;
            }
            if (!changed) {
                kept.push_back(raw);
                continue;
            }
            if (inHunk >= config.hunkLineLimit) {
                ++hunkOmitted;
                continue;
            }
            kept.push_back(raw);
            ++inHunk;
            ++emitted;
        }
        closeHunk();
        file.lines = std::move(kept);
    }
}

Rendering format(const DiffRecord& record, const FilterConfig& config) {
    DiffRecord capped = record;
    applyCaps(capped, config);

    Rendering out;
    std::vector<std::string> lines;
    int totalAdded = 0;
    int totalRemoved = 0;
    for (const auto& file : capped.files) {
        lines.push_back(file.filePath + " | +" + std::to_string(file.stat.added) + " -" + std::to_string(file.stat.removed));
        totalAdded += file.stat.added;
        totalRemoved += file.stat.removed;
    }
    if (capped.files.size() > 1) {
        lines.push_back(std::to_string(capped.files.size()) + " files changed, +" + std::to_string(totalAdded) +
                        " -" + std::to_string(totalRemoved));
    }

    for (const auto& file : capped.files) {
        if (file.lines.empty()) continue;
        lines.push_back("");
        lines.push_back(file.filePath);
        lines.insert(lines.end(), file.lines.begin(), file.lines.end());
    }
    if (capped.omittedLines > 0) {
        lines.push_back("");
        lines.push_back(moreLines(capped.omittedLines) + " omitted");
    }

    for (const auto& raw : capped.unparsed) lines.push_back(raw);
    if (lines.empty()) lines.push_back("No changes");

    out.text = TextUtil::join(lines, "\n");
    return out;
}

Rendering formatShow(const ShowRecord& record, const FilterConfig& config) {
    Rendering out;
    std::vector<std::string> lines;
    if (record.hasCommit) {
        const LogEntry& summary = record.commit;
        lines.push_back(LogFilter::formatEntry(summary, config));
        if (config.verbose && summary.author) {
            lines.push_back("Author: " + *summary.author + (summary.timestamp ? " (" + *summary.timestamp + ")" : ""));
        }
        out.sources.push_back(GuardSource{record.commit.rawHeader, record.commit.bookmarks});
    }

    Rendering body = format(record.diff, config);
    if (!record.diff.files.empty() || !record.diff.unparsed.empty()) {
        lines.push_back(body.text);
    }
    if (lines.empty()) lines.push_back("No changes");
    out.text = TextUtil::join(lines, "\n");
    return out;
}

}  // namespace DiffFilter
}  // namespace vcstrim
