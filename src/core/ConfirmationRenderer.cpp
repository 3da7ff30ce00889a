#include "core/ConfirmationRenderer.hpp"

#include <algorithm>

#include "util/TextUtil.hpp"

namespace vcstrim {
namespace ConfirmationRenderer {

namespace {

const char* const kOk = "ok \xE2\x9C\x93";  // "ok ✓"
constexpr size_t kChangeIdLength = 8;

std::string ack(const std::vector<std::string>& tokens) {
    std::string out = kOk;
    for (const auto& t : tokens) {
        if (!t.empty()) out += " " + t;
    }
    return out;
}

std::string firstWordAfter(const std::string& line, const std::string& marker) {
    size_t pos = line.find(marker);
    if (pos == std::string::npos) return "";
    auto words = TextUtil::splitWhitespace(line.substr(pos + marker.size()));
    return words.empty() ? "" : words.front();
}

bool nothingChanged(const std::string& text) {
    return text.find("Nothing changed.") != std::string::npos;
}

std::vector<std::string> abandonedIds(const std::string& text) {
    std::vector<std::string> ids;
    bool inList = false;
    for (const auto& line : TextUtil::splitLines(text)) {
        std::string trimmed = TextUtil::trim(line);
        if (TextUtil::startsWith(trimmed, "Abandoned commit ")) {
            std::string id = firstWordAfter(trimmed, "Abandoned commit ");
            if (!id.empty()) ids.push_back(id);
            inList = false;
        } else if (TextUtil::startsWith(trimmed, "Abandoned ") && TextUtil::endsWith(trimmed, ":")) {
            inList = true;
        } else if (inList && (line[0] == ' ' || line[0] == '\t')) {
            auto words = TextUtil::splitWhitespace(trimmed);
            if (!words.empty()) ids.push_back(words.front());
        } else {
            inList = false;
        }
    }
    return ids;
}

}

std::optional<std::string> extractWorkingCopyId(const std::string& text) {
    for (const auto& line : TextUtil::splitLines(text)) {
        if (line.find("Working copy") == std::string::npos) continue;
        std::string id = firstWordAfter(line, "now at:");
        if (!id.empty()) return id;
    }
    for (const auto& word : TextUtil::splitWhitespace(text)) {
        if (TextUtil::isChangeIdToken(word, kChangeIdLength)) return word;
    }
    return std::nullopt;
}

std::optional<std::string> extractParentId(const std::string& text) {
    for (const auto& line : TextUtil::splitLines(text)) {
        if (!TextUtil::startsWith(TextUtil::trim(line), "Parent commit")) continue;
        // "(@-)" precedes the colon in current jj; older releases print no parenthetical
        size_t close = line.find(')');
        std::string id = firstWordAfter(close == std::string::npos ? line : line.substr(close), ":");
        if (!id.empty()) return id;
    }
    return std::nullopt;
}

size_t extractRebasedCount(const std::string& text) {
    for (const auto& line : TextUtil::splitLines(text)) {
        if (line.find("Rebased") == std::string::npos && line.find("rebased") == std::string::npos) continue;
        for (const auto& word : TextUtil::splitWhitespace(line)) {
            size_t n = 0;
            if (TextUtil::parseCount(word, n)) return n;
        }
    }
    return 0;
}

std::vector<std::string> extractPushedBookmarks(const std::string& text) {
    std::vector<std::string> names;
    for (const auto& line : TextUtil::splitLines(text)) {
        auto words = TextUtil::splitWhitespace(line);
        for (size_t i = 0; i + 1 < words.size(); ++i) {
            if (words[i] != "bookmark" && words[i] != "branch") continue;
            std::string name = words[i + 1];
            while (!name.empty() && (name.back() == ':' || name.back() == ',')) name.pop_back();
            if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
            break;
        }
    }
    return names;
}

size_t countFetchedRefs(const std::string& text) {
    size_t count = 0;
    for (const auto& line : TextUtil::splitLines(text)) {
        if (line.find("[new]") != std::string::npos) ++count;
    }
    return count;
}

size_t countAbsorbedRevisions(const std::string& text) {
    size_t count = 0;
    bool inList = false;
    for (const auto& line : TextUtil::splitLines(text)) {
        if (line.find("Absorbed changes into") != std::string::npos) {
            inList = true;
            continue;
        }
        if (!inList) continue;
        if (!line.empty() && (line[0] == ' ' || line[0] == '\t') && !TextUtil::trim(line).empty()) {
            ++count;
        } else {
            inList = false;
        }
    }
    return count;
}

std::vector<std::string> extractSplitParts(const std::string& text) {
    static const char* const markers[] = {"First part:", "Second part:", "Selected changes", "Remaining changes"};
    std::vector<std::string> ids;
    for (const auto& line : TextUtil::splitLines(text)) {
        std::string trimmed = TextUtil::trim(line);
        for (const char* m : markers) {
            if (!TextUtil::startsWith(trimmed, m)) continue;
            std::string id = firstWordAfter(trimmed, ":");
            if (!id.empty()) ids.push_back(id);
            break;
        }
    }
    return ids;
}

std::string flagValue(const std::vector<std::string>& args, const std::vector<std::string>& names) {
    for (size_t i = 0; i < args.size(); ++i) {
        for (const auto& n : names) {
            if (args[i] == n && i + 1 < args.size()) return args[i + 1];
            if (TextUtil::startsWith(args[i], n + "=")) return args[i].substr(n.size() + 1);
        }
    }
    return "";
}

std::string failureDiagnostics(const std::string& label, const RawOutput& raw) {
    return "FAILED: " + label + "\n" + raw.stderrText;
}

std::string render(WriteOp op, const std::vector<std::string>& args, const RawOutput& raw, const FilterConfig& config) {
    const std::string text = raw.stdoutText + raw.stderrText;

    switch (op) {
        case WriteOp::New:
        case WriteOp::Describe:
        case WriteOp::Edit:
            return ack({extractWorkingCopyId(text).value_or("")});
        case WriteOp::Commit: {
            // The committed change becomes the parent of the new working copy
            auto id = extractParentId(text);
            if (!id) id = extractWorkingCopyId(text);
            return ack({"committed", id.value_or("")});
        }
        case WriteOp::Squash:
            return ack({"squashed", extractWorkingCopyId(text).value_or("")});
        case WriteOp::Absorb: {
            if (nothingChanged(text)) return ack({"nothing to absorb"});
            size_t n = countAbsorbedRevisions(text);
            if (n == 0) return ack({"absorbed"});
            return ack({"absorbed into", std::to_string(n), n == 1 ? "revision" : "revisions"});
        }
        case WriteOp::Rebase: {
            std::vector<std::string> tokens = {"rebased"};
            size_t n = extractRebasedCount(text);
            if (n > 0) tokens.push_back(std::to_string(n) + (n == 1 ? " commit" : " commits"));
            std::string src = flagValue(args, {"-s", "--source", "-b", "--branch", "-r", "--revisions"});
            if (!src.empty()) tokens.push_back("from " + src);
            std::string dest = flagValue(args, {"-d", "--destination", "-o", "--onto"});
            if (!dest.empty()) {
                tokens.push_back("onto " + dest);
            } else if (!(dest = flagValue(args, {"-A", "--insert-after", "--after"})).empty()) {
                tokens.push_back("after " + dest);
            } else if (!(dest = flagValue(args, {"-B", "--insert-before", "--before"})).empty()) {
                tokens.push_back("before " + dest);
            }
            return ack(tokens);
        }
        case WriteOp::Split: {
            auto parts = extractSplitParts(text);
            if (parts.empty()) return ack({"split"});
            return ack({"split into " + std::to_string(parts.size()) + ":", TextUtil::join(parts, " ")});
        }
        case WriteOp::Undo: {
            for (const auto& word : TextUtil::splitWhitespace(text)) {
                if (TextUtil::isHexToken(word, 12)) return ack({"undone", word.substr(0, config.shortOpIdLength)});
            }
            return ack({"undone"});
        }
        case WriteOp::Abandon: {
            auto ids = abandonedIds(text);
            if (ids.empty()) return ack({"abandoned"});
            return ack({"abandoned", TextUtil::join(ids, " ")});
        }
        case WriteOp::GitPush: {
            if (nothingChanged(text)) return ack({"nothing to push"});
            auto names = extractPushedBookmarks(text);
            if (names.empty()) return ack({"pushed"});
            return ack({"pushed", TextUtil::join(names, ", ")});
        }
        case WriteOp::GitFetch: {
            size_t n = countFetchedRefs(text);
            if (n == 0) return ack({"fetched"});
            return ack({"fetched (" + std::to_string(n) + " new)"});
        }
        case WriteOp::BookmarkMutation:
            return ack({});
    }
    return ack({});
}

}  // namespace ConfirmationRenderer
}  // namespace vcstrim
