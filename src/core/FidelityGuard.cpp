#include "core/FidelityGuard.hpp"

#include <unordered_set>

#include "util/TextUtil.hpp"

namespace vcstrim {
namespace FidelityGuard {

namespace {

constexpr size_t kMinChangeIdLength = 8;
constexpr size_t kMinHashLength = 7;

bool isDelimiter(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == ',' || c == ';' || c == ':' || c == '(' ||
           c == ')' || c == '[' || c == ']' || c == '|' || c == '<' || c == '>';
}

bool isPreserved(const std::string& token,
                 const std::unordered_set<std::string>& compactWords,
                 const std::vector<IdentifierToken>& allTokens,
                 size_t minPrefix) {
    if (compactWords.count(token)) return true;
    for (const auto& w : compactWords) {
        if (w.size() < minPrefix || w.size() >= token.size()) continue;
        if (!TextUtil::startsWith(token, w)) continue;
        bool ambiguous = false;
        for (const auto& other : allTokens) {
            if (other.text != token && TextUtil::startsWith(other.text, w)) {
                ambiguous = true;
                break;
            }
        }
        if (!ambiguous) return true;
    }
    return false;
}

}

std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (char c : text) {
        if (isDelimiter(c)) {
            if (!current.empty()) out.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

std::vector<IdentifierToken> scanIdentifiers(const GuardSource& source) {
    std::vector<IdentifierToken> out;
    for (const auto& w : words(source.rawIds)) {
        if (TextUtil::isChangeIdToken(w, kMinChangeIdLength)) {
            out.push_back(IdentifierToken{IdentifierKind::ChangeId, w});
        } else if (TextUtil::isHexToken(w, kMinHashLength)) {
            out.push_back(IdentifierToken{IdentifierKind::Hash, w});
        }
    }
    for (const auto& name : source.names) {
        if (!name.empty()) out.push_back(IdentifierToken{IdentifierKind::Name, name});
    }
    return out;
}

GuardReport check(const std::vector<GuardSource>& sources, const std::string& compact, const FilterConfig& config) {
    GuardReport report;
    auto list = words(compact);
    std::unordered_set<std::string> compactWords(list.begin(), list.end());

    std::vector<std::vector<IdentifierToken>> perSource;
    std::vector<IdentifierToken> allTokens;
    for (const auto& src : sources) {
        perSource.push_back(scanIdentifiers(src));
        allTokens.insert(allTokens.end(), perSource.back().begin(), perSource.back().end());
    }

    for (const auto& tokens : perSource) {
        bool changeIdKept = false;
        for (const auto& t : tokens) {
            if (t.kind == IdentifierKind::ChangeId &&
                isPreserved(t.text, compactWords, allTokens, config.guardMinPrefix)) {
                changeIdKept = true;
            }
        }
        for (const auto& t : tokens) {
            bool kept = false;
            switch (t.kind) {
                case IdentifierKind::Name:
                    kept = compactWords.count(t.text) > 0 || compact.find(t.text) != std::string::npos;
                    break;
                case IdentifierKind::Hash:
                    kept = changeIdKept || isPreserved(t.text, compactWords, allTokens, config.guardMinPrefix);
                    break;
                case IdentifierKind::ChangeId:
                    kept = isPreserved(t.text, compactWords, allTokens, config.guardMinPrefix);
                    break;
            }
            if (!kept) {
                report.ok = false;
                report.missing.push_back(t.text);
            }
        }
    }
    return report;
}

}  // namespace FidelityGuard
}  // namespace vcstrim
