#include "util/TextUtil.hpp"

#include <cctype>
#include <sstream>

namespace vcstrim {
namespace TextUtil {

namespace {

const char* const kEllipsis = "\xE2\x80\xA6";  // U+2026

bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool allDigits(const std::string& s, size_t from, size_t len) {
    if (from + len > s.size()) return false;
    for (size_t i = from; i < from + len; ++i) {
        if (!isDigit(s[i])) return false;
    }
    return true;
}

}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            if (!current.empty() && current.back() == '\r') current.pop_back();
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        if (current.back() == '\r') current.pop_back();
        lines.push_back(current);
    }
    return lines;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string trimLeft(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    return s.substr(b);
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

size_t codePointLength(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

std::string codePointAt(const std::string& s, size_t pos) {
    if (pos >= s.size()) return "";
    size_t len = codePointLength(static_cast<unsigned char>(s[pos]));
    if (pos + len > s.size()) len = s.size() - pos;
    return s.substr(pos, len);
}

size_t charCount(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); i += codePointLength(static_cast<unsigned char>(s[i]))) {
        ++count;
    }
    return count;
}

std::string truncateChars(const std::string& s, size_t maxChars) {
    if (maxChars == 0 || charCount(s) <= maxChars) return s;
    std::string out;
    size_t kept = 0;
    size_t i = 0;
    while (i < s.size() && kept + 1 < maxChars) {
        size_t len = codePointLength(static_cast<unsigned char>(s[i]));
        out += s.substr(i, len);
        i += len;
        ++kept;
    }
    // Avoid "word …" when the cut lands right after a space
    while (!out.empty() && out.back() == ' ') out.pop_back();
    out += kEllipsis;
    return out;
}

bool isHexToken(const std::string& s, size_t minLen) {
    if (s.size() < minLen || s.empty()) return false;
    for (char c : s) {
        if (!(isDigit(c) || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

bool isChangeIdToken(const std::string& s, size_t minLen) {
    if (s.size() < minLen || s.empty()) return false;
    for (char c : s) {
        if (c < 'k' || c > 'z') return false;
    }
    return true;
}

bool isAlnumToken(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool isEmailLike(const std::string& raw) {
    std::string s = raw;
    if (!s.empty() && s.front() == '<') s.erase(0, 1);
    while (!s.empty() && (s.back() == '>' || s.back() == ',' || s.back() == ')')) s.pop_back();
    size_t at = s.find('@');
    if (at == std::string::npos || at == 0) return false;
    size_t dot = s.find('.', at + 1);
    return dot != std::string::npos && dot > at + 1 && dot + 1 < s.size();
}

bool isDateToken(const std::string& s) {
    return s.size() == 10 && allDigits(s, 0, 4) && s[4] == '-' && allDigits(s, 5, 2) &&
           s[7] == '-' && allDigits(s, 8, 2);
}

bool isTimeToken(const std::string& s) {
    if (s.size() < 5 || !allDigits(s, 0, 2) || s[2] != ':' || !allDigits(s, 3, 2)) return false;
    if (s.size() == 5) return true;
    if (s[5] != ':' || !allDigits(s, 6, 2)) return false;
    if (s.size() == 8) return true;
    return s[8] == '.' && s.size() > 9 && allDigits(s, 9, s.size() - 9);
}

bool isZoneToken(const std::string& s) {
    return s.size() == 6 && (s[0] == '+' || s[0] == '-') && allDigits(s, 1, 2) && s[3] == ':' &&
           allDigits(s, 4, 2);
}

std::string redactEmails(const std::string& s) {
    if (s.find('@') == std::string::npos) return s;
    auto words = splitWhitespace(s);
    std::vector<std::string> kept;
    for (const auto& word : words) {
        if (!isEmailLike(word)) kept.push_back(word);
    }
    if (kept.size() == words.size()) return s;
    return join(kept, " ");
}

bool parseCount(const std::string& s, size_t& out) {
    if (s.empty() || s.size() > 18) return false;
    size_t value = 0;
    for (char c : s) {
        if (!isDigit(c)) return false;
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    out = value;
    return true;
}

}  // namespace TextUtil
}  // namespace vcstrim
