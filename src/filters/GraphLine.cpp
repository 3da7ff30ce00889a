#include "filters/GraphLine.hpp"

#include <unordered_set>

#include "util/TextUtil.hpp"

namespace vcstrim {

bool isGraphEdge(const std::string& cp) {
    static const std::unordered_set<std::string> edges = {
        " ", "\t", "|", "/", "\\",
        "\xE2\x94\x82",  // │
        "\xE2\x94\x9C",  // ├
        "\xE2\x94\x80",  // ─
        "\xE2\x95\xAF",  // ╯
        "\xE2\x95\xAE",  // ╮
        "\xE2\x95\xAD",  // ╭
        "\xE2\x95\xB0",  // ╰
        "\xE2\x94\xA4",  // ┤
        "\xE2\x94\xBC",  // ┼
        "\xE2\x94\xAC",  // ┬
        "\xE2\x94\xB4",  // ┴
    };
    return edges.count(cp) > 0;
}

bool isNodeGlyph(const std::string& cp) {
    static const std::unordered_set<std::string> nodes = {
        "@", "~",
        "\xE2\x97\x8B",  // ○
        "\xE2\x97\x86",  // ◆
        "\xE2\x97\x8F",  // ●
        "\xC3\x97",      // ×
        "\xE2\x97\x89",  // ◉
        "\xE2\x97\x8C",  // ◌
        "\xE2\x97\x87",  // ◇
    };
    return nodes.count(cp) > 0;
}

GraphLine splitGraphLine(const std::string& line) {
    GraphLine out;
    size_t pos = 0;
    while (pos < line.size()) {
        std::string cp = TextUtil::codePointAt(line, pos);
        if (isNodeGlyph(cp)) {
            size_t after = pos + cp.size();
            // A node glyph is followed by spacing (or ends the line); "@foo" is text
            if (after >= line.size() || line[after] == ' ') {
                out.prefix = line.substr(0, pos);
                out.glyph = cp;
                out.content = TextUtil::trim(line.substr(after));
                return out;
            }
            break;
        }
        if (!isGraphEdge(cp)) break;
        pos += cp.size();
    }
    out.prefix = line.substr(0, pos);
    out.content = TextUtil::trim(line.substr(pos));
    return out;
}

}
