#pragma once

#include <string>

namespace vcstrim {

/**
 * @brief One line of jj's graph output split into its parts
 *
 *   "│ ○  kntqzsqt ..."  ->  prefix "│ ", glyph "○", content "kntqzsqt ..."
 *   "│  Say goodbye"     ->  prefix "│  ", glyph "",  content "Say goodbye"
 *   "├─╯"               ->  prefix "├─╯", glyph "",  content ""
 */
struct GraphLine {
    std::string prefix;
    std::string glyph;
    std::string content;
};

/// Box-drawing / ASCII edge characters (│ ├ ─ ╯ | / \ ...) and spaces
bool isGraphEdge(const std::string& codePoint);

/// Node glyphs: @ ○ ◆ ● × ◉ ◌ ◇ ~
bool isNodeGlyph(const std::string& codePoint);

GraphLine splitGraphLine(const std::string& line);

}
