#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/Records.hpp"
#include "util/TextUtil.hpp"

namespace vcstrim {

/// "… N more": the explicit marker appended wherever entries were cut
inline std::string moreMarker(size_t omitted) {
    return "\xE2\x80\xA6 " + std::to_string(omitted) + " more";
}

/**
 * @brief Render at most `limit` entries of a listing in upstream order
 *
 * Parsed entries go through `render`. Unparsed lines are echoed in place
 * with emails removed; one in a header position uses up an entry slot.
 * Once the limit is hit nothing more is emitted, unparsed lines included.
 *
 * @return Number of entries (parsed or not) left out, for moreMarker()
 */
template <typename T, typename RenderFn>
size_t renderLimited(const ParseResult<T>& parsed, size_t limit, std::vector<std::string>& lines, RenderFn render) {
    size_t shown = 0;
    size_t omitted = 0;
    for (const auto& item : parsed.items) {
        bool startsEntry = item.parsed || item.startsEntry;
        if (shown >= limit) {
            if (startsEntry) ++omitted;
            continue;
        }
        if (item.parsed) {
            render(item.entry);
        } else {
            lines.push_back(TextUtil::redactEmails(item.raw));
        }
        if (startsEntry) ++shown;
    }
    return omitted;
}

}
