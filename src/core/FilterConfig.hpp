#pragma once

#include <cstddef>
#include <string>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace vcstrim {

/**
 * @brief Limits and switches shared by every parser, formatter and the guard
 *
 * Built once per invocation (defaults, then VCSTRIM_* environment, then
 * global CLI options) and passed by const reference afterwards.
 */
struct FilterConfig {
    size_t logLimit{Constants::LOG_LIMIT};
    size_t opLogLimit{Constants::OP_LOG_LIMIT};
    size_t bookmarkLimit{Constants::BOOKMARK_LIMIT};
    size_t statusFileLimit{Constants::STATUS_FILE_LIMIT};
    size_t hunkLineLimit{Constants::HUNK_LINE_LIMIT};
    size_t diffLineLimit{Constants::DIFF_LINE_LIMIT};
    size_t messageWidth{Constants::MESSAGE_WIDTH};
    size_t opSummaryWidth{Constants::OP_SUMMARY_WIDTH};
    size_t shortOpIdLength{Constants::SHORT_OP_ID_LENGTH};
    size_t shortIdLength{Constants::SHORT_ID_LENGTH};
    size_t guardMinPrefix{Constants::GUARD_MIN_PREFIX};
    double unparsedRatio{Constants::UNPARSED_RATIO};
    bool verbose{false};

    /// Defaults overlaid with VCSTRIM_* environment variables
    static Expected<FilterConfig> fromEnvironment();

    /**
     * @brief Apply one named override ("log-limit", "hunk-lines", ...)
     * @return InvalidArgs for an unknown name or a malformed value
     */
    Expected<void> set(const std::string& name, const std::string& value);

    /// True when `name` is a settable option (used by the CLI to consume its value)
    static bool isOption(const std::string& name);
};

}
