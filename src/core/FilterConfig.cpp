#include "core/FilterConfig.hpp"

#include <cstdlib>
#include <utility>
#include <vector>

#include "util/TextUtil.hpp"

namespace vcstrim {

namespace {

struct OptionSpec {
    const char* name;
    const char* env;
    size_t FilterConfig::*field;
};

// unparsed-ratio is a double and handled separately
const std::vector<OptionSpec>& sizeOptions() {
    static const std::vector<OptionSpec> specs = {
        {"log-limit", "VCSTRIM_LOG_LIMIT", &FilterConfig::logLimit},
        {"op-log-limit", "VCSTRIM_OP_LOG_LIMIT", &FilterConfig::opLogLimit},
        {"bookmark-limit", "VCSTRIM_BOOKMARK_LIMIT", &FilterConfig::bookmarkLimit},
        {"status-limit", "VCSTRIM_STATUS_LIMIT", &FilterConfig::statusFileLimit},
        {"hunk-lines", "VCSTRIM_HUNK_LINES", &FilterConfig::hunkLineLimit},
        {"diff-lines", "VCSTRIM_DIFF_LINES", &FilterConfig::diffLineLimit},
        {"message-width", "VCSTRIM_MESSAGE_WIDTH", &FilterConfig::messageWidth},
        {"op-id-length", "VCSTRIM_OP_ID_LENGTH", &FilterConfig::shortOpIdLength},
    };
    return specs;
}

Expected<double> parseRatio(const std::string& value) {
    if (value.empty()) return Error{ErrorCode::InvalidArgs, "unparsed-ratio: empty value"};
    char* end = nullptr;
    double ratio = std::strtod(value.c_str(), &end);
    if (end == nullptr || *end != '\0' || ratio < 0.0 || ratio > 1.0) {
        return Error{ErrorCode::InvalidArgs, "unparsed-ratio: expected a fraction between 0 and 1, got '" + value + "'"};
    }
    return ratio;
}

}

Expected<FilterConfig> FilterConfig::fromEnvironment() {
    FilterConfig cfg;
    for (const auto& spec : sizeOptions()) {
        const char* env = std::getenv(spec.env);
        if (!env) continue;
        auto res = cfg.set(spec.name, env);
        if (!res) return Error{res.error().code, std::string(spec.env) + ": " + res.error().message};
    }
    if (const char* env = std::getenv("VCSTRIM_UNPARSED_RATIO")) {
        auto res = cfg.set("unparsed-ratio", env);
        if (!res) return Error{res.error().code, std::string("VCSTRIM_UNPARSED_RATIO: ") + res.error().message};
    }
    return cfg;
}

Expected<void> FilterConfig::set(const std::string& name, const std::string& value) {
    if (name == "unparsed-ratio") {
        auto ratio = parseRatio(value);
        if (!ratio) return ratio.error();
        unparsedRatio = ratio.value();
        return {};
    }
    for (const auto& spec : sizeOptions()) {
        if (name != spec.name) continue;
        size_t n = 0;
        if (!TextUtil::parseCount(value, n)) {
            return Error{ErrorCode::InvalidArgs, name + ": expected a non-negative integer, got '" + value + "'"};
        }
        if (name == "op-id-length" && n == 0) {
            return Error{ErrorCode::InvalidArgs, "op-id-length: must be at least 1"};
        }
        this->*(spec.field) = n;
        return {};
    }
    return Error{ErrorCode::InvalidArgs, "unknown option: " + name};
}

bool FilterConfig::isOption(const std::string& name) {
    if (name == "unparsed-ratio") return true;
    for (const auto& spec : sizeOptions()) {
        if (name == spec.name) return true;
    }
    return false;
}

}
