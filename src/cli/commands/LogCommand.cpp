#include "cli/commands/LogCommand.hpp"

#include "util/TextUtil.hpp"

namespace vcstrim {

std::optional<size_t> LogCommand::requestedLimit(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--") break;
        std::string value;
        if ((a == "-n" || a == "--limit") && i + 1 < args.size()) {
            value = args[i + 1];
        } else if (TextUtil::startsWith(a, "--limit=")) {
            value = a.substr(8);
        } else if (TextUtil::startsWith(a, "-n") && a.size() > 2) {
            value = a.substr(2);
        } else {
            continue;
        }
        size_t n = 0;
        if (TextUtil::parseCount(value, n)) return n;
        return std::nullopt;
    }
    return std::nullopt;
}

/**
 * @brief Execute 'vcstrim log'
 *
 * jj already stops at -n entries; the rendered limit follows it upwards
 * so a caller asking for 20 entries sees 20, not the default 5.
 */
Expected<int> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    FilterConfig config = ctx.config;
    auto limit = requestedLimit(args);
    if (limit && *limit > config.logLimit) config.logLimit = *limit;
    return runVcs(ctx, name(), args, config);
}

}
