#include "cli/commands/VcsCommand.hpp"

#include <iostream>

#include "core/CompactionEngine.hpp"

namespace vcstrim {

Expected<int> VcsCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    return runVcs(ctx, name(), args, ctx.config);
}

Expected<int> VcsCommand::runVcs(const AppContext& ctx, const std::string& command, const std::vector<std::string>& args,
                                 const FilterConfig& config) const {
    if (!ctx.runner) return Error{ErrorCode::InternalError, "no process runner configured"};

    CompactionEngine engine(*ctx.runner, ctx.binary, config);
    auto res = engine.run(Invocation{command, args});
    if (!res) return res.error();

    const CompactResult& result = res.value();
    if (!result.passthrough) {
        std::cout << result.text;
        std::cout.flush();
        std::cerr << result.diagnostics;
    }
    return result.exitCode;
}

}
