// vcstrim entry: global options, then one jj subcommand through the command registry.

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/BookmarkCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/GitCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/MutationCommand.hpp"
#include "cli/commands/OpCommand.hpp"
#include "cli/commands/PassthroughCommand.hpp"
#include "cli/commands/ShowCommand.hpp"
#include "cli/commands/StatusCommand.hpp"
#include "util/Logger.hpp"
#include "util/PosixProcessRunner.hpp"

using namespace vcstrim;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("status", [] { return std::make_unique<StatusCommand>(); });
    f.registerCreator("st", [] { return std::make_unique<StatusCommand>(); });
    f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
    f.registerCreator("diff", [] { return std::make_unique<DiffCommand>(); });
    f.registerCreator("show", [] { return std::make_unique<ShowCommand>(); });
    f.registerCreator("op", [] { return std::make_unique<OpCommand>(); });
    f.registerCreator("bookmark", [] { return std::make_unique<BookmarkCommand>(); });
    f.registerCreator("b", [] { return std::make_unique<BookmarkCommand>(); });
    f.registerCreator("git", [] { return std::make_unique<GitCommand>(); });
    for (const auto& info : MutationCommand::all()) {
        f.registerCreator(info.name, [info] { return std::make_unique<MutationCommand>(info); });
    }
    const std::pair<const char*, const char*> aliases[] = {{"desc", "describe"}, {"ci", "commit"}};
    for (const auto& [alias, target] : aliases) {
        if (const MutationInfo* info = MutationCommand::find(target)) {
            f.registerCreator(alias, [info] { return std::make_unique<MutationCommand>(*info); });
        }
    }
}

/**
 * Consume global options up to the subcommand. Returns the index of the
 * subcommand in args, args.size() when there is none.
 */
static Expected<size_t> parseGlobalOptions(const std::vector<std::string>& args, AppContext& ctx, bool& wantHelp) {
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.empty() || a[0] != '-') break;
        if (a == "-v" || a == "--verbose") {
            ctx.config.verbose = true;
            continue;
        }
        if (a == "-h" || a == "--help") {
            wantHelp = true;
            continue;
        }

        if (a.size() < 3 || a.rfind("--", 0) != 0) {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + a + "'"};
        }
        std::string name = a.substr(2);
        std::string value;
        bool inlineValue = false;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            inlineValue = true;
        }
        if (name != "jj" && !FilterConfig::isOption(name)) {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + a + "'"};
        }
        if (!inlineValue) {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "option '--" + name + "' needs a value"};
            value = args[++i];
        }
        if (name == "jj") {
            if (value.empty()) return Error{ErrorCode::InvalidArgs, "--jj needs a non-empty path"};
            ctx.binary = value;
            continue;
        }
        auto set = ctx.config.set(name, value);
        if (!set) return set.error();
    }
    return i;
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    auto config = FilterConfig::fromEnvironment();
    if (!config) {
        Logger::instance().error(config.error().message);
        return 2;
    }

    PosixProcessRunner runner;
    AppContext ctx{};
    ctx.config = config.value();
    ctx.runner = &runner;
    if (const char* jj = std::getenv("VCSTRIM_JJ"); jj && *jj) ctx.binary = jj;

    bool wantHelp = false;
    auto parsed = parseGlobalOptions(args, ctx, wantHelp);
    if (!parsed) {
        Logger::instance().error(parsed.error().message);
        std::cerr << "Run 'vcstrim help' for usage.\n";
        return 2;
    }
    args.erase(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(parsed.value()));

    CommandInvoker invoker;
    if (args.empty() || wantHelp) {
        auto cmd = CommandFactory::instance().create("help");
        auto res = invoker.invoke(*cmd, ctx, args.empty() ? std::vector<std::string>{} : std::vector<std::string>{args.front()});
        return res ? res.value() : 1;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        Logger::instance().debug("no compact form for '" + cmdName + "', running it unmodified");
        cmd = std::make_unique<PassthroughCommand>(cmdName);
    }

    auto res = invoker.invoke(*cmd, ctx, args);
    if (!res) return res.error().code == ErrorCode::SpawnFailed ? 127 : 1;
    return res.value();
}
