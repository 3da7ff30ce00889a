#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace vcstrim {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "Name:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << opt << " :  " << desc << "\n\n";
        }
    }
}

void printGlobalOptions() {
    std::cout << "\nGlobal options (before the command):\n"
              << "  -v, --verbose          Show full ids, timestamps and op args\n"
              << "  --jj <path>            jj binary to run (env VCSTRIM_JJ)\n"
              << "  --log-limit <N>        Log entries (env VCSTRIM_LOG_LIMIT)\n"
              << "  --op-log-limit <N>     Op log entries (env VCSTRIM_OP_LOG_LIMIT)\n"
              << "  --bookmark-limit <N>   Bookmark entries (env VCSTRIM_BOOKMARK_LIMIT)\n"
              << "  --status-limit <N>     Status file lines (env VCSTRIM_STATUS_LIMIT)\n"
              << "  --hunk-lines <N>       Lines per diff hunk (env VCSTRIM_HUNK_LINES)\n"
              << "  --diff-lines <N>       Total diff lines (env VCSTRIM_DIFF_LINES)\n"
              << "  --message-width <N>    Description width (env VCSTRIM_MESSAGE_WIDTH)\n"
              << "  --op-id-length <N>     Short operation id length (env VCSTRIM_OP_ID_LENGTH)\n"
              << "  --unparsed-ratio <F>   Raw fallback threshold (env VCSTRIM_UNPARSED_RATIO)\n"
              << "\nAny other jj command runs unmodified.\n";
}

}

Expected<int> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::string topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(*cmd);
            return 0;
        }
        std::cerr << "Unknown help topic: " << topic << "\n\n";
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    std::cout << "usage: vcstrim [options] <command> [args...]\n\n";
    std::cout << "Compact jj commands:\n\n";
    for (const auto& c : cmds) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    printGlobalOptions();
    return 0;
}

}
