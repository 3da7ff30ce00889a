#pragma once

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class OpCommand : public VcsCommand {
public:
    const char* name() const override { return "op"; }
    const char* description() const override { return "Operation log and other operation commands"; }
    const char* helpNameLine() const override { return "op -  Compact jj op log"; }
    const char* helpSynopsis() const override { return "vcstrim op log [-n N]\n       vcstrim op <verb> [args...]"; }
    const char* helpDescription() const override {
        return "'op log' prints one line per operation: short operation id, relative time and summary. "
               "Other op verbs run unmodified.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {{"-v (global)", "Show full operation ids and the args: line"}};
    }
};

}
