#pragma once

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class StatusCommand : public VcsCommand {
public:
    const char* name() const override { return "status"; }
    const char* description() const override { return "Show the working copy and its parents"; }
    const char* helpNameLine() const override { return "status -  Compact jj status (alias: st)"; }
    const char* helpSynopsis() const override { return "vcstrim status [paths...]"; }
    const char* helpDescription() const override {
        return "Show the working-copy change, one line per changed file, the parent changes and any "
               "unresolved conflicts. A clean working copy renders as two lines.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
