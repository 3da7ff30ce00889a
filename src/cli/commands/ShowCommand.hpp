#pragma once

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class ShowCommand : public VcsCommand {
public:
    const char* name() const override { return "show"; }
    const char* description() const override { return "Show one change as a summary line and capped diff"; }
    const char* helpNameLine() const override { return "show -  Compact jj show"; }
    const char* helpSynopsis() const override { return "vcstrim show [REV]"; }
    const char* helpDescription() const override {
        return "Print the change id, commit hash, bookmarks and first description line on one line, "
               "then the diff as for 'vcstrim diff'.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
