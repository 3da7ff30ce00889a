#pragma once

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class GitCommand : public VcsCommand {
public:
    const char* name() const override { return "git"; }
    const char* description() const override { return "Push to and fetch from git remotes"; }
    const char* helpNameLine() const override { return "git -  Acknowledge jj git push / fetch"; }
    const char* helpSynopsis() const override { return "vcstrim git push [args...]\n       vcstrim git fetch [args...]"; }
    const char* helpDescription() const override {
        return "'git push' reports the pushed bookmarks, 'git fetch' the number of new refs. "
               "Other git verbs run unmodified.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
