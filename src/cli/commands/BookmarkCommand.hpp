#pragma once

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class BookmarkCommand : public VcsCommand {
public:
    const char* name() const override { return "bookmark"; }
    const char* description() const override { return "List or change bookmarks"; }
    const char* helpNameLine() const override { return "bookmark -  Compact jj bookmark (alias: b)"; }
    const char* helpSynopsis() const override {
        return "vcstrim bookmark [list]\n       vcstrim bookmark set|create|delete|move|rename|track|untrack|forget ...";
    }
    const char* helpDescription() const override {
        return "'bookmark list' prints one line per local bookmark with tracked remotes folded in. "
               "Mutating verbs print a one-line acknowledgment.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
