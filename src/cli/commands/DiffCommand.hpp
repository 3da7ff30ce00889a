#pragma once

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class DiffCommand : public VcsCommand {
public:
    const char* name() const override { return "diff"; }
    const char* description() const override { return "Show a capped diff with a stat summary"; }
    const char* helpNameLine() const override { return "diff -  Compact jj diff"; }
    const char* helpSynopsis() const override { return "vcstrim diff [-r REV] [--from REV] [--to REV] [paths...]"; }
    const char* helpDescription() const override {
        return "Run jj diff in git format and print a per-file stat summary followed by changed lines, "
               "capped per hunk and in total. Truncation is marked with the omitted line count.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {{"--stat, --summary, --name-only", "Passed through to jj without compaction"}};
    }
};

}
