#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

class LogCommand : public VcsCommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Show recent changes, one line each"; }
    const char* helpNameLine() const override { return "log -  Compact jj log"; }
    const char* helpSynopsis() const override { return "vcstrim log [-r REVSET] [-n N] [paths...]"; }
    const char* helpDescription() const override {
        return "Print one line per change: graph glyph, change id, commit hash, bookmarks and the "
               "description cut to the message width. Author emails and timestamps are dropped. "
               "Only the first entries are shown; the rest are counted in a trailing marker.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-n, --limit <N>", "Passed to jj and raises the number of rendered entries to N"},
            {"--no-graph, -p, --stat, -T", "Passed through to jj without compaction"}
        };
    }

    /// Value of -n/--limit in args (`-n 3`, `-n3`, `--limit=3`), if well formed
    static std::optional<size_t> requestedLimit(const std::vector<std::string>& args);
};

}
