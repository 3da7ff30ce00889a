#pragma once

#include <string>
#include <utility>

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

/// Any jj subcommand without a registered command; always runs unmodified
class PassthroughCommand : public VcsCommand {
public:
    explicit PassthroughCommand(std::string command) : command(std::move(command)) {}

    const char* name() const override { return command.c_str(); }
    const char* description() const override { return "Run jj unmodified"; }
    const char* helpNameLine() const override { return "<command> -  Run any other jj subcommand unmodified"; }
    const char* helpSynopsis() const override { return "vcstrim <command> [args...]"; }
    const char* helpDescription() const override {
        return "Subcommands without a compact form run attached to the terminal and exit with jj's exit code.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }

private:
    std::string command;
};

}
