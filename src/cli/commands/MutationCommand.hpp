#pragma once

#include <string>

#include "cli/commands/VcsCommand.hpp"

namespace vcstrim {

/// Static help text for one write command
struct MutationInfo {
    const char* name;
    const char* description;
    const char* synopsis;
    const char* details;
};

/**
 * @brief describe, new, commit, squash, absorb, rebase, split, edit, undo, abandon
 *
 * All of them print "ok ✓ ..." on success and the full jj error on failure;
 * forms that would open an editor run attached to the terminal instead.
 * Which one is which is decided by the classifier, so a single class
 * serves every write command.
 */
class MutationCommand : public VcsCommand {
public:
    explicit MutationCommand(const MutationInfo& info) : info(info) {}

    const char* name() const override { return info.name; }
    const char* description() const override { return info.description; }
    const char* helpNameLine() const override { return info.description; }
    const char* helpSynopsis() const override { return info.synopsis; }
    const char* helpDescription() const override { return info.details; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override;

    /// Help text for every write command, in registration order
    static const std::vector<MutationInfo>& all();

    /// Entry of all() for `name`, nullptr if there is none
    static const MutationInfo* find(const std::string& name);

private:
    MutationInfo info;
};

}
