#include "cli/commands/MutationCommand.hpp"

namespace vcstrim {

const std::vector<MutationInfo>& MutationCommand::all() {
    static const std::vector<MutationInfo> infos = {
        {"describe", "Set the description of a change (alias: desc)", "vcstrim describe [REV] -m MESSAGE",
         "Prints the working-copy change id. Without -m/--stdin jj opens an editor, so it runs unmodified."},
        {"new", "Create a new empty change", "vcstrim new [REVS...] [-m MESSAGE]",
         "Prints the id of the new working-copy change."},
        {"commit", "Finish the working-copy change and start a new one (alias: ci)", "vcstrim commit -m MESSAGE [paths...]",
         "Prints the id of the committed change. Without -m jj opens an editor, so it runs unmodified."},
        {"squash", "Move changes into the parent or another revision", "vcstrim squash [-r REV] [--into REV] [paths...]",
         "Prints the resulting working-copy change id. -i runs unmodified."},
        {"absorb", "Move changes into the mutable ancestors that last touched them", "vcstrim absorb [paths...]",
         "Prints how many revisions received changes."},
        {"rebase", "Move revisions to another parent", "vcstrim rebase -s|-b|-r REV -d|-A|-B DEST",
         "Prints the number of rebased commits with source and destination."},
        {"split", "Split a revision in two", "vcstrim split [-r REV] -m MESSAGE paths...",
         "Prints the ids of both parts. Without paths and a message jj opens an editor, so it runs unmodified."},
        {"edit", "Make a revision the working copy", "vcstrim edit REV",
         "Prints the new working-copy change id."},
        {"undo", "Undo the last operation", "vcstrim undo [OPERATION]",
         "Prints the short id of the undone operation."},
        {"abandon", "Abandon revisions", "vcstrim abandon [REVS...]",
         "Prints the ids of the abandoned changes."},
    };
    return infos;
}

std::vector<std::pair<std::string, std::string>> MutationCommand::helpOptions() const {
    return {
        {"-i, --interactive, --tool", "Runs jj attached to the terminal"},
        {"on failure", "FAILED: <command> followed by jj's stderr, exit code unchanged"}
    };
}

const MutationInfo* MutationCommand::find(const std::string& name) {
    for (const auto& info : all()) {
        if (name == info.name) return &info;
    }
    return nullptr;
}

}
