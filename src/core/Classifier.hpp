#pragma once

#include <string>
#include <vector>

namespace vcstrim {

enum class RouteKind { StructuredFilter, ConfirmationOnly, Passthrough };

enum class FilterKind { Status, Log, Diff, Show, OpLog, BookmarkList };

enum class WriteOp {
    Describe, New, Commit, Squash, Absorb, Rebase, Split, Edit, Undo, Abandon,
    GitPush, GitFetch, BookmarkMutation
};

/**
 * @brief Outcome of classifying one invocation
 *
 * Only the member matching `kind` is meaningful. `label` names the
 * command in failure markers ("rebase", "git push", "op log").
 */
struct Route {
    RouteKind kind{RouteKind::Passthrough};
    FilterKind filter{FilterKind::Status};
    WriteOp write{WriteOp::New};
    std::string label;
    std::string reason;   // why Passthrough was chosen, for debug logs

    static Route structured(FilterKind kind, std::string label);
    static Route confirmation(WriteOp op, std::string label);
    static Route passthrough(std::string label, std::string reason);
};

/**
 * @brief Maps a jj subcommand and its arguments to filter / confirm / passthrough
 *
 * Pure: looks at names and flags only. Rules, in order:
 *   1. output-shaping flags (-T, --template, --color, --config*, --help)
 *      and interactive flags (-i, --interactive, --tool) -> Passthrough
 *   2. read commands (status, log, diff, show, op log, bookmark list)
 *      -> StructuredFilter, unless a per-command shape flag is present
 *   3. write commands (describe, new, commit, squash, absorb, rebase, split,
 *      edit, undo, abandon, git push/fetch, bookmark set/...) -> ConfirmationOnly,
 *      unless they would open an editor or diff editor
 *   4. everything else -> Passthrough
 */
namespace Classifier {

Route classify(const std::string& command, const std::vector<std::string>& args);

/// Resolve jj's built-in aliases: st -> status, desc -> describe, b -> bookmark
std::string canonicalName(const std::string& command);

/// True if any arg is `flag`, `flag=value`, or (for short flags) `-Xvalue`
bool hasFlag(const std::vector<std::string>& args, const std::string& flag);

/// Arguments that are neither flags nor values of known value-taking flags
std::vector<std::string> positionals(const std::vector<std::string>& args);

const char* kindName(RouteKind kind);

}  // namespace Classifier

}  // namespace vcstrim
