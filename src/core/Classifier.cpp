#include "core/Classifier.hpp"

#include <unordered_set>
#include <utility>

#include "util/TextUtil.hpp"

namespace vcstrim {

Route Route::structured(FilterKind kind, std::string label) {
    Route r;
    r.kind = RouteKind::StructuredFilter;
    r.filter = kind;
    r.label = std::move(label);
    return r;
}

Route Route::confirmation(WriteOp op, std::string label) {
    Route r;
    r.kind = RouteKind::ConfirmationOnly;
    r.write = op;
    r.label = std::move(label);
    return r;
}

Route Route::passthrough(std::string label, std::string reason) {
    Route r;
    r.kind = RouteKind::Passthrough;
    r.label = std::move(label);
    r.reason = std::move(reason);
    return r;
}

namespace Classifier {

namespace {

const std::vector<std::string>& globalShapeFlags() {
    static const std::vector<std::string> flags = {
        "-T", "--template", "--color", "--config", "--config-toml", "--config-file", "-h", "--help",
    };
    return flags;
}

const std::vector<std::string>& interactiveFlags() {
    static const std::vector<std::string> flags = {"-i", "--interactive", "--tool"};
    return flags;
}

const std::vector<std::string>& logShapeFlags() {
    static const std::vector<std::string> flags = {
        "--no-graph", "-G", "-p", "--patch", "-s", "--summary", "--stat", "--git", "--color-words",
        "--types", "--name-only",
    };
    return flags;
}

const std::vector<std::string>& diffShapeFlags() {
    static const std::vector<std::string> flags = {
        "--stat", "-s", "--summary", "--name-only", "--types", "--color-words",
    };
    return flags;
}

const std::vector<std::string>& opLogShapeFlags() {
    static const std::vector<std::string> flags = {
        "--no-graph", "-G", "-p", "--patch", "-d", "--op-diff", "--stat", "--summary", "-s",
    };
    return flags;
}

// Flags whose value is a separate argument; their values are not positionals
const std::unordered_set<std::string>& valueFlags() {
    static const std::unordered_set<std::string> flags = {
        "-r", "--revision", "--revisions", "-m", "--message", "-d", "--destination", "-o", "--onto",
        "-A", "--insert-after", "--after", "-B", "--insert-before", "--before", "-s", "--source",
        "-b", "--branch", "-f", "--from", "-t", "--to", "--into", "-R", "--repository",
        "--at-op", "--at-operation", "-n", "--limit", "--remote", "-c", "--change", "--tool",
        "-T", "--template", "--color", "--config", "--config-toml", "--config-file",
    };
    return flags;
}

const std::string* firstMatch(const std::vector<std::string>& args, const std::vector<std::string>& flags) {
    for (const auto& f : flags) {
        if (hasFlag(args, f)) return &f;
    }
    return nullptr;
}

bool hasMessage(const std::vector<std::string>& args) {
    return hasFlag(args, "-m") || hasFlag(args, "--message") || hasFlag(args, "--stdin") ||
           hasFlag(args, "--no-edit");
}

std::vector<std::string> tail(const std::vector<std::string>& args) {
    if (args.empty()) return {};
    return std::vector<std::string>(args.begin() + 1, args.end());
}

Route classifyBookmark(const std::vector<std::string>& args) {
    static const std::unordered_set<std::string> listVerbs = {"list", "l"};
    static const std::unordered_set<std::string> mutationVerbs = {
        "set", "s", "create", "c", "delete", "d", "forget", "f", "move", "m", "rename", "r",
        "track", "t", "untrack",
    };
    auto pos = positionals(args);
    if (pos.empty() || listVerbs.count(pos.front())) {
        return Route::structured(FilterKind::BookmarkList, "bookmark list");
    }
    if (mutationVerbs.count(pos.front())) {
        return Route::confirmation(WriteOp::BookmarkMutation, "bookmark " + pos.front());
    }
    return Route::passthrough("bookmark " + pos.front(), "unregistered bookmark verb");
}

}

std::string canonicalName(const std::string& command) {
    if (command == "st") return "status";
    if (command == "desc") return "describe";
    if (command == "b") return "bookmark";
    if (command == "ci") return "commit";
    return command;
}

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    bool isShort = flag.size() == 2 && flag[0] == '-' && flag[1] != '-';
    for (const auto& a : args) {
        if (a == "--") break;
        if (a == flag) return true;
        if (TextUtil::startsWith(a, flag + "=")) return true;
        if (isShort && a.size() > 2 && TextUtil::startsWith(a, flag) && a[1] != '-') return true;
    }
    return false;
}

std::vector<std::string> positionals(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    bool afterDashes = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (afterDashes) {
            out.push_back(a);
            continue;
        }
        if (a == "--") {
            afterDashes = true;
            continue;
        }
        if (!a.empty() && a[0] == '-' && a.size() > 1) {
            if (a.find('=') == std::string::npos && valueFlags().count(a)) ++i;
            continue;
        }
        out.push_back(a);
    }
    return out;
}

const char* kindName(RouteKind kind) {
    switch (kind) {
        case RouteKind::StructuredFilter: return "filter";
        case RouteKind::ConfirmationOnly: return "confirm";
        case RouteKind::Passthrough: return "passthrough";
    }
    return "?";
}

Route classify(const std::string& command, const std::vector<std::string>& args) {
    const std::string name = canonicalName(command);

    if (const std::string* f = firstMatch(args, globalShapeFlags())) {
        return Route::passthrough(name, "output-shaping flag " + *f);
    }
    if (const std::string* f = firstMatch(args, interactiveFlags())) {
        return Route::passthrough(name, "interactive flag " + *f);
    }

    if (name == "status") return Route::structured(FilterKind::Status, name);
    if (name == "log") {
        if (const std::string* f = firstMatch(args, logShapeFlags())) {
            return Route::passthrough(name, "log shape flag " + *f);
        }
        return Route::structured(FilterKind::Log, name);
    }
    if (name == "diff" || name == "show") {
        if (const std::string* f = firstMatch(args, diffShapeFlags())) {
            return Route::passthrough(name, "diff shape flag " + *f);
        }
        return Route::structured(name == "diff" ? FilterKind::Diff : FilterKind::Show, name);
    }
    if (name == "op") {
        if (args.empty() || args.front() != "log") {
            return Route::passthrough(name, "only op log is filtered");
        }
        if (const std::string* f = firstMatch(tail(args), opLogShapeFlags())) {
            return Route::passthrough("op log", "op log shape flag " + *f);
        }
        return Route::structured(FilterKind::OpLog, "op log");
    }
    if (name == "bookmark") return classifyBookmark(args);
    if (name == "git") {
        if (!args.empty() && args.front() == "push") {
            if (hasFlag(args, "--dry-run")) return Route::passthrough("git push", "dry run output is the result");
            return Route::confirmation(WriteOp::GitPush, "git push");
        }
        if (!args.empty() && args.front() == "fetch") return Route::confirmation(WriteOp::GitFetch, "git fetch");
        return Route::passthrough(name, "only git push/fetch are confirmed");
    }

    if (name == "describe") {
        if (!hasMessage(args)) return Route::passthrough(name, "describe without a message opens an editor");
        return Route::confirmation(WriteOp::Describe, name);
    }
    if (name == "commit") {
        if (!hasMessage(args)) return Route::passthrough(name, "commit without a message opens an editor");
        return Route::confirmation(WriteOp::Commit, name);
    }
    if (name == "split") {
        if (positionals(args).empty() || !hasMessage(args)) {
            return Route::passthrough(name, "split without paths and message is interactive");
        }
        return Route::confirmation(WriteOp::Split, name);
    }
    if (name == "new") return Route::confirmation(WriteOp::New, name);
    if (name == "squash") return Route::confirmation(WriteOp::Squash, name);
    if (name == "absorb") return Route::confirmation(WriteOp::Absorb, name);
    if (name == "rebase") return Route::confirmation(WriteOp::Rebase, name);
    if (name == "edit") return Route::confirmation(WriteOp::Edit, name);
    if (name == "undo") return Route::confirmation(WriteOp::Undo, name);
    if (name == "abandon") return Route::confirmation(WriteOp::Abandon, name);

    if (name == "diffedit" || name == "resolve") {
        return Route::passthrough(name, "full-screen editor");
    }
    return Route::passthrough(name, "unregistered subcommand");
}

}  // namespace Classifier
}  // namespace vcstrim
