#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace vcstrim {

/**
 * @brief Base for every command that ends in a jj invocation
 *
 * Hands the subcommand and its arguments to CompactionEngine, prints the
 * compact text on stdout and diagnostics on stderr, and returns the exit
 * code the engine decided on. Arguments are forwarded untouched.
 */
class VcsCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;

protected:
    Expected<int> runVcs(const AppContext& ctx, const std::string& command, const std::vector<std::string>& args,
                         const FilterConfig& config) const;
};

}
