#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace vcstrim {

class CommandInvoker {
public:
    Expected<int> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
