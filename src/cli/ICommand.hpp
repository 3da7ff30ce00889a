#pragma once

#include <string>
#include <vector>

#include "core/FilterConfig.hpp"
#include "util/Expected.hpp"
#include "util/IProcessRunner.hpp"

namespace vcstrim {

struct AppContext {
    FilterConfig config;
    std::string binary{"jj"};
    IProcessRunner* runner{nullptr};
};

class ICommand {
public:
    virtual ~ICommand() = default;
    /// Returns the process exit code; errors are reserved for failures of vcstrim itself
    virtual Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
