#pragma once

#include "util/IProcessRunner.hpp"

namespace vcstrim {

/**
 * @brief IProcessRunner on fork/execvp
 *
 * The child inherits the working directory, environment and stdin. Exec
 * failure is reported back over a close-on-exec status pipe, so a missing
 * binary is a SpawnFailed error rather than an exit code of 127.
 *
 * While a child runs, SIGTERM and SIGHUP are forwarded to it; capture()
 * forwards SIGINT too. A forwarded signal is re-raised in this process
 * once the child has been reaped, so neither side is left behind.
 */
class PosixProcessRunner : public IProcessRunner {
public:
    Expected<RawOutput> capture(const std::vector<std::string>& argv) override;
    Expected<int> interactive(const std::vector<std::string>& argv) override;
};

}
