#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace vcstrim {

/**
 * @brief Captured result of one VCS subprocess run
 *
 * exitStatus is the child's exit code, 128+N when killed by signal N,
 * or -1 when no status could be collected.
 */
struct RawOutput {
    std::string stdoutText;
    std::string stderrText;
    int exitStatus{0};
};

/**
 * @brief Strategy interface for running the VCS binary
 *
 * The engine only ever talks to this interface so tests can replay fixture
 * output without a jj install.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run argv to completion with stdout and stderr captured in full
     * @return SpawnFailed if the program could not be executed, IoError for pipe/fork failures
     */
    virtual Expected<RawOutput> capture(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Run argv attached to the caller's terminal
     * @return The child's exit status, or SpawnFailed / IoError as for capture()
     */
    virtual Expected<int> interactive(const std::vector<std::string>& argv) = 0;
};

}
