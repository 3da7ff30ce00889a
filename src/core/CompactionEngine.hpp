#pragma once

#include <string>
#include <vector>

#include "core/Classifier.hpp"
#include "core/FilterConfig.hpp"
#include "core/Records.hpp"
#include "util/Expected.hpp"
#include "util/IProcessRunner.hpp"

namespace vcstrim {

/// One requested VCS command: the subcommand as typed plus its trailing arguments
struct Invocation {
    std::string command;
    std::vector<std::string> args;
};

/**
 * @brief Runs one invocation through classify -> execute -> compact
 *
 * Flow:
 *   Passthrough       -> runner.interactive(), nothing captured or altered
 *   StructuredFilter  -> capture, parse, format, unparsed-ratio check, guard
 *   ConfirmationOnly  -> capture, one "ok ✓" line
 *
 * Any non-zero exit skips compaction: stdout is forwarded as is, stderr is
 * prefixed with "FAILED: <command>" and the exit code is mirrored. A guard
 * or unparsed-ratio failure degrades the whole invocation to raw output.
 */
class CompactionEngine {
public:
    CompactionEngine(IProcessRunner& runner, std::string binary, FilterConfig config);

    /**
     * @brief Classify and run an invocation
     * @return The text to print and the exit code, or SpawnFailed
     */
    Expected<CompactResult> run(const Invocation& inv) const;

    /// Compaction of already captured output (no process is spawned)
    CompactResult compact(const Route& route, const Invocation& inv, const RawOutput& raw) const;

    /**
     * @brief Full argv for the route
     *
     * Captured runs get --color=never (and --git for diff/show when the
     * caller did not ask for it) inserted right after the subcommand, so
     * positional arguments and "--" keep their meaning. Passthrough argv
     * is the caller's arguments untouched.
     */
    std::vector<std::string> buildArgv(const Route& route, const Invocation& inv) const;

    const FilterConfig& config() const { return cfg; }

private:
    IProcessRunner& runner;
    std::string binary;
    FilterConfig cfg;

    CompactResult structured(const Route& route, const RawOutput& raw) const;
    static CompactResult degrade(const RawOutput& raw, const std::string& reason);
};

}
