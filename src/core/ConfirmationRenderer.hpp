#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Classifier.hpp"
#include "core/FilterConfig.hpp"
#include "util/IProcessRunner.hpp"

namespace vcstrim {

/**
 * @brief One-line acknowledgments for jj's mutating commands
 *
 * jj reports the outcome of writes on stderr ("Working copy now at: ...",
 * "Rebased 3 commits ..."), so extraction looks at stdout and stderr
 * together. Output is always "ok ✓" optionally followed by tokens.
 */
namespace ConfirmationRenderer {

/// "ok ✓ <tokens>" for a successful run
std::string render(WriteOp op, const std::vector<std::string>& args, const RawOutput& raw, const FilterConfig& config);

/// "FAILED: <label>\n" followed by stderr exactly as captured
std::string failureDiagnostics(const std::string& label, const RawOutput& raw);

/// Change id after "Working copy now at:" (or "Working copy  (@) now at:"), else the first change-id-like word
std::optional<std::string> extractWorkingCopyId(const std::string& text);

/// Change id on the "Parent commit (@-)" line
std::optional<std::string> extractParentId(const std::string& text);

/// N from "Rebased N commits ..."; 0 when absent
size_t extractRebasedCount(const std::string& text);

/// Bookmark names from "Move forward bookmark main from ..." / "Add bookmark x to ..." lines
std::vector<std::string> extractPushedBookmarks(const std::string& text);

/// Number of "[new]" refs in `jj git fetch` output
size_t countFetchedRefs(const std::string& text);

/// Revisions listed under "Absorbed changes into ..."
size_t countAbsorbedRevisions(const std::string& text);

/// Change ids of the parts reported by `jj split`
std::vector<std::string> extractSplitParts(const std::string& text);

/// Value of the first matching flag (`-d x`, `--destination=x`); empty if absent
std::string flagValue(const std::vector<std::string>& args, const std::vector<std::string>& names);

}  // namespace ConfirmationRenderer

}  // namespace vcstrim
