#pragma once

#include <string>
#include <vector>

#include "core/FilterConfig.hpp"
#include "core/Records.hpp"

namespace vcstrim {

enum class IdentifierKind { ChangeId, Hash, Name };

struct IdentifierToken {
    IdentifierKind kind{IdentifierKind::Hash};
    std::string text;
};

struct GuardReport {
    bool ok{true};
    std::vector<std::string> missing;
};

/**
 * @brief Checks that compaction kept every identifier of the rendered entries
 *
 * For each GuardSource the raw id text is scanned for identifier-like
 * tokens: jj change ids (k..z alphabet, 8+ chars) and hex hashes / op ids
 * (7+ chars); bookmark names come in through GuardSource::names.
 *
 * A token is preserved when the compact text contains it as a word, or a
 * word of at least `guardMinPrefix` chars that is a prefix of it and of no
 * other collected token. A commit hash also counts as preserved when the
 * change id from the same entry is preserved, since jj resolves either.
 * Names must appear verbatim.
 */
namespace FidelityGuard {

std::vector<IdentifierToken> scanIdentifiers(const GuardSource& source);

/// Words of compact text, split on whitespace and ,;:()[]|
std::vector<std::string> words(const std::string& text);

GuardReport check(const std::vector<GuardSource>& sources, const std::string& compact, const FilterConfig& config);

}  // namespace FidelityGuard

}  // namespace vcstrim
