#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pcode/code_grammar.hpp"
#include "pcode/registry.hpp"

namespace pcode {

// Registries of the parent admin levels: element i holds level i + 1.
// A null element disables the plausibility check at that level.
using ParentRegistries = std::vector<const Registry *>;

struct RepairResult {
	bool found = false;
	std::string pcode;
	std::string method;
};

// Reshapes a pcode-shaped input into a registered pcode using the country's
// segment lengths. At most one '0' is inserted or removed per admin level.
// Prefixes produced by a zero change are checked against parents when given.
RepairResult RepairWithGrammar(const Registry &registry, const CodeGrammar &grammar, const ParentRegistries &parents,
                               const std::string &country_iso3, const std::string &country_iso2,
                               uint32_t admin_level, const std::string &input);

// Admin 1 only: rewrites a 4-6 character input to the country's observed
// pcode length using the most common drift patterns.
RepairResult RepairSimpleLength(const Registry &registry, const std::string &country_iso3,
                                const std::string &country_iso2, const std::string &input);

} // namespace pcode
