#pragma once

#include <string>
#include <vector>

#include "pcode/admin_config.hpp"

namespace pcode {

// A textual replacement, optionally restricted to one country or parent pcode.
struct NameReplacement {
	std::string scope;
	std::string from;
	std::string to;
};

// Separator between a scope and the rest of a mapping or replacement key.
constexpr char kScopeSeparator = '|';

NameReplacement ParseNameReplacement(const std::string &key, const std::string &to);

// Rules that are unscoped or scoped to the country or (when non-empty) the parent.
// Of several rules with the same from, the most specific scope wins (parent,
// then country, then unscoped); within one scope the first configured wins.
std::vector<NameReplacement> SelectReplacements(const std::vector<NameReplacement> &rules,
                                                const std::string &country_iso3, const std::string &parent);

// Replaces every occurrence of every rule in a single left-to-right pass.
// Where several rules match at one position the longest one wins.
std::string MultipleReplace(const std::string &text, const std::vector<NameReplacement> &rules);

// Returns false when the name does not start with rewrite.from.
bool ApplyPrefixRewrite(const PrefixRewrite &rewrite, const std::string &name, std::string &out);

} // namespace pcode
