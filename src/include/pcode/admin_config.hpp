#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pcode {

// Rewrites a name that starts with from so that it starts with to instead.
struct PrefixRewrite {
	std::string from;
	std::string to;
};

// "al x" is tried as "ad x" and as "x".
inline std::vector<PrefixRewrite> DefaultPhoneticTransforms() {
	return {{"al ", "ad "}, {"al ", ""}};
}

struct AdminConfig {
	// Countries for which fuzzy matching is tried. Unset means all countries.
	std::optional<std::unordered_set<std::string>> countries_fuzzy_try;
	// Literal name -> pcode overrides. A key may be scoped as "ISO3|name" or
	// "PARENT|name".
	std::vector<std::pair<std::string, std::string>> admin_name_mappings;
	// Textual replacements tried when fuzzy matching. A key may be scoped as
	// "ISO3|text" or "PARENT|text".
	std::vector<std::pair<std::string, std::string>> admin_name_replacements;
	// Names (compared lowercased) that must never be fuzzy matched.
	std::unordered_set<std::string> admin_fuzzy_dont;
	// Countries whose pcodes at this engine sit at another admin level.
	std::unordered_map<std::string, uint32_t> admin_level_overrides;
	// Tried on every candidate name before the phonetic comparison.
	std::vector<PrefixRewrite> phonetic_transforms = DefaultPhoneticTransforms();
};

} // namespace pcode
