#include "pcode/length_repair.hpp"

#include <cstddef>

namespace pcode {

static constexpr const char *METHOD_LENGTH = "pcode length conversion";
static constexpr const char *METHOD_COUNTRY = "pcode length conversion-country";
static constexpr const char *METHOD_ADMINS = "pcode length conversion-admins ";

static std::string JoinParts(const std::vector<std::string> &parts, size_t count) {
	std::string out;
	for (size_t i = 0; i < count && i < parts.size(); ++i) {
		out += parts[i];
	}
	return out;
}

static std::string JoinParts(const std::vector<std::string> &parts) {
	return JoinParts(parts, parts.size());
}

static std::string JoinLevels(const std::vector<uint32_t> &levels) {
	std::string out;
	for (size_t i = 0; i < levels.size(); ++i) {
		if (i > 0) {
			out += ", ";
		}
		out += std::to_string(levels[i]);
	}
	return out;
}

// True when no registry is known for the level or the prefix is registered there.
static bool IsPlausibleParent(const ParentRegistries &parents, uint32_t level, const std::string &prefix) {
	if (level == 0 || level > parents.size()) {
		return true;
	}
	const Registry *parent = parents[level - 1];
	if (parent == nullptr) {
		return true;
	}
	return parent->HasPcode(prefix);
}

RepairResult RepairWithGrammar(const Registry &registry, const CodeGrammar &grammar, const ParentRegistries &parents,
                               const std::string &country_iso3, const std::string &country_iso2,
                               uint32_t admin_level, const std::string &input) {
	RepairResult result;
	std::string letters;
	std::string digits;
	if (!SplitPcode(input, letters, digits)) {
		return result;
	}
	const auto &lengths = grammar.Lengths();
	if (admin_level == 0 || grammar.MaxLevel() < admin_level) {
		return result;
	}

	// parts[0] is the country segment, parts[1..level-1] are settled admin
	// segments and the last element is the unsplit remainder.
	std::vector<std::string> parts;
	parts.reserve(admin_level + 1);
	if (letters.size() > lengths[0]) {
		parts.push_back(country_iso2);
	} else if (letters.size() < lengths[0]) {
		parts.push_back(country_iso3);
	} else {
		parts.push_back(letters);
	}
	parts.push_back(digits);

	std::string candidate = JoinParts(parts);
	if (registry.HasPcode(candidate)) {
		result.found = true;
		result.pcode = candidate;
		result.method = METHOD_COUNTRY;
		return result;
	}

	const size_t total_length = grammar.TotalLength(admin_level);
	std::vector<uint32_t> changed;
	for (uint32_t level = 1; level <= admin_level; ++level) {
		if (JoinParts(parts).size() == total_length) {
			break;
		}
		const std::string rest = parts[level];
		const size_t seg_len = lengths[level];
		const size_t pos = grammar.Offset(level);

		if (level == admin_level) {
			if (rest.size() < seg_len) {
				if (grammar.IsZeroPosition(pos)) {
					parts[level] = "0" + rest;
					changed.push_back(level);
				}
			} else if (rest.size() > seg_len && rest[0] == '0') {
				parts[level] = rest.substr(1);
				changed.push_back(level);
			}
			break;
		}

		const std::string prefix = JoinParts(parts, level);
		const size_t remaining = total_length - prefix.size();
		std::string segment;
		std::string tail;
		bool adjusted = false;
		if (rest.size() < remaining) {
			// Too short: try a leading zero on this segment.
			if (grammar.IsZeroPosition(pos)) {
				segment = "0" + rest.substr(0, seg_len - 1);
				if (IsPlausibleParent(parents, level, prefix + segment)) {
					tail = rest.size() > seg_len - 1 ? rest.substr(seg_len - 1) : std::string();
					adjusted = true;
				}
			}
		} else if (rest.size() > remaining && rest[0] == '0' && rest[1] != '0') {
			// Too long: try dropping this segment's leading zero. A run of
			// zeros is left for the deeper levels.
			segment = rest.substr(1, seg_len);
			if (IsPlausibleParent(parents, level, prefix + segment)) {
				tail = rest.size() > seg_len + 1 ? rest.substr(seg_len + 1) : std::string();
				adjusted = true;
			}
		}
		if (adjusted) {
			changed.push_back(level);
		} else {
			segment = rest.substr(0, seg_len);
			tail = rest.size() > seg_len ? rest.substr(seg_len) : std::string();
		}
		parts[level] = segment;
		parts.push_back(tail);
	}

	candidate = JoinParts(parts);
	if (!registry.HasPcode(candidate)) {
		return result;
	}
	result.found = true;
	result.pcode = candidate;
	result.method = METHOD_ADMINS + JoinLevels(changed);
	return result;
}

RepairResult RepairSimpleLength(const Registry &registry, const std::string &country_iso3,
                                const std::string &country_iso2, const std::string &input) {
	RepairResult result;
	const size_t country_length = registry.PcodeLength(country_iso3);
	if (country_length == 0) {
		return result;
	}
	const size_t input_length = input.size();
	if (input_length == country_length || input_length < 4 || input_length > 6) {
		return result;
	}

	std::string candidate;
	switch (country_length) {
	case 4:
		candidate = country_iso2 + input.substr(input_length - 2);
		break;
	case 5:
		if (input_length == 4) {
			candidate = input.substr(0, 2) + "0" + input.substr(input_length - 2);
		} else {
			candidate = country_iso2 + input.substr(input_length - 3);
		}
		break;
	case 6:
		if (input_length == 4) {
			candidate = country_iso3 + "0" + input.substr(input_length - 2);
		} else {
			candidate = country_iso3 + input.substr(input_length - 3);
		}
		break;
	default:
		return result;
	}
	if (!registry.HasPcode(candidate)) {
		return result;
	}
	result.found = true;
	result.pcode = candidate;
	result.method = METHOD_LENGTH;
	return result;
}

} // namespace pcode
