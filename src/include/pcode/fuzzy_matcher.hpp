#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "pcode/admin_config.hpp"
#include "pcode/name_rules.hpp"
#include "pcode/registry.hpp"
#include "phonetic/refined_soundex.hpp"

namespace pcode {

enum class NameMatchStatus : uint8_t { NOT_FOUND, MATCHED, IGNORED };

struct NameMatch {
	NameMatchStatus status = NameMatchStatus::NOT_FOUND;
	std::string pcode;
	std::string method;
	bool exact = false;
};

// Name -> pcode matching for one country's (or one parent's) names:
// normalized lookup, deny-list guard, substring scan, phonetic distance.
// Candidates are visited in registration order and the first best one wins.
class FuzzyMatcher {
public:
	FuzzyMatcher(std::vector<PrefixRewrite> transforms, const std::unordered_set<std::string> &dont_match,
	             int64_t threshold = phonetic::kPhoneticMatchThreshold);

	NameMatch Match(const NameIndex &names, const std::string &name,
	                const std::vector<NameReplacement> &replacements) const;

	// Stages take primary in NormalizeName form and secondary as primary with
	// the replacements applied.
	bool MatchNormalized(const NameIndex &names, const std::string &primary, const std::string &secondary,
	                     std::string &pcode_out) const;
	bool MatchSubstring(const NameIndex &names, const std::string &primary, const std::string &secondary,
	                    std::string &pcode_out) const;
	bool MatchPhonetic(const NameIndex &names, const std::string &primary, const std::string &secondary,
	                   std::string &pcode_out) const;

	bool IsDenied(const std::string &name) const;

private:
	std::vector<PrefixRewrite> transforms_;
	std::unordered_set<std::string> dont_match_;
	int64_t threshold_;
	phonetic::RefinedSoundex encoder_;
};

} // namespace pcode
