#include "pcode/fuzzy_matcher.hpp"
#include "phonetic/name_normalizer.hpp"

#include <limits>
#include <utility>

namespace pcode {

static constexpr const char *METHOD_NORMALIZED = "normalized";
static constexpr const char *METHOD_SUBSTRING = "substring";
static constexpr const char *METHOD_FUZZY = "fuzzy";

FuzzyMatcher::FuzzyMatcher(std::vector<PrefixRewrite> transforms, const std::unordered_set<std::string> &dont_match,
                           int64_t threshold)
    : transforms_(std::move(transforms)), threshold_(threshold) {
	// Candidates are registry keys, so after a rewrite they only stay in key
	// form when the replacement text is in key form too.
	for (auto &rewrite : transforms_) {
		rewrite.to = phonetic::NormalizeName(rewrite.to);
	}
	for (const auto &name : dont_match) {
		dont_match_.insert(phonetic::LowerName(name));
	}
}

bool FuzzyMatcher::IsDenied(const std::string &name) const {
	return dont_match_.count(phonetic::LowerName(name)) > 0;
}

bool FuzzyMatcher::MatchNormalized(const NameIndex &names, const std::string &primary, const std::string &secondary,
                                   std::string &pcode_out) const {
	const std::string *pcode = primary.empty() ? nullptr : names.Find(primary);
	if (pcode == nullptr && !secondary.empty()) {
		pcode = names.Find(secondary);
	}
	if (pcode == nullptr) {
		return false;
	}
	pcode_out = *pcode;
	return true;
}

static const std::string *FindContaining(const NameIndex &names, const std::string &needle) {
	if (needle.empty()) {
		return nullptr;
	}
	for (const auto &entry : names.Entries()) {
		if (entry.first.find(needle) != std::string::npos) {
			return &entry.second;
		}
	}
	return nullptr;
}

bool FuzzyMatcher::MatchSubstring(const NameIndex &names, const std::string &primary, const std::string &secondary,
                                  std::string &pcode_out) const {
	const std::string *pcode = FindContaining(names, primary);
	if (pcode == nullptr) {
		pcode = FindContaining(names, secondary);
	}
	if (pcode == nullptr) {
		return false;
	}
	pcode_out = *pcode;
	return true;
}

bool FuzzyMatcher::MatchPhonetic(const NameIndex &names, const std::string &primary, const std::string &secondary,
                                 std::string &pcode_out) const {
	std::vector<std::string> input_codes;
	input_codes.push_back(encoder_.EncodeNormalized(primary));
	if (secondary != primary) {
		input_codes.push_back(encoder_.Encode(secondary));
	}

	int64_t best_distance = std::numeric_limits<int64_t>::max();
	const NameIndex::Entry *best = nullptr;
	auto check = [&](const NameIndex::Entry &entry, const std::string &candidate) {
		if (candidate.empty()) {
			return;
		}
		const std::string candidate_code = encoder_.EncodeNormalized(candidate);
		for (const auto &input_code : input_codes) {
			const int64_t distance = phonetic::RefinedSoundexCodeDistance(input_code, candidate_code);
			// Strictly smaller: on a tie the earlier candidate stays.
			if (distance < best_distance) {
				best_distance = distance;
				best = &entry;
			}
		}
	};

	std::string transformed;
	for (const auto &entry : names.Entries()) {
		check(entry, entry.first);
		for (const auto &rewrite : transforms_) {
			if (ApplyPrefixRewrite(rewrite, entry.first, transformed)) {
				check(entry, transformed);
			}
		}
	}

	if (best == nullptr || best_distance > threshold_) {
		return false;
	}
	pcode_out = best->second;
	return true;
}

NameMatch FuzzyMatcher::Match(const NameIndex &names, const std::string &name,
                              const std::vector<NameReplacement> &replacements) const {
	NameMatch match;
	const std::string primary = phonetic::NormalizeName(name);
	const std::string secondary = MultipleReplace(primary, replacements);

	if (MatchNormalized(names, primary, secondary, match.pcode)) {
		match.status = NameMatchStatus::MATCHED;
		match.method = METHOD_NORMALIZED;
		match.exact = true;
		return match;
	}
	if (IsDenied(name)) {
		match.status = NameMatchStatus::IGNORED;
		return match;
	}
	if (MatchSubstring(names, primary, secondary, match.pcode)) {
		match.status = NameMatchStatus::MATCHED;
		match.method = METHOD_SUBSTRING;
		return match;
	}
	if (MatchPhonetic(names, primary, secondary, match.pcode)) {
		match.status = NameMatchStatus::MATCHED;
		match.method = METHOD_FUZZY;
		return match;
	}
	return match;
}

} // namespace pcode
