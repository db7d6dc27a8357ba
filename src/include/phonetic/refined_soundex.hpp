#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

#include <rapidfuzz/distance/Levenshtein.hpp>

#include "phonetic/name_normalizer.hpp"

namespace phonetic {

// Names whose refined soundex codes are further apart than this never match.
constexpr int64_t kPhoneticMatchThreshold = 2;

// Refined soundex: the first letter is kept, then every letter (the first one
// included) is replaced by its class digit and runs of the same digit are
// squeezed. Vowels and the semi-vowels keep class 0 rather than being dropped.
class RefinedSoundex {
public:
	std::string Encode(const std::string &word) const;
	// Same as Encode for a word already in NormalizeName form.
	std::string EncodeNormalized(const std::string &normalized) const;

	static char ClassCode(char ch);
};

inline char RefinedSoundex::ClassCode(char ch) {
	if (ch < 'A' || ch > 'Z') {
		return 0;
	}
	// clang-format off
	//                                   ABCDEFGHIJKLMNOPQRSTUVWXYZ
	static constexpr char lut[27] = "01360240043788015936020505";
	// clang-format on
	return lut[ch - 'A'];
}

inline std::string RefinedSoundex::Encode(const std::string &word) const {
	// Accents are folded first so that e.g. "Ḍāli" encodes like "Dali".
	return EncodeNormalized(NormalizeName(word));
}

inline std::string RefinedSoundex::EncodeNormalized(const std::string &normalized) const {
	std::string code;
	char last = 0;
	for (unsigned char ch : normalized) {
		if (ch < 'a' || ch > 'z') {
			continue;
		}
		const char upper = static_cast<char>(std::toupper(ch));
		if (code.empty()) {
			code.push_back(upper);
		}
		const char digit = ClassCode(upper);
		if (digit != last) {
			code.push_back(digit);
		}
		last = digit;
	}
	return code;
}

// Edit distance between two refined soundex codes. An empty code (a word with
// no letters) is always further than any threshold from everything.
inline int64_t RefinedSoundexCodeDistance(const std::string &a, const std::string &b) {
	if (a.empty() || b.empty()) {
		return static_cast<int64_t>(std::max(a.size(), b.size())) + kPhoneticMatchThreshold + 1;
	}
	return static_cast<int64_t>(rapidfuzz::levenshtein_distance(a, b));
}

inline int64_t RefinedSoundexDistance(const std::string &a, const std::string &b) {
	RefinedSoundex encoder;
	return RefinedSoundexCodeDistance(encoder.Encode(a), encoder.Encode(b));
}

} // namespace phonetic
