#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pcode {

// Splits a pcode-shaped string (2-3 ASCII letters followed by at least one
// digit) into its letter and digit parts. Returns false for anything else.
bool SplitPcode(const std::string &input, std::string &letters_out, std::string &digits_out);

inline bool LooksLikePcode(const std::string &input) {
	std::string letters;
	std::string digits;
	return SplitPcode(input, letters, digits);
}

// One row of a pcode length table: lengths[0] is the country segment,
// lengths[i] the admin-i segment.
struct PcodeFormatRow {
	std::string country_iso3;
	std::vector<int32_t> lengths;
};

// Segment lengths of one country's pcodes plus the character offsets at
// which any registered pcode of the country has a '0'.
class CodeGrammar {
public:
	CodeGrammar() = default;
	explicit CodeGrammar(std::vector<uint32_t> lengths) : lengths_(std::move(lengths)) {
	}

	const std::vector<uint32_t> &Lengths() const {
		return lengths_;
	}
	// Deepest admin level the lengths describe.
	uint32_t MaxLevel() const {
		return lengths_.empty() ? 0 : static_cast<uint32_t>(lengths_.size() - 1);
	}
	// Offset of the first character of the admin segment for level.
	size_t Offset(uint32_t level) const;
	// Full pcode length at level.
	size_t TotalLength(uint32_t level) const;

	void AddZeroPositions(const std::string &pcode);
	bool IsZeroPosition(size_t pos) const {
		return zeroes_.count(pos) > 0;
	}
	const std::set<size_t> &ZeroPositions() const {
		return zeroes_;
	}

private:
	std::vector<uint32_t> lengths_;
	std::set<size_t> zeroes_;
};

// Validates a length table row and converts it, keeping at most
// max_level + 1 lengths. Throws InvalidInputException on a malformed row.
CodeGrammar MakeCodeGrammar(const PcodeFormatRow &row, uint32_t max_level);

} // namespace pcode
