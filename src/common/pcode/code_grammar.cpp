#include "pcode/code_grammar.hpp"

#include "duckdb/common/exception.hpp"

#include <algorithm>
#include <cstddef>

namespace pcode {

static inline bool IsAsciiAlpha(char ch) {
	return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}

static inline bool IsAsciiDigit(char ch) {
	return ch >= '0' && ch <= '9';
}

bool SplitPcode(const std::string &input, std::string &letters_out, std::string &digits_out) {
	size_t n_letters = 0;
	while (n_letters < input.size() && IsAsciiAlpha(input[n_letters])) {
		++n_letters;
	}
	if (n_letters < 2 || n_letters > 3 || n_letters == input.size()) {
		return false;
	}
	for (size_t i = n_letters; i < input.size(); ++i) {
		if (!IsAsciiDigit(input[i])) {
			return false;
		}
	}
	letters_out.assign(input, 0, n_letters);
	digits_out.assign(input, n_letters, std::string::npos);
	return true;
}

size_t CodeGrammar::Offset(uint32_t level) const {
	size_t offset = 0;
	const size_t end = std::min<size_t>(level, lengths_.size());
	for (size_t i = 0; i < end; ++i) {
		offset += lengths_[i];
	}
	return offset;
}

size_t CodeGrammar::TotalLength(uint32_t level) const {
	return Offset(level + 1);
}

void CodeGrammar::AddZeroPositions(const std::string &pcode) {
	for (size_t pos = 0; pos < pcode.size(); ++pos) {
		if (pcode[pos] == '0') {
			zeroes_.insert(pos);
		}
	}
}

CodeGrammar MakeCodeGrammar(const PcodeFormatRow &row, uint32_t max_level) {
	if (row.country_iso3.empty()) {
		throw duckdb::InvalidInputException("pcode length row has no country code");
	}
	if (row.lengths.empty()) {
		throw duckdb::InvalidInputException("pcode length row for %s has no country length", row.country_iso3);
	}
	for (size_t i = 0; i < row.lengths.size(); ++i) {
		if (row.lengths[i] <= 0) {
			throw duckdb::InvalidInputException("pcode length row for %s has invalid length %d at position %d",
			                                    row.country_iso3, row.lengths[i], static_cast<int32_t>(i));
		}
	}
	const size_t keep = std::min<size_t>(row.lengths.size(), static_cast<size_t>(max_level) + 1);
	std::vector<uint32_t> lengths(row.lengths.begin(), row.lengths.begin() + static_cast<std::ptrdiff_t>(keep));
	return CodeGrammar(std::move(lengths));
}

} // namespace pcode
