#pragma once

#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>
#include <utf8proc.h>
#include "duckdb/common/exception.hpp"

namespace phonetic {

struct Utf8procDeleter {
	void operator()(utf8proc_uint8_t *p) const {
		free(p);
	}
};
using Utf8Buf = std::unique_ptr<utf8proc_uint8_t, Utf8procDeleter>;

inline std::string Utf8procMap(const std::string &utf8, utf8proc_option_t options) {
	utf8proc_uint8_t *out_raw = nullptr;
	const auto flags = static_cast<utf8proc_option_t>(UTF8PROC_NULLTERM | options);

	utf8proc_ssize_t rc = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t *>(utf8.c_str()),
	                                   0, // length = NUL-terminated
	                                   &out_raw, flags);
	if (rc < 0) {
		if (rc == UTF8PROC_ERROR_INVALIDUTF8) {
			throw duckdb::InvalidInputException("admin name is not valid UTF-8: %s", utf8proc_errmsg(rc));
		}
		throw duckdb::InternalException("utf8proc error: %s", utf8proc_errmsg(rc));
	}
	Utf8Buf holder(out_raw); // RAII: free() when going out of scope
	return std::string(reinterpret_cast<char *>(holder.get()));
}

// Characters that separate words in an admin name. Runs of them collapse to one space.
inline bool IsNameSeparator(unsigned char ch) {
	switch (ch) {
	case '\t':
	case '\n':
	case '\v':
	case '\f':
	case '\r':
	case ' ':
	case '/':
		return true;
	default:
		return false;
	}
}

// Folds an admin name to the key form used by the registry: accents dropped,
// lowercase printable ASCII only, single spaces, trimmed.
inline std::string NormalizeName(const std::string &name) {
	if (name.empty()) {
		return std::string();
	}
	constexpr auto FLAGS = static_cast<utf8proc_option_t>(UTF8PROC_COMPAT |    // expand ligatures (Æ→AE)
	                                                       UTF8PROC_DECOMPOSE | // NFKD decomposition
	                                                       UTF8PROC_STRIPMARK | // drop combining accents
	                                                       UTF8PROC_CASEFOLD |  // fold case before the ASCII filter
	                                                       UTF8PROC_LUMP        // fold punctuation variants (’→')
	);
	const std::string folded = Utf8procMap(name, FLAGS);

	std::string out;
	out.reserve(folded.size());
	bool pending_space = false;
	for (unsigned char ch : folded) {
		if (IsNameSeparator(ch)) {
			pending_space = !out.empty();
			continue;
		}
		// Anything left outside printable ASCII could not be decomposed: drop it.
		if (ch < 0x21 || ch > 0x7E) {
			continue;
		}
		if (pending_space) {
			out.push_back(' ');
			pending_space = false;
		}
		out.push_back(static_cast<char>(std::tolower(ch)));
	}
	return out;
}

// Unicode lowercase of the raw name, without any other folding.
inline std::string LowerName(const std::string &name) {
	if (name.empty()) {
		return std::string();
	}
	return Utf8procMap(name, UTF8PROC_CASEFOLD);
}

} // namespace phonetic
