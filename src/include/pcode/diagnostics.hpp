#pragma once

#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace pcode {

// One match, ignored or error event. Fields that do not apply stay empty.
struct DiagnosticRecord {
	std::string context;
	std::string country_iso3;
	std::string input;
	std::string pcode;
	std::string name; // display name of pcode
	std::string method;
	bool exact = false;

	bool operator<(const DiagnosticRecord &other) const {
		return std::tie(context, country_iso3, input, pcode, name, method, exact) <
		       std::tie(other.context, other.country_iso3, other.input, other.pcode, other.name, other.method,
		                other.exact);
	}
	bool operator==(const DiagnosticRecord &other) const {
		return std::tie(context, country_iso3, input, pcode, name, method, exact) ==
		       std::tie(other.context, other.country_iso3, other.input, other.pcode, other.name, other.method,
		                other.exact);
	}
};

// Accumulates records across resolutions until the caller drains them.
// Identical records are kept once.
class Diagnostics {
public:
	void AddMatch(DiagnosticRecord record);
	void AddIgnored(DiagnosticRecord record);
	void AddError(DiagnosticRecord record);

	// Sorted by context, then country, then the remaining fields. Draining clears that kind.
	std::vector<DiagnosticRecord> DrainMatches();
	std::vector<DiagnosticRecord> DrainIgnored();
	std::vector<DiagnosticRecord> DrainErrors();

	const std::set<DiagnosticRecord> &Matches() const {
		return matches_;
	}
	const std::set<DiagnosticRecord> &Ignored() const {
		return ignored_;
	}
	const std::set<DiagnosticRecord> &Errors() const {
		return errors_;
	}

	void Clear();

	static std::string FormatMatch(const DiagnosticRecord &record);
	static std::string FormatIgnored(const DiagnosticRecord &record);
	static std::string FormatError(const DiagnosticRecord &record);

private:
	std::set<DiagnosticRecord> matches_;
	std::set<DiagnosticRecord> ignored_;
	std::set<DiagnosticRecord> errors_;
};

} // namespace pcode
