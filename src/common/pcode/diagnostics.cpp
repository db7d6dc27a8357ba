#include "pcode/diagnostics.hpp"

#include "duckdb/common/string_util.hpp"

#include <utility>

namespace pcode {

static std::vector<DiagnosticRecord> Drain(std::set<DiagnosticRecord> &records) {
	std::vector<DiagnosticRecord> out(records.begin(), records.end());
	records.clear();
	return out;
}

void Diagnostics::AddMatch(DiagnosticRecord record) {
	matches_.insert(std::move(record));
}

void Diagnostics::AddIgnored(DiagnosticRecord record) {
	ignored_.insert(std::move(record));
}

void Diagnostics::AddError(DiagnosticRecord record) {
	errors_.insert(std::move(record));
}

std::vector<DiagnosticRecord> Diagnostics::DrainMatches() {
	return Drain(matches_);
}

std::vector<DiagnosticRecord> Diagnostics::DrainIgnored() {
	return Drain(ignored_);
}

std::vector<DiagnosticRecord> Diagnostics::DrainErrors() {
	return Drain(errors_);
}

void Diagnostics::Clear() {
	matches_.clear();
	ignored_.clear();
	errors_.clear();
}

std::string Diagnostics::FormatMatch(const DiagnosticRecord &record) {
	return duckdb::StringUtil::Format("%s - %s: Matching (%s) %s to %s on map", record.context, record.country_iso3,
	                                  record.method, record.input, record.name);
}

std::string Diagnostics::FormatIgnored(const DiagnosticRecord &record) {
	if (record.input.empty()) {
		return duckdb::StringUtil::Format("%s - Ignored %s!", record.context, record.country_iso3);
	}
	return duckdb::StringUtil::Format("%s - %s: Ignored %s!", record.context, record.country_iso3, record.input);
}

std::string Diagnostics::FormatError(const DiagnosticRecord &record) {
	if (record.input.empty()) {
		return duckdb::StringUtil::Format("%s - Could not find %s in map names!", record.context,
		                                  record.country_iso3);
	}
	return duckdb::StringUtil::Format("%s - %s: Could not find %s in map names!", record.context,
	                                  record.country_iso3, record.input);
}

} // namespace pcode
