#include "pcode/admin_level.hpp"
#include "phonetic/name_normalizer.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace pcode {

AdminLevel::AdminLevel(AdminConfig config, uint32_t admin_level, std::shared_ptr<const CountryCodes> country_codes)
    : config_(std::move(config)), admin_level_(admin_level), country_codes_(std::move(country_codes)),
      matcher_(config_.phonetic_transforms, config_.admin_fuzzy_dont) {
	if (admin_level_ == 0) {
		throw duckdb::InvalidInputException("admin level must be at least 1");
	}
	for (const auto &mapping : config_.admin_name_mappings) {
		name_mappings_.emplace(mapping.first, mapping.second);
	}
	for (const auto &replacement : config_.admin_name_replacements) {
		replacements_.push_back(ParseNameReplacement(replacement.first, replacement.second));
	}
}

void AdminLevel::Setup(const std::vector<AdminRow> &rows, const std::unordered_set<std::string> &countries) {
	std::unordered_set<std::string> wanted;
	for (const auto &country : countries) {
		wanted.insert(duckdb::StringUtil::Upper(country));
	}
	for (const auto &row : rows) {
		if (row.country_iso3.empty() || row.pcode.empty()) {
			throw duckdb::InvalidInputException("admin row must have a country code and a pcode (got \"%s\", \"%s\")",
			                                    row.country_iso3, row.pcode);
		}
		if (!wanted.empty() && wanted.count(duckdb::StringUtil::Upper(row.country_iso3)) == 0) {
			continue;
		}
		registry_.Register(row);
	}
	if (registry_.Empty()) {
		throw duckdb::InvalidInputException("no admin rows to register at admin level %d",
		                                    static_cast<int32_t>(admin_level_));
	}
	if (!country_codes_) {
		auto table = std::make_shared<CountryCodeTable>();
		table->LearnFromRegistry(registry_);
		country_codes_ = std::move(table);
	}
}

void AdminLevel::LoadPcodeFormats(const std::vector<PcodeFormatRow> &rows) {
	for (const auto &row : rows) {
		grammars_[row.country_iso3] = MakeCodeGrammar(row, GetAdminLevel(row.country_iso3));
	}
	for (const auto &code : registry_.Pcodes()) {
		const std::string *country = registry_.CountryOf(code);
		if (country == nullptr) {
			continue;
		}
		auto it = grammars_.find(*country);
		if (it != grammars_.end()) {
			it->second.AddZeroPositions(code);
		}
	}
}

void AdminLevel::SetParentAdmins(std::vector<const AdminLevel *> parents) {
	parents_.clear();
	parents_.reserve(parents.size());
	for (const auto *parent : parents) {
		parents_.push_back(parent != nullptr ? &parent->GetRegistry() : nullptr);
	}
}

uint32_t AdminLevel::GetAdminLevel(const std::string &country_iso3) const {
	auto it = config_.admin_level_overrides.find(country_iso3);
	if (it != config_.admin_level_overrides.end() && it->second > 0) {
		return it->second;
	}
	return admin_level_;
}

const CodeGrammar *AdminLevel::GetGrammar(const std::string &country_iso3) const {
	auto it = grammars_.find(country_iso3);
	if (it == grammars_.end()) {
		return nullptr;
	}
	return &it->second;
}

bool AdminLevel::IsParentOf(const std::string &parent, const std::string &pcode) const {
	const std::string *actual = registry_.ParentOf(pcode);
	return actual != nullptr && *actual == parent;
}

const std::string *AdminLevel::LookupNameMapping(const std::string &country_iso3, const std::string &name,
                                                 const std::string &parent) const {
	std::vector<std::string> keys;
	if (!parent.empty()) {
		keys.push_back(parent + kScopeSeparator + name);
	}
	keys.push_back(country_iso3 + kScopeSeparator + name);
	keys.push_back(name);

	for (const auto &key : keys) {
		auto it = name_mappings_.find(key);
		if (it == name_mappings_.end()) {
			continue;
		}
		const std::string *country = registry_.CountryOf(it->second);
		if (country == nullptr || *country != country_iso3) {
			continue;
		}
		if (!parent.empty() && !IsParentOf(parent, it->second)) {
			continue;
		}
		return &it->second;
	}
	return nullptr;
}

void AdminLevel::LogMatch(const std::string &context, const std::string &country_iso3, const std::string &input,
                          const std::string &pcode, const std::string &method, bool exact) {
	if (context.empty()) {
		return;
	}
	DiagnosticRecord record;
	record.context = context;
	record.country_iso3 = country_iso3;
	record.input = input;
	record.pcode = pcode;
	const std::string *name = registry_.LookupExact(pcode);
	if (name != nullptr) {
		record.name = *name;
	}
	record.method = method;
	record.exact = exact;
	diagnostics_.AddMatch(std::move(record));
}

PcodeMatch AdminLevel::ConvertAdminPcodeLength(const std::string &country_iso3, const std::string &pcode,
                                               const std::string &context) {
	const uint32_t level = GetAdminLevel(country_iso3);
	const CodeGrammar *grammar = GetGrammar(country_iso3);
	if (grammar == nullptr) {
		if (level == 1) {
			return ConvertAdmin1PcodeLength(country_iso3, pcode, context);
		}
		PcodeMatch none;
		none.exact = true;
		return none;
	}

	PcodeMatch match;
	match.exact = true;
	const std::string iso2 = country_codes_ ? country_codes_->Iso2(country_iso3) : std::string();
	const RepairResult repaired = RepairWithGrammar(registry_, *grammar, parents_, country_iso3, iso2, level, pcode);
	if (!repaired.found) {
		return match;
	}
	match.found = true;
	match.pcode = repaired.pcode;
	match.method = repaired.method;
	LogMatch(context, country_iso3, match.pcode, match.pcode, match.method, true);
	return match;
}

PcodeMatch AdminLevel::ConvertAdmin1PcodeLength(const std::string &country_iso3, const std::string &pcode,
                                                const std::string &context) {
	PcodeMatch match;
	match.exact = true;
	const std::string iso2 = country_codes_ ? country_codes_->Iso2(country_iso3) : std::string();
	const RepairResult repaired = RepairSimpleLength(registry_, country_iso3, iso2, pcode);
	if (!repaired.found) {
		return match;
	}
	match.found = true;
	match.pcode = repaired.pcode;
	match.method = repaired.method;
	LogMatch(context, country_iso3, match.pcode, match.pcode, match.method, true);
	return match;
}

PcodeMatch AdminLevel::FuzzyPcode(const std::string &country_iso3, const std::string &name,
                                  const std::string &context, const std::string &parent) {
	PcodeMatch match;
	DiagnosticRecord record;
	record.context = context;
	record.country_iso3 = country_iso3;
	const bool log = !context.empty();

	if (config_.countries_fuzzy_try && config_.countries_fuzzy_try->count(country_iso3) == 0) {
		if (log) {
			diagnostics_.AddIgnored(record);
		}
		return match;
	}
	const NameIndex *names = registry_.NameMap(country_iso3);
	if (names == nullptr) {
		if (log) {
			diagnostics_.AddError(record);
		}
		// Nothing approximate was attempted for an unknown country.
		match.exact = true;
		return match;
	}
	if (!parent.empty()) {
		names = registry_.ParentNameMap(country_iso3, parent);
		if (names == nullptr) {
			if (log) {
				record.input = parent;
				diagnostics_.AddError(record);
			}
			return match;
		}
	}

	const NameMatch found = matcher_.Match(*names, name, SelectReplacements(replacements_, country_iso3, parent));
	switch (found.status) {
	case NameMatchStatus::IGNORED:
		if (log) {
			record.input = name;
			diagnostics_.AddIgnored(record);
		}
		return match;
	case NameMatchStatus::NOT_FOUND:
		if (log) {
			record.input = name;
			diagnostics_.AddError(record);
		}
		return match;
	case NameMatchStatus::MATCHED:
		break;
	}
	match.found = true;
	match.pcode = found.pcode;
	match.exact = found.exact;
	match.method = found.method;
	LogMatch(context, country_iso3, name, match.pcode, match.method, match.exact);
	return match;
}

PcodeMatch AdminLevel::Resolve(const std::string &country_iso3, const std::string &input, bool allow_fuzzy,
                               const std::string &context, const std::string &parent_in) {
	// Parents only narrow the search when the rows carried them.
	const std::string parent = registry_.UsesParents() ? parent_in : std::string();

	PcodeMatch match;
	const std::string *mapped = LookupNameMapping(country_iso3, input, parent);
	if (mapped != nullptr) {
		match.found = true;
		match.pcode = *mapped;
		match.exact = true;
		return match;
	}

	// A pcode-shaped input is always treated as a pcode and never reaches name matching.
	if (LooksLikePcode(input)) {
		const std::string upper = duckdb::StringUtil::Upper(input);
		if (registry_.HasPcode(upper)) {
			match.found = true;
			match.pcode = upper;
			match.exact = true;
			return match;
		}
		match = ConvertAdminPcodeLength(country_iso3, upper, context);
		if (!match.found && !context.empty() && !registry_.HasCountry(country_iso3)) {
			DiagnosticRecord record;
			record.context = context;
			record.country_iso3 = country_iso3;
			diagnostics_.AddError(std::move(record));
		}
		return match;
	}

	const std::string lowered = phonetic::LowerName(input);
	const std::string *pcode = parent.empty() ? registry_.LookupByCountryName(country_iso3, lowered)
	                                          : registry_.LookupByParentName(country_iso3, parent, lowered);
	if (pcode != nullptr) {
		match.found = true;
		match.pcode = *pcode;
		match.exact = true;
		return match;
	}
	if (!allow_fuzzy) {
		match.exact = true;
		return match;
	}
	return FuzzyPcode(country_iso3, input, context, parent);
}

static std::vector<std::string> FormatRecords(const std::set<DiagnosticRecord> &records,
                                              std::string (*format)(const DiagnosticRecord &)) {
	std::vector<std::string> lines;
	lines.reserve(records.size());
	for (const auto &record : records) {
		lines.push_back(format(record));
	}
	return lines;
}

std::vector<std::string> AdminLevel::OutputMatches() const {
	return FormatRecords(diagnostics_.Matches(), &Diagnostics::FormatMatch);
}

std::vector<std::string> AdminLevel::OutputIgnored() const {
	return FormatRecords(diagnostics_.Ignored(), &Diagnostics::FormatIgnored);
}

std::vector<std::string> AdminLevel::OutputErrors() const {
	return FormatRecords(diagnostics_.Errors(), &Diagnostics::FormatError);
}

std::vector<std::string> AdminLevel::OutputAdminNameMappings() const {
	std::vector<std::string> lines;
	for (const auto &mapping : config_.admin_name_mappings) {
		const std::string *name = registry_.LookupExact(mapping.second);
		lines.push_back(duckdb::StringUtil::Format("%s: %s (%s)", mapping.first, name ? *name : std::string(),
		                                           mapping.second));
	}
	return lines;
}

std::vector<std::string> AdminLevel::OutputAdminNameReplacements() const {
	std::vector<std::string> lines;
	for (const auto &replacement : config_.admin_name_replacements) {
		lines.push_back(duckdb::StringUtil::Format("%s: %s", replacement.first, replacement.second));
	}
	return lines;
}

} // namespace pcode
