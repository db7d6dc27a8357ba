#include "pcode/admin_level_set.hpp"

#include "duckdb/common/exception.hpp"

#include <memory>

namespace pcode {

AdminLevelSet::AdminLevelSet(AdminConfig config) : config_(std::move(config)) {
}

void AdminLevelSet::Setup(const std::vector<LeveledAdminRow> &rows, const std::vector<PcodeFormatRow> &formats) {
	if (rows.empty()) {
		throw duckdb::InvalidInputException("no admin rows to register");
	}
	std::map<uint32_t, std::vector<AdminRow>> by_level;
	for (const auto &leveled : rows) {
		if (leveled.admin_level == 0) {
			throw duckdb::InvalidInputException("admin level must be at least 1 (pcode \"%s\")", leveled.row.pcode);
		}
		by_level[leveled.admin_level].push_back(leveled.row);
	}

	levels_.clear();
	country_codes_ = std::make_shared<CountryCodeTable>();
	for (const auto &entry : by_level) {
		auto level = std::make_unique<AdminLevel>(config_, entry.first, country_codes_);
		level->Setup(entry.second);
		levels_.emplace(entry.first, std::move(level));
	}
	// Learn from the top level down so admin 1 prefixes take precedence.
	for (const auto &entry : levels_) {
		country_codes_->LearnFromRegistry(entry.second->GetRegistry());
	}

	for (auto &entry : levels_) {
		std::vector<const AdminLevel *> parents;
		for (uint32_t parent_level = 1; parent_level < entry.first; parent_level++) {
			parents.push_back(GetLevel(parent_level));
		}
		entry.second->SetParentAdmins(std::move(parents));
		if (!formats.empty()) {
			entry.second->LoadPcodeFormats(formats);
		}
	}
}

uint32_t AdminLevelSet::MaxLevel() const {
	if (levels_.empty()) {
		return 0;
	}
	return levels_.rbegin()->first;
}

AdminLevel *AdminLevelSet::GetLevel(uint32_t level) {
	auto it = levels_.find(level);
	if (it == levels_.end()) {
		return nullptr;
	}
	return it->second.get();
}

const AdminLevel *AdminLevelSet::GetLevel(uint32_t level) const {
	auto it = levels_.find(level);
	if (it == levels_.end()) {
		return nullptr;
	}
	return it->second.get();
}

PcodeMatch AdminLevelSet::Resolve(uint32_t level, const std::string &country_iso3, const std::string &input,
                                  bool allow_fuzzy, const std::string &context, const std::string &parent) {
	AdminLevel *admin = GetLevel(level);
	if (admin == nullptr) {
		throw duckdb::InvalidInputException("no pcodes registered at admin level %d", static_cast<int32_t>(level));
	}
	return admin->Resolve(country_iso3, input, allow_fuzzy, context, parent);
}

} // namespace pcode
