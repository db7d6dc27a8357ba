#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "pcode/admin_config.hpp"
#include "pcode/admin_level.hpp"

namespace pcode {

struct LeveledAdminRow {
	uint32_t admin_level = 1;
	AdminRow row;
};

// One AdminLevel per admin level found in the rows. Each level borrows the
// registries of the levels above it; ISO2 codes learned from any level are
// shared by all of them.
class AdminLevelSet {
public:
	explicit AdminLevelSet(AdminConfig config = AdminConfig());

	// Throws InvalidInputException on a row at level 0, an empty country or
	// pcode, or when there are no rows.
	void Setup(const std::vector<LeveledAdminRow> &rows, const std::vector<PcodeFormatRow> &formats = {});

	uint32_t MaxLevel() const;
	// nullptr when no row was registered at that level.
	AdminLevel *GetLevel(uint32_t level);
	const AdminLevel *GetLevel(uint32_t level) const;

	PcodeMatch Resolve(uint32_t level, const std::string &country_iso3, const std::string &input,
	                   bool allow_fuzzy = true, const std::string &context = std::string(),
	                   const std::string &parent = std::string());

private:
	AdminConfig config_;
	std::shared_ptr<CountryCodeTable> country_codes_;
	std::map<uint32_t, std::unique_ptr<AdminLevel>> levels_;
};

} // namespace pcode
