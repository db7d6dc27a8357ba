#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pcode/admin_config.hpp"
#include "pcode/code_grammar.hpp"
#include "pcode/country_codes.hpp"
#include "pcode/diagnostics.hpp"
#include "pcode/fuzzy_matcher.hpp"
#include "pcode/length_repair.hpp"
#include "pcode/name_rules.hpp"
#include "pcode/registry.hpp"

namespace pcode {

// Result of resolving one identifier. pcode is empty when nothing matched;
// method is empty for a direct hit.
struct PcodeMatch {
	bool found = false;
	std::string pcode;
	bool exact = false;
	std::string method;
};

// Resolves names and pcodes of one admin level to registered pcodes.
//
// Diagnostics are recorded only when a non-empty context is passed.
class AdminLevel {
public:
	explicit AdminLevel(AdminConfig config, uint32_t admin_level = 1,
	                    std::shared_ptr<const CountryCodes> country_codes = nullptr);

	// Registers rows, optionally keeping only the given (uppercase) ISO3
	// countries. Throws InvalidInputException on a row without country or
	// pcode, or when no row is left to register.
	void Setup(const std::vector<AdminRow> &rows, const std::unordered_set<std::string> &countries = {});

	// Installs pcode segment lengths per country and derives the zero
	// positions from the registered pcodes.
	void LoadPcodeFormats(const std::vector<PcodeFormatRow> &rows);

	// Borrowed registries of levels 1 .. admin_level - 1, in level order.
	// A null entry skips the check for that level.
	void SetParentAdmins(std::vector<const AdminLevel *> parents);

	uint32_t GetAdminLevel(const std::string &country_iso3) const;
	uint32_t AdminLevelNumber() const {
		return admin_level_;
	}
	const Registry &GetRegistry() const {
		return registry_;
	}
	const CodeGrammar *GetGrammar(const std::string &country_iso3) const;

	PcodeMatch Resolve(const std::string &country_iso3, const std::string &input, bool allow_fuzzy = true,
	                   const std::string &context = std::string(), const std::string &parent = std::string());

	// Length repair only; input must already be uppercase.
	PcodeMatch ConvertAdminPcodeLength(const std::string &country_iso3, const std::string &pcode,
	                                   const std::string &context = std::string());
	// Simple length heuristic only, ignoring any loaded grammar.
	PcodeMatch ConvertAdmin1PcodeLength(const std::string &country_iso3, const std::string &pcode,
	                                    const std::string &context = std::string());
	// Fuzzy name stage only.
	PcodeMatch FuzzyPcode(const std::string &country_iso3, const std::string &name,
	                      const std::string &context = std::string(), const std::string &parent = std::string());

	Diagnostics &GetDiagnostics() {
		return diagnostics_;
	}
	void InitMatchesErrors() {
		diagnostics_.Clear();
	}

	std::vector<std::string> OutputMatches() const;
	std::vector<std::string> OutputIgnored() const;
	std::vector<std::string> OutputErrors() const;
	std::vector<std::string> OutputAdminNameMappings() const;
	std::vector<std::string> OutputAdminNameReplacements() const;

private:
	const std::string *LookupNameMapping(const std::string &country_iso3, const std::string &name,
	                                     const std::string &parent) const;
	bool IsParentOf(const std::string &parent, const std::string &pcode) const;
	void LogMatch(const std::string &context, const std::string &country_iso3, const std::string &input,
	              const std::string &pcode, const std::string &method, bool exact);

	AdminConfig config_;
	uint32_t admin_level_;
	std::shared_ptr<const CountryCodes> country_codes_;

	Registry registry_;
	std::unordered_map<std::string, CodeGrammar> grammars_;
	ParentRegistries parents_;

	std::unordered_map<std::string, std::string> name_mappings_;
	std::vector<NameReplacement> replacements_;
	FuzzyMatcher matcher_;

	Diagnostics diagnostics_;
};

} // namespace pcode
