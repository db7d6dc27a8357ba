#pragma once

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pcode/admin_config.hpp"
#include "pcode/admin_level_set.hpp"
#include "pcode/code_grammar.hpp"
#include "pcode/registry.hpp"

namespace pcode_test {

inline std::vector<pcode::AdminRow> Admin1Rows() {
	return {
	    {"YEM", "YE11", "Ibb", ""},
	    {"YEM", "YE12", "Abyan", ""},
	    {"YEM", "YE13", "Amanat Al Asimah", ""},
	    {"YEM", "YE14", "Al Bayda", ""},
	    {"YEM", "YE15", "Al Hodeidah", ""},
	    {"YEM", "YE17", "Hadramawt", ""},
	    {"YEM", "YE20", "Dhamar", ""},
	    {"YEM", "YE24", "Aden", ""},
	    {"YEM", "YE30", "Ad Dali", ""},
	    {"YEM", "YE31", "Raymah", ""},
	    {"NGA", "NG001", "Abia", ""},
	    {"NGA", "NG015", "Federal Capital Territory", ""},
	    {"NGA", "NG025", "Lagos", ""},
	    {"NGA", "NG036", "Zamfara", ""},
	    {"NER", "NER001", "Agadez", ""},
	    {"NER", "NER004", "Maradi", ""},
	    {"NER", "NER008", "Niamey", ""},
	    {"UKR", "UA05", "Vinnytska", ""},
	    {"UKR", "UA46", "Lvivska", ""},
	    {"UKR", "UA74", "Chernihivska", ""},
	    {"UKR", "UA80", "Kyivska", ""},
	    {"ZWE", "ZW10", "Bulawayo", ""},
	    {"ZWE", "ZW19", "Harare", ""},
	    {"SOM", "SO11", "Awdal", ""},
	    {"SOM", "SO24", "Bay", ""},
	    {"SOM", "SO27", "Middle Juba", ""},
	    {"DZA", "DZ009", "Blida", ""},
	    {"DZA", "DZ016", "Alger", ""},
	    {"COL", "CO05", "Antioquia", ""},
	    {"COL", "CO08", "Atlantico", ""},
	    {"COL", "CO11", "Bogota", ""},
	};
}

inline std::vector<pcode::AdminRow> Admin2Rows() {
	return {
	    {"YEM", "YE1101", "Al Qafr", "YE11"},
	    {"YEM", "YE1102", "Yarim", "YE11"},
	    {"YEM", "YE3001", "Juban", "YE30"},
	    {"YEM", "YE3002", "Damt", "YE30"},
	    {"NGA", "NG001001", "Aba North", "NG001"},
	    {"NGA", "NG015001", "Abaji", "NG015"},
	    {"NGA", "NG015002", "Abuja Municipal", "NG015"},
	    {"NGA", "NG036014", "Talata Mafara", "NG036"},
	    {"NER", "NER001001", "Aderbissinat", "NER001"},
	    {"NER", "NER004009", "Mayahi", "NER004"},
	    {"NER", "NER008001", "Niamey 1", "NER008"},
	    {"DZA", "DZ009009", "Boufarik", "DZ009"},
	    {"DZA", "DZ016001", "Alger Centre", "DZ016"},
	    {"COL", "CO05001", "Medellin", "CO05"},
	    {"COL", "CO08849", "Usiacuri", "CO08"},
	    {"COL", "CO11001", "Bogota", "CO11"},
	};
}

// Admin 2 rows whose parent column drives parent-scoped name matching.
inline std::vector<pcode::AdminRow> ParentRows() {
	return {
	    {"AFG", "AF0101", "Kabul", "AF01"},       {"AFG", "AF0102", "Paghman", "AF01"},
	    {"AFG", "AF0201", "Kabul", "AF02"},       {"AFG", "AF0202", "Khost", "AF02"},
	    {"AFG", "AF0301", "Charikar", "AF03"},    {"AFG", "AF0401", "Maydan Shahr", "AF04"},
	    {"AFG", "AF0501", "Pul-e-Alam", "AF05"},  {"COD", "CD1901", "Bandundu", "CD19"},
	    {"COD", "CD2001", "Matadi", "CD20"},      {"COD", "CD2013", "Mbanza-Ngungu", "CD20"},
	    {"COD", "CD3102", "Kenge", "CD31"},       {"MWI", "MW305", "Blantyre", "MW3"},
	};
}

inline std::vector<pcode::PcodeFormatRow> Formats() {
	return {
	    {"YEM", {2, 2, 2}}, {"NGA", {2, 3, 3}}, {"NER", {3, 3, 3}}, {"DZA", {2, 3, 3}}, {"COL", {2, 2, 3}},
	};
}

inline std::vector<pcode::LeveledAdminRow> LeveledRows() {
	std::vector<pcode::LeveledAdminRow> rows;
	for (const auto &row : Admin1Rows()) {
		rows.push_back({1, row});
	}
	for (const auto &row : Admin2Rows()) {
		rows.push_back({2, row});
	}
	return rows;
}

inline std::vector<std::pair<std::string, std::string>> Replacements() {
	return {
	    {" urban", ""},   {"sud", "south"}, {"ouest", "west"},  {"est", "east"},        {"nord", "north"},
	    {"'", ""},        {"/", " "},       {".", " "},         {" region", ""},        {" oblast", ""},
	};
}

inline pcode::AdminConfig Admin1Config() {
	pcode::AdminConfig config;
	config.countries_fuzzy_try = std::unordered_set<std::string> {"YEM", "NGA", "NER", "UKR", "SOM"};
	config.admin_name_mappings = {
	    {"FCT (Abuja)", "NG015"},
	    {"Juba Dhexe", "SO27"},
	    {"CU Niamey", "NER008"},
	};
	config.admin_name_replacements = Replacements();
	config.admin_fuzzy_dont = {"nord"};
	return config;
}

inline pcode::AdminConfig ParentConfig() {
	pcode::AdminConfig config;
	config.admin_name_mappings = {
	    {"MyMapping", "AF0301"},
	    {"AFG|MyMapping2", "AF0401"},
	    {"AF05|MyMapping3", "AF0501"},
	};
	config.admin_name_replacements = {{" city", ""}};
	return config;
}

} // namespace pcode_test
