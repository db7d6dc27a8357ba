#include "pcode/country_codes.hpp"
#include "pcode/code_grammar.hpp"
#include "pcode/registry.hpp"

namespace pcode {

void CountryCodeTable::Add(const std::string &iso3, const std::string &iso2) {
	iso3_to_iso2_[iso3] = iso2;
}

std::string CountryCodeTable::Iso2(const std::string &iso3) const {
	auto it = iso3_to_iso2_.find(iso3);
	if (it != iso3_to_iso2_.end()) {
		return it->second;
	}
	auto git = guessed_.find(iso3);
	if (git != guessed_.end()) {
		return git->second;
	}
	return std::string();
}

void CountryCodeTable::LearnFromRegistry(const Registry &registry) {
	std::string letters;
	std::string digits;
	for (const auto &code : registry.Pcodes()) {
		const std::string *country = registry.CountryOf(code);
		if (country == nullptr || iso3_to_iso2_.count(*country) > 0) {
			continue;
		}
		if (!SplitPcode(code, letters, digits)) {
			continue;
		}
		if (letters.size() == 2) {
			iso3_to_iso2_[*country] = letters;
			guessed_.erase(*country);
		} else if (country->size() >= 2 && guessed_.count(*country) == 0) {
			guessed_[*country] = country->substr(0, 2);
		}
	}
}

} // namespace pcode
