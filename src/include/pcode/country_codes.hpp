#pragma once

#include <string>
#include <unordered_map>

namespace pcode {

class Registry;

// Country-code metadata needed to rewrite the letter segment of a pcode.
class CountryCodes {
public:
	virtual ~CountryCodes() = default;

	// ISO2 form of an ISO3 code, or an empty string when unknown.
	virtual std::string Iso2(const std::string &iso3) const = 0;
};

class CountryCodeTable : public CountryCodes {
public:
	void Add(const std::string &iso3, const std::string &iso2);
	std::string Iso2(const std::string &iso3) const override;

	// Learns ISO2 codes from the letter prefix of registered two-letter
	// pcodes. A country seen only with three-letter pcodes gets the first two
	// letters of its ISO3 code until a real prefix is added or learned.
	void LearnFromRegistry(const Registry &registry);

private:
	std::unordered_map<std::string, std::string> iso3_to_iso2_;
	std::unordered_map<std::string, std::string> guessed_;
};

} // namespace pcode
