#include "pcode/registry.hpp"
#include "phonetic/name_normalizer.hpp"

#include <unordered_set>

namespace pcode {

bool NameIndex::Insert(const std::string &name, const std::string &pcode) {
	auto it = index_.find(name);
	if (it != index_.end()) {
		return false;
	}
	index_.emplace(name, entries_.size());
	entries_.emplace_back(name, pcode);
	return true;
}

const std::string *NameIndex::Find(const std::string &name) const {
	auto it = index_.find(name);
	if (it == index_.end()) {
		return nullptr;
	}
	return &entries_[it->second].second;
}

void Registry::Register(const std::string &country_iso3, const std::string &pcode, const std::string &name,
                        const std::string &parent) {
	auto it = entries_.find(pcode);
	if (it == entries_.end()) {
		pcodes_.push_back(pcode);
		entries_.emplace(pcode, Entry {name, country_iso3, parent});
	} else {
		it->second = Entry {name, country_iso3, parent};
	}
	pcode_lengths_[country_iso3] = pcode.size();

	const std::string key = phonetic::NormalizeName(name);
	name_to_pcode_[country_iso3].Insert(key, pcode);
	if (!parent.empty()) {
		parent_name_to_pcode_[country_iso3][parent].Insert(key, pcode);
	}
}

const std::string *Registry::LookupExact(const std::string &pcode) const {
	auto it = entries_.find(pcode);
	if (it == entries_.end()) {
		return nullptr;
	}
	return &it->second.name;
}

const std::string *Registry::LookupByCountryName(const std::string &country_iso3,
                                                 const std::string &normalized_name) const {
	const NameIndex *names = NameMap(country_iso3);
	if (names == nullptr) {
		return nullptr;
	}
	return names->Find(normalized_name);
}

const std::string *Registry::LookupByParentName(const std::string &country_iso3, const std::string &parent,
                                                const std::string &normalized_name) const {
	const NameIndex *names = ParentNameMap(country_iso3, parent);
	if (names == nullptr) {
		return nullptr;
	}
	return names->Find(normalized_name);
}

bool Registry::HasPcode(const std::string &pcode) const {
	return entries_.find(pcode) != entries_.end();
}

bool Registry::HasCountry(const std::string &country_iso3) const {
	return pcode_lengths_.find(country_iso3) != pcode_lengths_.end();
}

const std::string *Registry::CountryOf(const std::string &pcode) const {
	auto it = entries_.find(pcode);
	if (it == entries_.end()) {
		return nullptr;
	}
	return &it->second.country_iso3;
}

const std::string *Registry::ParentOf(const std::string &pcode) const {
	auto it = entries_.find(pcode);
	if (it == entries_.end() || it->second.parent.empty()) {
		return nullptr;
	}
	return &it->second.parent;
}

size_t Registry::PcodeLength(const std::string &country_iso3) const {
	auto it = pcode_lengths_.find(country_iso3);
	if (it == pcode_lengths_.end()) {
		return 0;
	}
	return it->second;
}

std::vector<std::string> Registry::Countries() const {
	std::vector<std::string> countries;
	std::unordered_set<std::string> seen;
	for (const auto &code : pcodes_) {
		const std::string &country = entries_.at(code).country_iso3;
		if (seen.insert(country).second) {
			countries.push_back(country);
		}
	}
	return countries;
}

const NameIndex *Registry::NameMap(const std::string &country_iso3) const {
	auto it = name_to_pcode_.find(country_iso3);
	if (it == name_to_pcode_.end()) {
		return nullptr;
	}
	return &it->second;
}

const NameIndex *Registry::ParentNameMap(const std::string &country_iso3, const std::string &parent) const {
	auto cit = parent_name_to_pcode_.find(country_iso3);
	if (cit == parent_name_to_pcode_.end()) {
		return nullptr;
	}
	auto pit = cit->second.find(parent);
	if (pit == cit->second.end()) {
		return nullptr;
	}
	return &pit->second;
}

} // namespace pcode
