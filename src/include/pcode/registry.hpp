#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pcode {

// One parsed registry row. parent is empty when the source has no parent column.
struct AdminRow {
	std::string country_iso3;
	std::string pcode;
	std::string name;
	std::string parent;
};

// Normalized name -> pcode, iterated in insertion order. The first pcode
// inserted for a name is kept.
class NameIndex {
public:
	using Entry = std::pair<std::string, std::string>;

	bool Insert(const std::string &name, const std::string &pcode);
	const std::string *Find(const std::string &name) const;

	const std::vector<Entry> &Entries() const {
		return entries_;
	}
	size_t Size() const {
		return entries_.size();
	}

private:
	std::vector<Entry> entries_;
	std::unordered_map<std::string, size_t> index_;
};

// All pcodes known at one admin level, with their names, countries and parents.
class Registry {
public:
	// Re-registering a pcode replaces its name, country and parent.
	void Register(const std::string &country_iso3, const std::string &pcode, const std::string &name,
	              const std::string &parent = std::string());
	void Register(const AdminRow &row) {
		Register(row.country_iso3, row.pcode, row.name, row.parent);
	}

	// Lookups return nullptr when the key is unknown.
	const std::string *LookupExact(const std::string &pcode) const;
	const std::string *LookupByCountryName(const std::string &country_iso3, const std::string &normalized_name) const;
	const std::string *LookupByParentName(const std::string &country_iso3, const std::string &parent,
	                                      const std::string &normalized_name) const;

	bool HasPcode(const std::string &pcode) const;
	bool HasCountry(const std::string &country_iso3) const;
	const std::string *CountryOf(const std::string &pcode) const;
	// nullptr when the pcode is unknown or was registered without a parent.
	const std::string *ParentOf(const std::string &pcode) const;

	// Length of the pcodes registered for the country; 0 when none.
	size_t PcodeLength(const std::string &country_iso3) const;

	const NameIndex *NameMap(const std::string &country_iso3) const;
	const NameIndex *ParentNameMap(const std::string &country_iso3, const std::string &parent) const;

	// All pcodes in registration order.
	const std::vector<std::string> &Pcodes() const {
		return pcodes_;
	}
	// Countries in order of their first registered pcode.
	std::vector<std::string> Countries() const;
	bool Empty() const {
		return pcodes_.empty();
	}
	bool UsesParents() const {
		return !parent_name_to_pcode_.empty();
	}

private:
	struct Entry {
		std::string name;
		std::string country_iso3;
		std::string parent;
	};

	std::vector<std::string> pcodes_;
	std::unordered_map<std::string, Entry> entries_;
	std::unordered_map<std::string, NameIndex> name_to_pcode_;
	std::unordered_map<std::string, std::unordered_map<std::string, NameIndex>> parent_name_to_pcode_;
	std::unordered_map<std::string, size_t> pcode_lengths_;
};

} // namespace pcode
