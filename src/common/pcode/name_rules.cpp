#include "pcode/name_rules.hpp"

#include <algorithm>
#include <unordered_map>

namespace pcode {

NameReplacement ParseNameReplacement(const std::string &key, const std::string &to) {
	NameReplacement rule;
	rule.to = to;
	auto sep = key.find(kScopeSeparator);
	if (sep == std::string::npos) {
		rule.from = key;
	} else {
		rule.scope = key.substr(0, sep);
		rule.from = key.substr(sep + 1);
	}
	return rule;
}

// 0 for an unscoped rule, 1 for the country, 2 for the parent; -1 when the rule does not apply.
static int ScopeRank(const NameReplacement &rule, const std::string &country_iso3, const std::string &parent) {
	if (rule.scope.empty()) {
		return 0;
	}
	if (!parent.empty() && rule.scope == parent) {
		return 2;
	}
	if (rule.scope == country_iso3) {
		return 1;
	}
	return -1;
}

std::vector<NameReplacement> SelectReplacements(const std::vector<NameReplacement> &rules,
                                                const std::string &country_iso3, const std::string &parent) {
	std::vector<NameReplacement> selected;
	std::vector<int> ranks;
	std::unordered_map<std::string, size_t> by_from;
	for (const auto &rule : rules) {
		const int rank = ScopeRank(rule, country_iso3, parent);
		if (rank < 0) {
			continue;
		}
		auto it = by_from.find(rule.from);
		if (it == by_from.end()) {
			by_from.emplace(rule.from, selected.size());
			selected.push_back(rule);
			ranks.push_back(rank);
		} else if (rank > ranks[it->second]) {
			selected[it->second] = rule;
			ranks[it->second] = rank;
		}
	}
	return selected;
}

std::string MultipleReplace(const std::string &text, const std::vector<NameReplacement> &rules) {
	std::vector<const NameReplacement *> ordered;
	ordered.reserve(rules.size());
	for (const auto &rule : rules) {
		if (!rule.from.empty()) {
			ordered.push_back(&rule);
		}
	}
	if (ordered.empty()) {
		return text;
	}
	std::stable_sort(ordered.begin(), ordered.end(), [](const NameReplacement *a, const NameReplacement *b) {
		return a->from.size() > b->from.size();
	});

	std::string out;
	out.reserve(text.size());
	size_t pos = 0;
	while (pos < text.size()) {
		const NameReplacement *hit = nullptr;
		for (const auto *rule : ordered) {
			if (text.compare(pos, rule->from.size(), rule->from) == 0) {
				hit = rule;
				break;
			}
		}
		if (hit == nullptr) {
			out.push_back(text[pos++]);
			continue;
		}
		out += hit->to;
		pos += hit->from.size();
	}
	return out;
}

bool ApplyPrefixRewrite(const PrefixRewrite &rewrite, const std::string &name, std::string &out) {
	if (name.compare(0, rewrite.from.size(), rewrite.from) != 0) {
		return false;
	}
	out = rewrite.to + name.substr(rewrite.from.size());
	return true;
}

} // namespace pcode
