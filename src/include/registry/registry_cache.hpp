#pragma once
#include "duckdb.hpp"
#include <cstdint>
#include <list>
#include <memory>
#include <unordered_map>

#include "pcode/admin_level_set.hpp"

namespace duckdb {

static constexpr uint64_t FNV1A_SEED = 14695981039346656037ULL;

// FNV-1a 64-bit hash for raw bytes. Pass a previous hash as seed to chain buffers.
inline uint64_t FNV1aHash64(const uint8_t *data, size_t len, uint64_t seed = FNV1A_SEED) {
	static constexpr uint64_t FNV_PRIME = 1099511628211ULL;
	uint64_t hash = seed;
	for (size_t i = 0; i < len; ++i) {
		hash ^= data[i];
		hash *= FNV_PRIME;
	}
	return hash;
}

// LRU of engines built from (registry, formats) blobs, keyed by content hash.
class RegistryCache {
public:
	static constexpr size_t MAX_CACHE_SIZE = 64;
	using CacheKey = uint64_t;
	using CacheValue = std::shared_ptr<pcode::AdminLevelSet>;

private:
	struct CacheItem {
		CacheKey key;
		CacheValue value;
	};
	std::list<CacheItem> lru_list;
	std::unordered_map<CacheKey, typename std::list<CacheItem>::iterator> cache_map;

public:
	// Key for a (registry, formats) pair. Each blob is hashed behind a presence
	// tag and its length, so a null formats blob, an empty one and bytes moved
	// across the two blobs all give different keys.
	static CacheKey MakeKey(const string_t &registry, const string_t *formats);

	CacheValue Get(CacheKey key) {
		auto it = cache_map.find(key);
		if (it == cache_map.end()) {
			return nullptr;
		}
		lru_list.splice(lru_list.begin(), lru_list, it->second);
		return it->second->value;
	}
	void Put(CacheKey key, const CacheValue &value) {
		auto it = cache_map.find(key);
		if (it != cache_map.end()) {
			it->second->value = value;
			lru_list.splice(lru_list.begin(), lru_list, it->second);
			return;
		}
		lru_list.emplace_front(CacheItem {key, value});
		cache_map[key] = lru_list.begin();
		if (cache_map.size() > MAX_CACHE_SIZE) {
			auto &lru = lru_list.back();
			cache_map.erase(lru.key);
			lru_list.pop_back();
		}
	}
	size_t Size() const {
		return cache_map.size();
	}
};

// Parses the blobs into an engine and caches it. formats may be null.
// Throws InvalidInputException when a blob is not a valid image.
std::shared_ptr<pcode::AdminLevelSet> GetOrBuildAdminLevels(RegistryCache &cache, const string_t &registry,
                                                            const string_t *formats);

} // namespace duckdb
