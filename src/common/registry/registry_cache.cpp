#include "registry/registry_cache.hpp"
#include "registry/registry_blob.hpp"

#include "duckdb/common/exception.hpp"

namespace duckdb {

static uint64_t HashBlob(const string_t *blob, uint64_t seed) {
	const uint8_t present = blob ? 1 : 0;
	uint64_t hash = FNV1aHash64(&present, 1, seed);
	if (!blob) {
		return hash;
	}
	uint8_t size[8];
	uint64_t len = static_cast<uint64_t>(blob->GetSize());
	for (int i = 0; i < 8; i++) {
		size[i] = static_cast<uint8_t>(len >> (8 * i));
	}
	hash = FNV1aHash64(size, sizeof(size), hash);
	return FNV1aHash64(reinterpret_cast<const uint8_t *>(blob->GetDataUnsafe()), static_cast<size_t>(len), hash);
}

RegistryCache::CacheKey RegistryCache::MakeKey(const string_t &registry, const string_t *formats) {
	return HashBlob(formats, HashBlob(&registry, FNV1A_SEED));
}

std::shared_ptr<pcode::AdminLevelSet> GetOrBuildAdminLevels(RegistryCache &cache, const string_t &registry,
                                                            const string_t *formats) {
	const auto key = RegistryCache::MakeKey(registry, formats);
	auto got = cache.Get(key);
	if (got) {
		return got;
	}

	std::vector<pcode::LeveledAdminRow> rows;
	if (!ParsePCR1(registry, rows)) {
		throw InvalidInputException("resolve_pcode: registry is not a valid PCR1 blob");
	}
	std::vector<pcode::PcodeFormatRow> format_rows;
	if (formats && !ParsePCF1(*formats, format_rows)) {
		throw InvalidInputException("resolve_pcode: formats is not a valid PCF1 blob");
	}

	auto levels = std::make_shared<pcode::AdminLevelSet>();
	levels->Setup(rows, format_rows);
	cache.Put(key, levels);
	return levels;
}

} // namespace duckdb
