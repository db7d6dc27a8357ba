#include <gtest/gtest.h>

#include "duckdb/common/exception.hpp"
#include "pcode_fixtures.hpp"
#include "registry/registry_blob.hpp"
#include "registry/registry_cache.hpp"

#include <limits>

namespace {

using duckdb::string_t;

string_t AsBlob(const std::vector<uint8_t> &buf) {
	return string_t(reinterpret_cast<const char *>(buf.data()), static_cast<uint32_t>(buf.size()));
}

std::vector<uint8_t> RegistryImage() {
	std::vector<uint8_t> buf;
	duckdb::SerializePCR1(pcode_test::LeveledRows(), buf);
	return buf;
}

std::vector<uint8_t> FormatsImage() {
	std::vector<uint8_t> buf;
	duckdb::SerializePCF1(pcode_test::Formats(), buf);
	return buf;
}

TEST(RegistryBlobTest, RegistryImageKeepsEveryRow) {
	const auto buf = RegistryImage();
	// magic, flags, count
	ASSERT_GE(buf.size(), 9u);
	EXPECT_EQ(buf[0], 'P');
	EXPECT_EQ(buf[1], 'C');
	EXPECT_EQ(buf[2], 'R');
	EXPECT_EQ(buf[3], '1');
	EXPECT_EQ(buf[4], 0);

	std::vector<pcode::LeveledAdminRow> rows;
	ASSERT_TRUE(duckdb::ParsePCR1(AsBlob(buf), rows));
	const auto expected = pcode_test::LeveledRows();
	ASSERT_EQ(rows.size(), expected.size());
	for (size_t i = 0; i < rows.size(); i++) {
		EXPECT_EQ(rows[i].admin_level, expected[i].admin_level);
		EXPECT_EQ(rows[i].row.country_iso3, expected[i].row.country_iso3);
		EXPECT_EQ(rows[i].row.pcode, expected[i].row.pcode);
		EXPECT_EQ(rows[i].row.name, expected[i].row.name);
		EXPECT_EQ(rows[i].row.parent, expected[i].row.parent);
	}
}

TEST(RegistryBlobTest, FormatsImageKeepsEveryRow) {
	const auto buf = FormatsImage();
	EXPECT_EQ(buf[3], '1');
	EXPECT_EQ(buf[2], 'F');

	std::vector<pcode::PcodeFormatRow> rows;
	ASSERT_TRUE(duckdb::ParsePCF1(AsBlob(buf), rows));
	const auto expected = pcode_test::Formats();
	ASSERT_EQ(rows.size(), expected.size());
	for (size_t i = 0; i < rows.size(); i++) {
		EXPECT_EQ(rows[i].country_iso3, expected[i].country_iso3);
		EXPECT_EQ(rows[i].lengths, expected[i].lengths);
	}
}

TEST(RegistryBlobTest, RejectsMalformedImages) {
	std::vector<pcode::LeveledAdminRow> rows;
	std::vector<pcode::PcodeFormatRow> formats;

	// Each image only parses as its own kind.
	EXPECT_FALSE(duckdb::ParsePCR1(AsBlob(FormatsImage()), rows));
	EXPECT_FALSE(duckdb::ParsePCF1(AsBlob(RegistryImage()), formats));

	auto trailing = RegistryImage();
	trailing.push_back(0);
	EXPECT_FALSE(duckdb::ParsePCR1(AsBlob(trailing), rows));

	auto truncated = RegistryImage();
	truncated.pop_back();
	EXPECT_FALSE(duckdb::ParsePCR1(AsBlob(truncated), rows));

	auto flagged = RegistryImage();
	flagged[4] = 1;
	EXPECT_FALSE(duckdb::ParsePCR1(AsBlob(flagged), rows));

	const std::vector<uint8_t> header_only {'P', 'C', 'R', '1', 0};
	EXPECT_FALSE(duckdb::ParsePCR1(AsBlob(header_only), rows));
	EXPECT_FALSE(duckdb::ParsePCR1(AsBlob(std::vector<uint8_t>()), rows));

	// Segment length that does not fit an INTEGER.
	std::vector<uint8_t> big;
	duckdb::SerializePCF1({{"NGA", {2, std::numeric_limits<int32_t>::max()}}}, big);
	ASSERT_TRUE(duckdb::ParsePCF1(AsBlob(big), formats));
	big[big.size() - 1] = 0xFF;
	EXPECT_FALSE(duckdb::ParsePCF1(AsBlob(big), formats));
}

TEST(RegistryBlobTest, EmptyImagesParse) {
	std::vector<uint8_t> buf;
	duckdb::SerializePCR1({}, buf);
	EXPECT_EQ(buf.size(), 9u);
	std::vector<pcode::LeveledAdminRow> rows;
	ASSERT_TRUE(duckdb::ParsePCR1(AsBlob(buf), rows));
	EXPECT_TRUE(rows.empty());
}

TEST(RegistryCacheTest, Fnv1aHash) {
	EXPECT_EQ(duckdb::FNV1aHash64(nullptr, 0), duckdb::FNV1A_SEED);
	const uint8_t a = 'a';
	EXPECT_EQ(duckdb::FNV1aHash64(&a, 1), 0xaf63dc4c8601ec8cULL);

	const uint8_t ab[] = {'a', 'b'};
	const uint8_t b = 'b';
	EXPECT_EQ(duckdb::FNV1aHash64(ab, 2), duckdb::FNV1aHash64(&b, 1, duckdb::FNV1aHash64(&a, 1)));
}

TEST(RegistryCacheTest, EvictsLeastRecentlyUsed) {
	duckdb::RegistryCache cache;
	auto value = std::make_shared<pcode::AdminLevelSet>();
	for (uint64_t key = 0; key < duckdb::RegistryCache::MAX_CACHE_SIZE; key++) {
		cache.Put(key, value);
	}
	// Touch key 0 so that key 1 is the oldest.
	EXPECT_EQ(cache.Get(0), value);
	cache.Put(1000, value);
	EXPECT_EQ(cache.Size(), duckdb::RegistryCache::MAX_CACHE_SIZE);
	EXPECT_EQ(cache.Get(1), nullptr);
	EXPECT_EQ(cache.Get(0), value);
	EXPECT_EQ(cache.Get(1000), value);
}

TEST(RegistryCacheTest, BuildsOncePerImage) {
	duckdb::RegistryCache cache;
	const auto registry = RegistryImage();
	const auto formats = FormatsImage();
	const string_t registry_blob = AsBlob(registry);
	const string_t formats_blob = AsBlob(formats);

	auto plain = duckdb::GetOrBuildAdminLevels(cache, registry_blob, nullptr);
	ASSERT_NE(plain, nullptr);
	EXPECT_EQ(plain->MaxLevel(), 2u);
	EXPECT_EQ(duckdb::GetOrBuildAdminLevels(cache, registry_blob, nullptr), plain);

	auto with_formats = duckdb::GetOrBuildAdminLevels(cache, registry_blob, &formats_blob);
	EXPECT_NE(with_formats, plain);
	EXPECT_EQ(cache.Size(), 2u);

	EXPECT_FALSE(plain->Resolve(2, "YEM", "YEM03001").found);
	EXPECT_EQ(with_formats->Resolve(2, "YEM", "YEM03001").pcode, "YE3001");
}

TEST(RegistryCacheTest, KeySeparatesBlobBoundaries) {
	const auto registry = RegistryImage();
	const auto formats = FormatsImage();
	const string_t registry_blob = AsBlob(registry);
	const string_t formats_blob = AsBlob(formats);
	const string_t empty_blob("", 0);

	std::vector<uint8_t> joined = registry;
	joined.insert(joined.end(), formats.begin(), formats.end());
	const string_t joined_blob = AsBlob(joined);

	const auto plain = duckdb::RegistryCache::MakeKey(registry_blob, nullptr);
	EXPECT_EQ(plain, duckdb::RegistryCache::MakeKey(registry_blob, nullptr));
	EXPECT_NE(plain, duckdb::RegistryCache::MakeKey(registry_blob, &empty_blob));
	EXPECT_NE(duckdb::RegistryCache::MakeKey(registry_blob, &formats_blob),
	          duckdb::RegistryCache::MakeKey(joined_blob, nullptr));
	EXPECT_NE(duckdb::RegistryCache::MakeKey(registry_blob, &formats_blob),
	          duckdb::RegistryCache::MakeKey(joined_blob, &empty_blob));
}

TEST(RegistryCacheTest, EmptyFormatsThrowOnAWarmCache) {
	duckdb::RegistryCache cache;
	const auto registry = RegistryImage();
	const string_t registry_blob = AsBlob(registry);
	const string_t empty_blob("", 0);

	ASSERT_NE(duckdb::GetOrBuildAdminLevels(cache, registry_blob, nullptr), nullptr);
	EXPECT_THROW(duckdb::GetOrBuildAdminLevels(cache, registry_blob, &empty_blob), duckdb::InvalidInputException);
	EXPECT_EQ(cache.Size(), 1u);
}

TEST(RegistryCacheTest, InvalidImagesThrow) {
	duckdb::RegistryCache cache;
	const auto formats = FormatsImage();
	const auto registry = RegistryImage();
	EXPECT_THROW(duckdb::GetOrBuildAdminLevels(cache, AsBlob(formats), nullptr), duckdb::InvalidInputException);

	const string_t registry_as_formats = AsBlob(registry);
	EXPECT_THROW(duckdb::GetOrBuildAdminLevels(cache, AsBlob(registry), &registry_as_formats),
	             duckdb::InvalidInputException);

	std::vector<uint8_t> empty;
	duckdb::SerializePCR1({}, empty);
	EXPECT_THROW(duckdb::GetOrBuildAdminLevels(cache, AsBlob(empty), nullptr), duckdb::InvalidInputException);
	EXPECT_EQ(cache.Size(), 0u);
}

} // namespace
