#include "registry/registry_blob.hpp"
#include <limits>
#include <utility>

namespace duckdb {

static inline void W32(std::vector<uint8_t> &buf, uint32_t v) {
	buf.push_back((uint8_t)(v & 0xFF));
	buf.push_back((uint8_t)((v >> 8) & 0xFF));
	buf.push_back((uint8_t)((v >> 16) & 0xFF));
	buf.push_back((uint8_t)((v >> 24) & 0xFF));
}
static inline void WStr(std::vector<uint8_t> &buf, const std::string &s) {
	W32(buf, (uint32_t)s.size());
	buf.insert(buf.end(), s.begin(), s.end());
}
static inline void WHeader(std::vector<uint8_t> &buf, uint32_t magic, size_t rows) {
	W32(buf, magic);
	buf.push_back(0x00);
	W32(buf, (uint32_t)rows);
}

void SerializePCR1(const std::vector<pcode::LeveledAdminRow> &rows, std::vector<uint8_t> &buf) {
	WHeader(buf, PCR1_MAGIC, rows.size());
	for (const auto &leveled : rows) {
		W32(buf, leveled.admin_level);
		WStr(buf, leveled.row.country_iso3);
		WStr(buf, leveled.row.pcode);
		WStr(buf, leveled.row.name);
		WStr(buf, leveled.row.parent);
	}
}

void SerializePCF1(const std::vector<pcode::PcodeFormatRow> &rows, std::vector<uint8_t> &buf) {
	WHeader(buf, PCF1_MAGIC, rows.size());
	for (const auto &row : rows) {
		WStr(buf, row.country_iso3);
		W32(buf, (uint32_t)row.lengths.size());
		for (auto len : row.lengths) {
			W32(buf, (uint32_t)len);
		}
	}
}

struct ParseCursor {
	const uint8_t *p;
	const uint8_t *end;
};

static inline bool ReadU32(ParseCursor &c, uint32_t &out) {
	if (DUCKDB_UNLIKELY(c.end - c.p < 4)) {
		return false;
	}
	out = (uint32_t)c.p[0] | ((uint32_t)c.p[1] << 8) | ((uint32_t)c.p[2] << 16) | ((uint32_t)c.p[3] << 24);
	c.p += 4;
	return true;
}
static inline bool ReadString(ParseCursor &c, std::string &s) {
	uint32_t len = 0;
	if (!ReadU32(c, len)) {
		return false;
	}
	if (DUCKDB_UNLIKELY((uint64_t)(c.end - c.p) < len)) {
		return false;
	}
	s.assign(reinterpret_cast<const char *>(c.p), len);
	c.p += len;
	return true;
}

// Reads magic, flags and row count.
static bool ReadHeader(ParseCursor &c, uint32_t expected_magic, uint32_t &rows) {
	uint32_t magic = 0;
	if (!ReadU32(c, magic) || magic != expected_magic) {
		return false;
	}
	if (DUCKDB_UNLIKELY(c.p >= c.end)) {
		return false;
	}
	uint8_t flags = *c.p++;
	if (flags != 0x00) {
		return false;
	}
	return ReadU32(c, rows);
}

bool ParsePCR1(const string_t &blob, std::vector<pcode::LeveledAdminRow> &rows_out) {
	auto data_ptr = reinterpret_cast<const uint8_t *>(blob.GetDataUnsafe());
	ParseCursor cur {data_ptr, data_ptr + blob.GetSize()};

	uint32_t nrows = 0;
	if (!ReadHeader(cur, PCR1_MAGIC, nrows)) {
		return false;
	}
	rows_out.clear();
	for (uint32_t i = 0; i < nrows; ++i) {
		pcode::LeveledAdminRow leveled;
		if (!ReadU32(cur, leveled.admin_level)) {
			return false;
		}
		if (!ReadString(cur, leveled.row.country_iso3) || !ReadString(cur, leveled.row.pcode) ||
		    !ReadString(cur, leveled.row.name) || !ReadString(cur, leveled.row.parent)) {
			return false;
		}
		rows_out.push_back(std::move(leveled));
	}

	// Strict consumption (fail on trailing bytes)
	return cur.p == cur.end;
}

bool ParsePCF1(const string_t &blob, std::vector<pcode::PcodeFormatRow> &rows_out) {
	auto data_ptr = reinterpret_cast<const uint8_t *>(blob.GetDataUnsafe());
	ParseCursor cur {data_ptr, data_ptr + blob.GetSize()};

	uint32_t nrows = 0;
	if (!ReadHeader(cur, PCF1_MAGIC, nrows)) {
		return false;
	}
	rows_out.clear();
	for (uint32_t i = 0; i < nrows; ++i) {
		pcode::PcodeFormatRow row;
		uint32_t nlengths = 0;
		if (!ReadString(cur, row.country_iso3) || !ReadU32(cur, nlengths)) {
			return false;
		}
		if ((uint64_t)(cur.end - cur.p) < (uint64_t)nlengths * 4) {
			return false;
		}
		row.lengths.reserve(nlengths);
		for (uint32_t k = 0; k < nlengths; ++k) {
			uint32_t len = 0;
			if (!ReadU32(cur, len) || len > (uint32_t)std::numeric_limits<int32_t>::max()) {
				return false;
			}
			row.lengths.push_back((int32_t)len);
		}
		rows_out.push_back(std::move(row));
	}

	return cur.p == cur.end;
}

} // namespace duckdb
