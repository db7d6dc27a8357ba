#pragma once
#include "duckdb.hpp"
#include <cstdint>
#include <string>
#include <vector>

#include "pcode/admin_level_set.hpp"
#include "pcode/code_grammar.hpp"

namespace duckdb {

// ---- On-disk format constants ----
static constexpr uint32_t PCR1_MAGIC = 0x31524350u; // 'PCR1'
static constexpr uint32_t PCF1_MAGIC = 0x31464350u; // 'PCF1'

// Layout (little-endian):
//   u32 magic, u8 flags (always 0), u32 row count, rows...
// PCR1 row: u32 level, str country, str pcode, str name, str parent
// PCF1 row: str country, u32 count, u32 lengths...
// where str is u32 byte length followed by the bytes.

void SerializePCR1(const std::vector<pcode::LeveledAdminRow> &rows, std::vector<uint8_t> &buf);
void SerializePCF1(const std::vector<pcode::PcodeFormatRow> &rows, std::vector<uint8_t> &buf);

// ---- Parsers ----
// Return false if the blob is not a valid image; rows_out is then unspecified.
bool ParsePCR1(const string_t &blob, std::vector<pcode::LeveledAdminRow> &rows_out);
bool ParsePCF1(const string_t &blob, std::vector<pcode::PcodeFormatRow> &rows_out);

} // namespace duckdb
