#include "duckdb.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "phonetic/name_normalizer.hpp"
#include "phonetic/refined_soundex.hpp"
#include "registry/pcode_functions.hpp"

#include <string>

namespace duckdb {

static void NormalizeAdminNameScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	const idx_t count = args.size();
	auto &input = args.data[0];

	UnaryExecutor::Execute<string_t, string_t>(input, result, count, [&](const string_t &val) -> string_t {
		if (val.GetSize() == 0) {
			return StringVector::AddString(result, "");
		}
		return StringVector::AddString(result, phonetic::NormalizeName(val.GetString()));
	});
}

static void RefinedSoundexScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	const idx_t count = args.size();
	auto &input = args.data[0];

	// Reusable encoder instance per chunk
	phonetic::RefinedSoundex encoder;

	UnaryExecutor::Execute<string_t, string_t>(input, result, count, [&](const string_t &val) -> string_t {
		return StringVector::AddString(result, encoder.Encode(val.GetString()));
	});
}

static void RefinedSoundexDistanceScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	const idx_t count = args.size();

	BinaryExecutor::Execute<string_t, string_t, int64_t>(
	    args.data[0], args.data[1], result, count, [&](const string_t &a, const string_t &b) -> int64_t {
		    return phonetic::RefinedSoundexDistance(a.GetString(), b.GetString());
	    });
}

ScalarFunction GetNormalizeAdminNameFunction() {
	return ScalarFunction("normalize_admin_name", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                      NormalizeAdminNameScalar);
}

ScalarFunction GetRefinedSoundexFunction() {
	return ScalarFunction("refined_soundex", {LogicalType::VARCHAR}, LogicalType::VARCHAR, RefinedSoundexScalar);
}

ScalarFunction GetRefinedSoundexDistanceFunction() {
	return ScalarFunction("refined_soundex_distance", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                      LogicalType::BIGINT, RefinedSoundexDistanceScalar);
}

} // namespace duckdb
