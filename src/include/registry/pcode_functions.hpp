#pragma once

#include "duckdb.hpp"
#include "duckdb/function/function_set.hpp"

namespace duckdb {

// Collects admin rows into a PCR1 registry blob
AggregateFunctionSet GetBuildPcodeRegistryAggregateSet();

// Collects pcode segment lengths into a PCF1 formats blob
AggregateFunctionSet GetBuildPcodeFormatsAggregateSet();

// Resolves a name or pcode against registry (and optional formats) blobs
ScalarFunctionSet GetResolvePcodeFunctionSet();

ScalarFunction GetNormalizeAdminNameFunction();
ScalarFunction GetRefinedSoundexFunction();
ScalarFunction GetRefinedSoundexDistanceFunction();

} // namespace duckdb
