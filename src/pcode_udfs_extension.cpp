#define DUCKDB_EXTENSION_MAIN // must precede DuckDB headers
#include "pcode_udfs_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "registry/pcode_functions.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	loader.RegisterFunction(GetBuildPcodeRegistryAggregateSet());
	loader.RegisterFunction(GetBuildPcodeFormatsAggregateSet());
	loader.RegisterFunction(GetResolvePcodeFunctionSet());

	loader.RegisterFunction(GetNormalizeAdminNameFunction());
	loader.RegisterFunction(GetRefinedSoundexFunction());
	loader.RegisterFunction(GetRefinedSoundexDistanceFunction());
}

void PcodeUdfsExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string PcodeUdfsExtension::Name() {
	return "pcode_udfs";
}

std::string PcodeUdfsExtension::Version() const {
	return duckdb::DuckDB::LibraryVersion();
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(pcode_udfs, loader) {
	duckdb::LoadInternal(loader);
}

} // extern "C"
