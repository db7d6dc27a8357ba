#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "registry/pcode_functions.hpp"
#include "registry/registry_cache.hpp"

#include <memory>
#include <string>

namespace duckdb {

struct ResolvePcodeLocalState : public FunctionLocalState {
	RegistryCache cache;
};

static unique_ptr<FunctionLocalState> ResolvePcodeInitLocal(ExpressionState & /*state*/,
                                                            const BoundFunctionExpression & /*expr*/,
                                                            FunctionData * /*bind_data*/) {
	return make_uniq<ResolvePcodeLocalState>();
}

// Arguments: registry BLOB, country VARCHAR, input VARCHAR
//            [, allow_fuzzy BOOLEAN [, formats BLOB [, parent VARCHAR]]]
// NULL optional arguments fall back to their defaults.
static void ResolvePcodeExec(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &local = ExecuteFunctionState::GetFunctionState(state)->Cast<ResolvePcodeLocalState>();
	const idx_t count = args.size();
	const idx_t ncols = args.ColumnCount();

	// Output struct children: pcode VARCHAR, exact BOOLEAN, method VARCHAR
	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto &fields = StructVector::GetEntries(result);
	D_ASSERT(fields.size() == 3);
	auto &pcode_vec = *fields[0];
	auto &exact_vec = *fields[1];
	auto &method_vec = *fields[2];
	auto pcode_out = FlatVector::GetData<string_t>(pcode_vec);
	auto exact_out = FlatVector::GetData<bool>(exact_vec);
	auto method_out = FlatVector::GetData<string_t>(method_vec);

	UnifiedVectorFormat reg_uvf;
	UnifiedVectorFormat country_uvf;
	UnifiedVectorFormat input_uvf;
	args.data[0].ToUnifiedFormat(count, reg_uvf);
	args.data[1].ToUnifiedFormat(count, country_uvf);
	args.data[2].ToUnifiedFormat(count, input_uvf);
	auto reg_vals = UnifiedVectorFormat::GetData<string_t>(reg_uvf);
	auto country_vals = UnifiedVectorFormat::GetData<string_t>(country_uvf);
	auto input_vals = UnifiedVectorFormat::GetData<string_t>(input_uvf);

	const bool has_fuzzy = ncols >= 4;
	UnifiedVectorFormat fuzzy_uvf;
	const bool *fuzzy_vals = nullptr;
	if (has_fuzzy) {
		args.data[3].ToUnifiedFormat(count, fuzzy_uvf);
		fuzzy_vals = UnifiedVectorFormat::GetData<bool>(fuzzy_uvf);
	}

	const bool has_formats = ncols >= 5;
	UnifiedVectorFormat formats_uvf;
	const string_t *formats_vals = nullptr;
	if (has_formats) {
		args.data[4].ToUnifiedFormat(count, formats_uvf);
		formats_vals = UnifiedVectorFormat::GetData<string_t>(formats_uvf);
	}

	const bool has_parent = ncols >= 6;
	UnifiedVectorFormat parent_uvf;
	const string_t *parent_vals = nullptr;
	if (has_parent) {
		args.data[5].ToUnifiedFormat(count, parent_uvf);
		parent_vals = UnifiedVectorFormat::GetData<string_t>(parent_uvf);
	}

	for (idx_t i = 0; i < count; ++i) {
		const auto rrid = reg_uvf.sel->get_index(i);
		const auto crid = country_uvf.sel->get_index(i);
		const auto irid = input_uvf.sel->get_index(i);
		if (!reg_uvf.validity.RowIsValid(rrid) || !country_uvf.validity.RowIsValid(crid) ||
		    !input_uvf.validity.RowIsValid(irid)) {
			FlatVector::SetNull(result, i, true);
			continue;
		}

		bool allow_fuzzy = true;
		if (has_fuzzy) {
			const auto fid = fuzzy_uvf.sel->get_index(i);
			if (fuzzy_uvf.validity.RowIsValid(fid)) {
				allow_fuzzy = fuzzy_vals[fid];
			}
		}
		const string_t *formats = nullptr;
		if (has_formats) {
			const auto fid = formats_uvf.sel->get_index(i);
			if (formats_uvf.validity.RowIsValid(fid)) {
				formats = &formats_vals[fid];
			}
		}
		std::string parent;
		if (has_parent) {
			const auto pid = parent_uvf.sel->get_index(i);
			if (parent_uvf.validity.RowIsValid(pid)) {
				parent = parent_vals[pid].GetString();
			}
		}

		auto levels = GetOrBuildAdminLevels(local.cache, reg_vals[rrid], formats);
		const pcode::PcodeMatch match = levels->Resolve(levels->MaxLevel(), country_vals[crid].GetString(),
		                                                input_vals[irid].GetString(), allow_fuzzy, std::string(),
		                                                parent);

		FlatVector::SetNull(result, i, false);
		if (match.found) {
			pcode_out[i] = StringVector::AddString(pcode_vec, match.pcode);
		} else {
			FlatVector::SetNull(pcode_vec, i, true);
		}
		exact_out[i] = match.exact;
		if (match.method.empty()) {
			FlatVector::SetNull(method_vec, i, true);
		} else {
			method_out[i] = StringVector::AddString(method_vec, match.method);
		}
	}
}

ScalarFunctionSet GetResolvePcodeFunctionSet() {
	ScalarFunctionSet set("resolve_pcode");

	child_list_t<LogicalType> children;
	children.emplace_back("pcode", LogicalType::VARCHAR);
	children.emplace_back("exact", LogicalType::BOOLEAN);
	children.emplace_back("method", LogicalType::VARCHAR);
	LogicalType out_type = LogicalType::STRUCT(std::move(children));

	vector<LogicalType> arguments {LogicalType::BLOB, LogicalType::VARCHAR, LogicalType::VARCHAR};
	const vector<LogicalType> optional {LogicalType::BOOLEAN, LogicalType::BLOB, LogicalType::VARCHAR};
	for (idx_t extra = 0; extra <= optional.size(); ++extra) {
		if (extra > 0) {
			arguments.push_back(optional[extra - 1]);
		}
		ScalarFunction f(arguments, out_type, ResolvePcodeExec);
		f.init_local_state = ResolvePcodeInitLocal;
		f.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
		set.AddFunction(f);
	}

	return set;
}

} // namespace duckdb
