#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/aggregate_function.hpp"
#include "duckdb/function/function_set.hpp"

#include "registry/pcode_functions.hpp"
#include "registry/registry_blob.hpp"

#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace duckdb {
// Output is a raw PCR1 BLOB; rows keep their arrival order.

struct BuildRegistryState {
	std::vector<pcode::LeveledAdminRow> *rows;
};

static idx_t StateSize(const AggregateFunction &) {
	return sizeof(BuildRegistryState);
}

static void StateInit(const AggregateFunction &, data_ptr_t state) {
	auto *st = reinterpret_cast<BuildRegistryState *>(state);
	st->rows = new std::vector<pcode::LeveledAdminRow>();
}

static void RegistryStateDestructor(Vector &state, AggregateInputData &, idx_t count) {
	auto state_ptrs = FlatVector::GetData<data_ptr_t>(state);
	for (idx_t i = 0; i < count; i++) {
		auto *st = reinterpret_cast<BuildRegistryState *>(state_ptrs[i]);
		if (st && st->rows) {
			delete st->rows;
			st->rows = nullptr;
		}
	}
}

static std::string OptionalString(const UnifiedVectorFormat &data, idx_t row) {
	const auto idx = data.sel->get_index(row);
	if (!data.validity.RowIsValid(idx)) {
		return std::string();
	}
	return UnifiedVectorFormat::GetData<string_t>(data)[idx].GetString();
}

// inputs: [level,] country, pcode, name [, parent]
static void UpdateRows(Vector inputs[], idx_t input_count, Vector &state, idx_t count, bool has_level,
                       bool has_parent) {
	D_ASSERT(input_count == 3 + (has_level ? 1 : 0) + (has_parent ? 1 : 0));
	const idx_t first = has_level ? 1 : 0;

	UnifiedVectorFormat level_data;
	if (has_level) {
		inputs[0].ToUnifiedFormat(count, level_data);
	}
	UnifiedVectorFormat country_data;
	UnifiedVectorFormat pcode_data;
	UnifiedVectorFormat name_data;
	inputs[first].ToUnifiedFormat(count, country_data);
	inputs[first + 1].ToUnifiedFormat(count, pcode_data);
	inputs[first + 2].ToUnifiedFormat(count, name_data);
	UnifiedVectorFormat parent_data;
	if (has_parent) {
		inputs[first + 3].ToUnifiedFormat(count, parent_data);
	}
	auto country_vals = UnifiedVectorFormat::GetData<string_t>(country_data);
	auto pcode_vals = UnifiedVectorFormat::GetData<string_t>(pcode_data);

	auto state_ptrs = FlatVector::GetData<data_ptr_t>(state);
	for (idx_t i = 0; i < count; i++) {
		const auto crid = country_data.sel->get_index(i);
		const auto prid = pcode_data.sel->get_index(i);
		if (!country_data.validity.RowIsValid(crid) || !pcode_data.validity.RowIsValid(prid)) {
			continue;
		}

		pcode::LeveledAdminRow leveled;
		if (has_level) {
			const auto lrid = level_data.sel->get_index(i);
			if (!level_data.validity.RowIsValid(lrid)) {
				continue;
			}
			const int32_t level = UnifiedVectorFormat::GetData<int32_t>(level_data)[lrid];
			if (level <= 0) {
				throw InvalidInputException("build_pcode_registry: admin level must be positive (got %d)", level);
			}
			leveled.admin_level = static_cast<uint32_t>(level);
		}
		leveled.row.country_iso3 = country_vals[crid].GetString();
		leveled.row.pcode = pcode_vals[prid].GetString();
		if (leveled.row.country_iso3.empty() || leveled.row.pcode.empty()) {
			continue;
		}
		leveled.row.name = OptionalString(name_data, i);
		if (has_parent) {
			leveled.row.parent = OptionalString(parent_data, i);
		}

		auto *st = reinterpret_cast<BuildRegistryState *>(state_ptrs[i]);
		st->rows->push_back(std::move(leveled));
	}
}

static void StateUpdate(Vector inputs[], AggregateInputData &, idx_t input_count, Vector &state, idx_t count) {
	UpdateRows(inputs, input_count, state, count, false, false);
}

static void StateUpdateLevel(Vector inputs[], AggregateInputData &, idx_t input_count, Vector &state, idx_t count) {
	UpdateRows(inputs, input_count, state, count, true, false);
}

static void StateUpdateLevelParent(Vector inputs[], AggregateInputData &, idx_t input_count, Vector &state,
                                   idx_t count) {
	UpdateRows(inputs, input_count, state, count, true, true);
}

static void StateCombine(Vector &source, Vector &target, AggregateInputData &, idx_t count) {
	auto src_ptrs = FlatVector::GetData<data_ptr_t>(source);
	auto dst_ptrs = FlatVector::GetData<data_ptr_t>(target);
	for (idx_t i = 0; i < count; i++) {
		auto *src = reinterpret_cast<BuildRegistryState *>(src_ptrs[i]);
		auto *dst = reinterpret_cast<BuildRegistryState *>(dst_ptrs[i]);
		if (!src || !src->rows || !dst || !dst->rows) {
			continue;
		}
		dst->rows->insert(dst->rows->end(), std::make_move_iterator(src->rows->begin()),
		                  std::make_move_iterator(src->rows->end()));
		delete src->rows;
		src->rows = nullptr;
	}
}

static void StateFinalize(Vector &state, AggregateInputData &, Vector &result, idx_t count, idx_t offset) {
	auto st_ptrs = FlatVector::GetData<data_ptr_t>(state);
	auto out = FlatVector::GetData<string_t>(result);

	for (idx_t i = 0; i < count; i++) {
		auto *st = reinterpret_cast<BuildRegistryState *>(st_ptrs[i]);
		// No usable rows: NULL rather than an empty registry
		if (!st || !st->rows || st->rows->empty()) {
			FlatVector::SetNull(result, i + offset, true);
			continue;
		}
		std::vector<uint8_t> bin;
		bin.reserve(1024);
		SerializePCR1(*st->rows, bin);

		out[i + offset] = StringVector::AddString(result, reinterpret_cast<const char *>(bin.data()), bin.size());

		delete st->rows;
		st->rows = nullptr;
	}
}

static AggregateFunction MakeRegistryAggregate(vector<LogicalType> arguments, aggregate_update_t update) {
	AggregateFunction fn(std::move(arguments), LogicalType::BLOB, StateSize, StateInit, update, StateCombine,
	                     StateFinalize, FunctionNullHandling::SPECIAL_HANDLING);
	fn.destructor = RegistryStateDestructor;
	// The first row registered for a normalized name wins
	fn.order_dependent = AggregateOrderDependent::ORDER_DEPENDENT;
	return fn;
}

AggregateFunctionSet GetBuildPcodeRegistryAggregateSet() {
	AggregateFunctionSet set("build_pcode_registry");

	set.AddFunction(MakeRegistryAggregate({LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                      StateUpdate));
	set.AddFunction(MakeRegistryAggregate(
	    {LogicalType::INTEGER, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR}, StateUpdateLevel));
	set.AddFunction(MakeRegistryAggregate({LogicalType::INTEGER, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                                       LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                      StateUpdateLevelParent));

	return set;
}

} // namespace duckdb
