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

struct BuildFormatsState {
	std::vector<pcode::PcodeFormatRow> *rows;
};

static idx_t StateSize(const AggregateFunction &) {
	return sizeof(BuildFormatsState);
}

static void StateInit(const AggregateFunction &, data_ptr_t state) {
	auto *st = reinterpret_cast<BuildFormatsState *>(state);
	st->rows = new std::vector<pcode::PcodeFormatRow>();
}

static void FormatsStateDestructor(Vector &state, AggregateInputData &, idx_t count) {
	auto state_ptrs = FlatVector::GetData<data_ptr_t>(state);
	for (idx_t i = 0; i < count; i++) {
		auto *st = reinterpret_cast<BuildFormatsState *>(state_ptrs[i]);
		if (st && st->rows) {
			delete st->rows;
			st->rows = nullptr;
		}
	}
}

static void StateUpdate(Vector inputs[], AggregateInputData &, idx_t input_count, Vector &state, idx_t count) {
	D_ASSERT(input_count == 2);
	auto &country_vec = inputs[0];
	auto &list_vec = inputs[1];

	UnifiedVectorFormat country_data;
	country_vec.ToUnifiedFormat(count, country_data);
	auto country_vals = UnifiedVectorFormat::GetData<string_t>(country_data);

	UnifiedVectorFormat list_data;
	list_vec.ToUnifiedFormat(count, list_data);
	auto list_entries = UnifiedVectorFormat::GetData<list_entry_t>(list_data);

	auto &child_vec = ListVector::GetEntry(list_vec);
	UnifiedVectorFormat child_data;
	child_vec.ToUnifiedFormat(ListVector::GetListSize(list_vec), child_data);
	auto child_vals = UnifiedVectorFormat::GetData<int32_t>(child_data);

	auto state_ptrs = FlatVector::GetData<data_ptr_t>(state);
	for (idx_t i = 0; i < count; i++) {
		const auto crid = country_data.sel->get_index(i);
		if (!country_data.validity.RowIsValid(crid)) {
			continue;
		}
		pcode::PcodeFormatRow row;
		row.country_iso3 = country_vals[crid].GetString();

		const auto rid = list_data.sel->get_index(i);
		if (!list_data.validity.RowIsValid(rid) || list_entries[rid].length == 0) {
			throw InvalidInputException("build_pcode_formats: no segment lengths for %s", row.country_iso3);
		}
		const auto le = list_entries[rid];
		row.lengths.reserve(le.length);
		for (idx_t k = 0; k < le.length; k++) {
			const auto cidx = child_data.sel->get_index(le.offset + k);
			if (!child_data.validity.RowIsValid(cidx) || child_vals[cidx] <= 0) {
				throw InvalidInputException("build_pcode_formats: segment lengths for %s must be positive",
				                            row.country_iso3);
			}
			row.lengths.push_back(child_vals[cidx]);
		}

		auto *st = reinterpret_cast<BuildFormatsState *>(state_ptrs[i]);
		st->rows->push_back(std::move(row));
	}
}

static void StateCombine(Vector &source, Vector &target, AggregateInputData &, idx_t count) {
	auto src_ptrs = FlatVector::GetData<data_ptr_t>(source);
	auto dst_ptrs = FlatVector::GetData<data_ptr_t>(target);
	for (idx_t i = 0; i < count; i++) {
		auto *src = reinterpret_cast<BuildFormatsState *>(src_ptrs[i]);
		auto *dst = reinterpret_cast<BuildFormatsState *>(dst_ptrs[i]);
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
		auto *st = reinterpret_cast<BuildFormatsState *>(st_ptrs[i]);
		if (!st || !st->rows || st->rows->empty()) {
			FlatVector::SetNull(result, i + offset, true);
			continue;
		}
		std::vector<uint8_t> bin;
		bin.reserve(256);
		SerializePCF1(*st->rows, bin);

		out[i + offset] = StringVector::AddString(result, reinterpret_cast<const char *>(bin.data()), bin.size());

		delete st->rows;
		st->rows = nullptr;
	}
}

AggregateFunctionSet GetBuildPcodeFormatsAggregateSet() {
	AggregateFunctionSet set("build_pcode_formats");

	AggregateFunction fn({LogicalType::VARCHAR, LogicalType::LIST(LogicalType::INTEGER)}, LogicalType::BLOB,
	                     StateSize, StateInit, StateUpdate, StateCombine, StateFinalize,
	                     FunctionNullHandling::SPECIAL_HANDLING);
	fn.destructor = FormatsStateDestructor;
	set.AddFunction(fn);

	return set;
}

} // namespace duckdb
