#include "calc_handle.hpp"

#include <cstdint>      // std::int64_t
#include <type_traits>  // std::decay_t
#include <vector>

#include "calc_variant.hpp"

void* calchandle_create(const CalcSpec* spec) {
  if (spec == nullptr) return nullptr;
  CalcVariant* out = nullptr;
  if (!build_calculator(*spec, &out)) return nullptr;
  return static_cast<void*>(out);
}

void calchandle_destroy(void* handle) {
  CalcVariant* ptr = static_cast<CalcVariant*>(handle);
  delete ptr;
}

size_t calchandle_num_bins(const void* handle) {
  const CalcVariant* ptr = static_cast<const CalcVariant*>(handle);
  return std::visit([](const auto& calc) { return calc.size(); }, *ptr);
}

size_t calchandle_num_f64_vals(const void* handle) {
  const CalcVariant* ptr = static_cast<const CalcVariant*>(handle);
  return std::visit(
      [](const auto& calc) {
        using Accum = calc_accum_t<std::decay_t<decltype(calc)>>;
        return calc.size() * detail::num_typed_props_<Accum>(true);
      },
      *ptr);
}

size_t calchandle_num_i64_vals(const void* handle) {
  const CalcVariant* ptr = static_cast<const CalcVariant*>(handle);
  return std::visit(
      [](const auto& calc) {
        using Accum = calc_accum_t<std::decay_t<decltype(calc)>>;
        return calc.size() * detail::num_typed_props_<Accum>(false);
      },
      *ptr);
}

void calchandle_export_data(const void* handle, double* out_f64_vals,
                            int64_t* out_i64_vals) {
  const CalcVariant* ptr = static_cast<const CalcVariant*>(handle);
  std::visit(
      [=](const auto& calc) {
        require(!calc.is_collected(),
                "can't export the data of a calculator after collect");
        const auto records = calc.local_records();
        const std::size_t n_bins = records.size();
        for (std::size_t i = 0; i < n_bins; i++) {
          detail::export_record_(records[i], i, n_bins, out_f64_vals,
                                 out_i64_vals);
        }
      },
      *ptr);
}

void calchandle_restore(void* handle, const double* in_f64_vals,
                        const int64_t* in_i64_vals) {
  CalcVariant* ptr = static_cast<CalcVariant*>(handle);
  std::visit(
      [=](auto& calc) {
        using Accum = calc_accum_t<std::decay_t<decltype(calc)>>;
        const std::size_t n_bins = calc.size();
        std::vector<Accum> records(n_bins);
        for (std::size_t i = 0; i < n_bins; i++) {
          detail::import_record_(records[i], i, n_bins, in_f64_vals,
                                 in_i64_vals);
        }
        calc.restore_records(records);
      },
      *ptr);
}

void calchandle_consolidate_into_primary(void* handle_primary,
                                         const void* handle_secondary) {
  CalcVariant* primary_ptr = static_cast<CalcVariant*>(handle_primary);
  const CalcVariant* secondary_ptr =
      static_cast<const CalcVariant*>(handle_secondary);

  std::visit(
      [=](auto& calc) {
        using T = std::decay_t<decltype(calc)>;
        if (std::holds_alternative<T>(*secondary_ptr)) {
          calc.consolidate_with_other(std::get<T>(*secondary_ptr));
        } else {
          error("the arguments don't hold the same types of calculators");
        }
      },
      *primary_ptr);
}

void calchandle_add_entries(void* handle, int purge_everything_first,
                            int64_t bin_index, size_t num_entries,
                            const double* values, const double* weights) {
  CalcVariant* ptr = static_cast<CalcVariant*>(handle);
  std::visit(
      [=](auto& calc) {
        using T = std::decay_t<decltype(calc)>;
        if (purge_everything_first == 1) calc.purge();

        if constexpr (std::is_same_v<T, ParallelHistogram> ||
                      std::is_same_v<T, ParallelWeightedHistogram>) {
          calc.add_data(values, num_entries, weights);
        } else {
          calc.add_data(bin_index, values, num_entries, weights);
        }
      },
      *ptr);
}
