#ifndef CALCVARIANT_H
#define CALCVARIANT_H

#include <cstdint>
#include <string>
#include <utility>  // std::in_place_type
#include <variant>
#include <vector>

#include "calc_handle.hpp"  // declaration of CalcSpec
#include "calculators.hpp"

using CalcVariant =
    std::variant<ParallelSum, ParallelMean, ParallelMeanVariance,
                 ParallelHistogram, ParallelWeightedHistogram>;

/// The accumulator record type used by a calculator
template <typename Calc>
using calc_accum_t =
    typename decltype(std::declval<const Calc&>().local_records())::value_type;

/// Construct an instance of CalcVariant
///
/// @returns ``true`` on success and ``false`` if spec is invalid. In the
///     latter case, out is left unchanged.
inline bool build_calculator(const CalcSpec& spec, CalcVariant** out) {
  if (spec.statistic == nullptr) return false;
  std::string stat(spec.statistic);

  if ((stat == "histogram") || (stat == "weightedhistogram")) {
    if ((spec.bin_edges == nullptr) || (spec.n_bin_edges < 2)) return false;
    std::vector<double> edges(spec.bin_edges,
                              spec.bin_edges + spec.n_bin_edges);
    for (std::size_t i = 0; (i + 1) < edges.size(); i++) {
      if (!(edges[i] < edges[i + 1])) return false;
    }

    if (stat == "histogram") {
      *out = new CalcVariant(std::in_place_type<ParallelHistogram>,
                             std::move(edges), spec.sparse);
    } else {
      *out = new CalcVariant(std::in_place_type<ParallelWeightedHistogram>,
                             std::move(edges), spec.sparse);
    }
    return true;
  }

  if (spec.size == 0) return false;
  if (stat == "sum") {
    *out = new CalcVariant(std::in_place_type<ParallelSum>, spec.size,
                           spec.sparse);
  } else if (stat == "mean") {
    *out = new CalcVariant(std::in_place_type<ParallelMean>, spec.size,
                           spec.sparse);
  } else if (stat == "variance") {
    *out = new CalcVariant(std::in_place_type<ParallelMeanVariance>,
                           spec.size, spec.sparse);
  } else {
    return false;
  }
  return true;
}

namespace detail {

/// Count the properties of a record that are (or aren't) doubles
template <typename Accum>
std::size_t num_typed_props_(bool is_f64) noexcept {
  std::size_t count = 0;
  for (int i = 0; i < num_props<Accum>(); i++) {
    if (Accum::get_prop(i).is_f64 == is_f64) count++;
  }
  return count;
}

// the following overloads translate between a record and the flattened
// buffers. ``i`` is the bin index and ``n`` is the number of bins

inline void export_record_(const CountAccum& a, std::size_t i, std::size_t n,
                           double* f64, std::int64_t* i64) {
  i64[i] = a.count;
}

inline void export_record_(const WeightedSumAccum& a, std::size_t i,
                           std::size_t n, double* f64, std::int64_t* i64) {
  f64[i] = a.weight;
  f64[i + n] = a.sum;
}

inline void export_record_(const WeightedMeanAccum& a, std::size_t i,
                           std::size_t n, double* f64, std::int64_t* i64) {
  f64[i] = a.weight;
  f64[i + n] = a.mean;
}

inline void export_record_(const WeightedMeanVarAccum& a, std::size_t i,
                           std::size_t n, double* f64, std::int64_t* i64) {
  f64[i] = a.weight;
  f64[i + n] = a.mean;
  f64[i + 2 * n] = a.m2;
}

inline void import_record_(CountAccum& a, std::size_t i, std::size_t n,
                           const double* f64, const std::int64_t* i64) {
  a.count = i64[i];
}

inline void import_record_(WeightedSumAccum& a, std::size_t i, std::size_t n,
                           const double* f64, const std::int64_t* i64) {
  a.weight = f64[i];
  a.sum = f64[i + n];
}

inline void import_record_(WeightedMeanAccum& a, std::size_t i, std::size_t n,
                           const double* f64, const std::int64_t* i64) {
  a.weight = f64[i];
  a.mean = f64[i + n];
}

inline void import_record_(WeightedMeanVarAccum& a, std::size_t i,
                           std::size_t n, const double* f64,
                           const std::int64_t* i64) {
  a.weight = f64[i];
  a.mean = f64[i + n];
  a.m2 = f64[i + 2 * n];
}

}  // namespace detail

#endif /* CALCVARIANT_H */
