#ifndef ACCUMULATORS_H
#define ACCUMULATORS_H

// Here's the basic overview of the stuff in this file:
// -> we define the accumulator records. Each record is a small, fixed-layout
//    struct that summarizes all of the entries seen so far in a single bin.
//    Every record carries an AccumKind tag.
// -> add_entry and consolidate are free functions overloaded on the record
//    type. The former absorbs a single (value, weight) pair, the latter
//    combines two records that were built from disjoint entries.
// -> AccumVariant packs the records into a tagged union for the places where
//    the kind is only known at runtime.

#include <algorithm>  // std::upper_bound
#include <cstdint>    // std::int64_t
#include <iterator>   // std::distance
#include <limits>
#include <type_traits>  // std::decay_t, std::is_trivially_copyable_v
#include <variant>

#include "utils.hpp"  // error, require

/// Enumerates the kinds of accumulator records.
///
/// The explicit values are part of the serialized payload and of the C
/// interface, so they must not be reordered.
enum class AccumKind : std::int32_t {
  count = 0,
  weighted_sum = 1,
  weighted_mean = 2,
  weighted_mean_variance = 3
};

/// Describes a property stored in an accumulator record
struct PropDescr {
  const char* name = nullptr;
  bool is_f64 = true;
};

/// Counts the number of entries
struct CountAccum {
  static constexpr AccumKind kind = AccumKind::count;

  static PropDescr get_prop(int index) noexcept {
    if (index == 0) return {"count", false};
    return {};
  }

  std::int64_t count = 0;
};

/// Tracks the total weight and the weighted sum of the entries
struct WeightedSumAccum {
  static constexpr AccumKind kind = AccumKind::weighted_sum;

  static PropDescr get_prop(int index) noexcept {
    if (index == 0) {
      return {"weight", true};
    } else if (index == 1) {
      return {"sum", true};
    }
    return {};
  }

  double weight = 0.0;
  double sum = 0.0;
};

/// Tracks the total weight and the weighted mean of the entries
///
/// The mean is stored as 0 while the weight is 0. Use mean_or_nan to read it.
struct WeightedMeanAccum {
  static constexpr AccumKind kind = AccumKind::weighted_mean;

  static PropDescr get_prop(int index) noexcept {
    if (index == 0) {
      return {"weight", true};
    } else if (index == 1) {
      return {"mean", true};
    }
    return {};
  }

  double weight = 0.0;
  double mean = 0.0;
};

/// Tracks the total weight, the weighted mean and the weighted sum of squared
/// deviations from the mean (m2)
///
/// As with WeightedMeanAccum, mean and m2 hold 0 while the weight is 0.
struct WeightedMeanVarAccum {
  static constexpr AccumKind kind = AccumKind::weighted_mean_variance;

  static PropDescr get_prop(int index) noexcept {
    if (index == 0) {
      return {"weight", true};
    } else if (index == 1) {
      return {"mean", true};
    } else if (index == 2) {
      return {"variance*weight", true};
    }
    return {};
  }

  double weight = 0.0;
  double mean = 0.0;
  double m2 = 0.0;
};

static_assert(std::is_trivially_copyable_v<CountAccum> &&
                  std::is_trivially_copyable_v<WeightedSumAccum> &&
                  std::is_trivially_copyable_v<WeightedMeanAccum> &&
                  std::is_trivially_copyable_v<WeightedMeanVarAccum>,
              "accumulator records are copied bytewise into payloads");

/// Returns the number of properties described by Accum::get_prop
template <typename Accum>
int num_props() noexcept {
  int n = 0;
  while (Accum::get_prop(n).name != nullptr) n++;
  return n;
}

// ---------------------------------------------------------------------------
// add_entry
// ---------------------------------------------------------------------------

FORCE_INLINE void add_entry(CountAccum& accum, double val,
                            double weight) noexcept {
  accum.count++;
}

// entries with zero weight contribute nothing to the weighted records, even
// when their value is NaN or infinite

FORCE_INLINE void add_entry(WeightedSumAccum& accum, double val,
                            double weight) noexcept {
  if (weight == 0) return;
  accum.weight += weight;
  accum.sum += weight * val;
}

FORCE_INLINE void add_entry(WeightedMeanAccum& accum, double val,
                            double weight) noexcept {
  if (weight == 0) return;
  double& weight_sum = accum.weight;
  weight_sum += weight;
  double delta = val - accum.mean;
  // the (weight_sum == 0) term guards against dividing by zero
  accum.mean += (delta * weight) / (weight_sum + (weight_sum == 0));
}

FORCE_INLINE void add_entry(WeightedMeanVarAccum& accum, double val,
                            double weight) noexcept {
  if (weight == 0) return;
  double& weight_sum = accum.weight;
  weight_sum += weight;
  double delta = val - accum.mean;
  accum.mean += (delta * weight) / (weight_sum + (weight_sum == 0));
  double val_minus_cur_mean = val - accum.mean;
  accum.m2 += weight * delta * val_minus_cur_mean;
}

// ---------------------------------------------------------------------------
// consolidate
// ---------------------------------------------------------------------------

/// compute the mean of two disjoint samples
///
/// @note
/// There is some question about what the most numerically stable way to do
/// this actually is. Wikipedia's description of the parallel algorithm
/// suggests that this form is more stable when both weights are comparable
/// and large. In the other limit (other_weight is much smaller), the update
/// ``primary_mean + delta * other_weight / total_weight`` may be more
/// stable. consolidate(WeightedMeanVarAccum) uses that second form.
inline double consolidate_mean_(double primary_mean, double primary_weight,
                                double other_mean, double other_weight,
                                double total_weight) noexcept {
  return (primary_weight * primary_mean + other_weight * other_mean) /
         total_weight;
}

inline CountAccum consolidate(const CountAccum& a,
                              const CountAccum& b) noexcept {
  return {a.count + b.count};
}

inline WeightedSumAccum consolidate(const WeightedSumAccum& a,
                                    const WeightedSumAccum& b) noexcept {
  return {a.weight + b.weight, a.sum + b.sum};
}

inline WeightedMeanAccum consolidate(const WeightedMeanAccum& a,
                                     const WeightedMeanAccum& b) noexcept {
  if (a.weight == 0) {
    return {b.weight + a.weight, b.mean};
  } else if (b.weight == 0) {
    return {a.weight + b.weight, a.mean};
  }
  double totweight = a.weight + b.weight;
  return {totweight,
          consolidate_mean_(a.mean, a.weight, b.mean, b.weight, totweight)};
}

/// Combines two records with Chan et al.'s parallel variance update
inline WeightedMeanVarAccum consolidate(
    const WeightedMeanVarAccum& a, const WeightedMeanVarAccum& b) noexcept {
  double totweight = a.weight + b.weight;
  if (a.weight == 0) {
    return {totweight, b.mean, b.m2};
  } else if (b.weight == 0) {
    return {totweight, a.mean, a.m2};
  }
  double delta = b.mean - a.mean;
  double mean = a.mean + delta * (b.weight / totweight);
  double m2 = a.m2 + b.m2 + (delta * delta) * (a.weight * b.weight / totweight);
  return {totweight, mean, m2};
}

// ---------------------------------------------------------------------------
// queries
// ---------------------------------------------------------------------------

/// Returns whether the record is indistinguishable from a freshly built one
inline bool is_empty(const CountAccum& accum) noexcept {
  return accum.count == 0;
}

template <typename Accum>
inline bool is_empty(const Accum& accum) noexcept {
  return accum.weight == 0;
}

/// The total weight (the count is used for CountAccum)
inline double total_weight(const CountAccum& accum) noexcept {
  return static_cast<double>(accum.count);
}

template <typename Accum>
inline double total_weight(const Accum& accum) noexcept {
  return accum.weight;
}

/// Returns whether the record respects the invariants that add_entry
/// maintains: the count, weight and m2 are non-negative (and not NaN).
inline bool is_valid_record(const CountAccum& accum) noexcept {
  return accum.count >= 0;
}

inline bool is_valid_record(const WeightedSumAccum& accum) noexcept {
  return accum.weight >= 0;
}

inline bool is_valid_record(const WeightedMeanAccum& accum) noexcept {
  return accum.weight >= 0;
}

inline bool is_valid_record(const WeightedMeanVarAccum& accum) noexcept {
  return (accum.weight >= 0) && (accum.m2 >= 0);
}

template <typename Accum>
inline double mean_or_nan(const Accum& accum) noexcept {
  return (accum.weight > 0) ? accum.mean
                            : std::numeric_limits<double>::quiet_NaN();
}

/// population form of the variance: m2 / weight
inline double variance_or_nan(const WeightedMeanVarAccum& accum) noexcept {
  return (accum.weight > 0) ? accum.m2 / accum.weight
                            : std::numeric_limits<double>::quiet_NaN();
}

// ---------------------------------------------------------------------------
// AccumVariant
// ---------------------------------------------------------------------------

/// tagged union of the accumulator records. The index of each alternative
/// matches the value of its AccumKind.
using AccumVariant = std::variant<CountAccum, WeightedSumAccum,
                                  WeightedMeanAccum, WeightedMeanVarAccum>;

inline AccumKind kind_of(const AccumVariant& accum) noexcept {
  return static_cast<AccumKind>(accum.index());
}

/// Construct an empty record of the specified kind
inline AccumVariant make_accum(AccumKind kind) noexcept {
  switch (kind) {
    case AccumKind::count:
      return CountAccum{};
    case AccumKind::weighted_sum:
      return WeightedSumAccum{};
    case AccumKind::weighted_mean:
      return WeightedMeanAccum{};
    case AccumKind::weighted_mean_variance:
      return WeightedMeanVarAccum{};
  }
  error("unrecognized AccumKind");
}

inline void add_entry(AccumVariant& accum, double val, double weight) noexcept {
  std::visit([=](auto& a) { add_entry(a, val, weight); }, accum);
}

inline AccumVariant consolidate(const AccumVariant& a,
                                const AccumVariant& b) noexcept {
  require(a.index() == b.index(),
          "can't consolidate accumulators of different kinds");
  return std::visit(
      [&](const auto& a_rec) -> AccumVariant {
        using T = std::decay_t<decltype(a_rec)>;
        return consolidate(a_rec, std::get<T>(b));
      },
      a);
}

// ---------------------------------------------------------------------------
// binning
// ---------------------------------------------------------------------------

/// identify the index of the bin where x lies.
///
/// @param x The value that is being queried
/// @param bin_edges An array of monotonically increasing bin edges. This
///    must have ``nbins + 1`` entries. The ith bin includes the interval
///    ``bin_edges[i] <= x < bin_edges[i+1]``.
/// @param nbins The number of bins. This is expected to be at least 1.
///
/// @returns index The index that ``x`` belongs in. If ``x`` doesn't lie in
///    any bins (this includes NaN), ``nbins`` is returned.
///
/// @notes
/// At the moment we are using a binary search algorithm. In the future, we
/// might want to assess the significance of branch mispredictions.
template <typename T>
std::size_t identify_bin_index(T x, const T* bin_edges, std::size_t nbins) {
  const T* bin_edges_end = bin_edges + nbins + 1;
  const T* rslt = std::upper_bound(bin_edges, bin_edges_end, x);
  // rslt is a pointer to the first value that is "greater than" x
  std::size_t index_p_1 = std::distance(bin_edges, rslt);

  if (index_p_1 == 0 || index_p_1 == (nbins + 1)) {
    return nbins;
  } else {
    return index_p_1 - 1;
  }
}

#endif /* ACCUMULATORS_H */
