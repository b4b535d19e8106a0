// Define the C interface for creating a handle for calculators
//
// This supports filling a calculator and transferring its (local) data to and
// from external buffers, which is what foreign-language bindings need. The
// collective operations are not exposed here: bindings are expected to move
// the exported buffers with their own message-passing layer and to combine
// them with calchandle_consolidate_into_primary.

#ifndef CALC_HANDLE_H
#define CALC_HANDLE_H

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
#else
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#endif

/// This is used to specify the calculator that will be built
struct CalcSpec {
  /// The name of the statistic to compute. One of "sum", "mean",
  /// "variance", "histogram" or "weightedhistogram".
  const char* statistic;

  /// The number of bins. This is ignored by the histograms (they use
  /// ``n_bin_edges - 1`` bins).
  size_t size;

  /// Strictly increasing bin edges, only used by the histograms. The ith
  /// bin includes the interval ``bin_edges[i] <= x < bin_edges[i+1]``.
  const double* bin_edges;
  size_t n_bin_edges;

  /// Whether the calculator only stores the bins that it touches
  bool sparse;
};

#ifdef __cplusplus
extern "C" {
#endif

/// Allocates the specified calculator and returns a handle to it
///
/// @returns The handle, or a null pointer if spec is invalid (an unknown
///     statistic, a size of 0 or invalid bin edges).
void* calchandle_create(const CalcSpec* spec);

/// Deallocates the calculator associated with the handle
void calchandle_destroy(void* handle);

/// The number of bins tracked by the calculator
size_t calchandle_num_bins(const void* handle);

/// The required lengths of the buffers passed to calchandle_export_data
/// and calchandle_restore
size_t calchandle_num_f64_vals(const void* handle);
size_t calchandle_num_i64_vals(const void* handle);

/// Saves the local values stored in the calculator to pre-allocated external
/// arrays
///
/// The jth property of the ith bin is stored at ``i + j * n_bins``. For
/// "variance", the floating point properties are weight, mean and
/// variance*weight. Bins without entries store 0 for every property.
///
/// This is a fatal error for a calculator that was already collected.
///
/// @param[in]  handle The previously allocated calculator handle, from which
///     data is copied.
/// @param[out] out_f64_vals Preallocated array to hold the output floating
///     point values.
/// @param[out] out_i64_vals Preallocated array to hold the output int64_t
///     values.
void calchandle_export_data(const void* handle, double* out_f64_vals,
                            int64_t* out_i64_vals);

/// Restore the state of a calculator from values stored in external buffers
///
/// This is primarily intended to be passed arrays that had previously been
/// modified by ``calchandle_export_data``. Negative (or NaN) weights, counts
/// or variance*weight values are a fatal error.
///
/// @param[in,out] handle The previously allocated calculator handle, which
///     will be modified
/// @param[in]     in_f64_vals Array of floating point values.
/// @param[in]     in_i64_vals Array of int64_t values.
void calchandle_restore(void* handle, const double* in_f64_vals,
                        const int64_t* in_i64_vals);

/// Updates `handle_primary` with the consolidated values of itself with
/// `handle_secondary`
void calchandle_consolidate_into_primary(void* handle_primary,
                                         const void* handle_secondary);

/// Updates `handle` by adding the specified entries with the specified
/// values
///
/// @param[in,out] handle The calculator to be updated
/// @param[in]     purge_everything_first When 1, we reset all values of the
///     handle (for all bins) before doing anything
/// @param[in]     bin_index The bin that values will be added to. This is
///     ignored by histograms (they bin the values themselves).
/// @param[in]     num_entries The number of entries to add
/// @param[in]     values An array of length `num_entries`
/// @param[in]     weights An optional array of length `num_entries`
void calchandle_add_entries(void* handle, int purge_everything_first,
                            int64_t bin_index, size_t num_entries,
                            const double* values, const double* weights);

#ifdef __cplusplus
}
#endif

#endif /* CALC_HANDLE_H */
