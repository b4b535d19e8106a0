#ifndef TESTING_UTILS_H
#define TESTING_UTILS_H

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

#include <gtest/gtest.h>

/// A single entry of a dataset
struct Datum {
  std::int64_t bin;
  double value;
  double weight;
};

/// Mirrors numpy.allclose(a, b, rtol, atol, equal_nan=True)
inline ::testing::AssertionResult arrays_close(const std::vector<double>& a,
                                               const std::vector<double>& b,
                                               double rtol = 1e-9,
                                               double atol = 1e-12) {
  if (a.size() != b.size()) {
    return ::testing::AssertionFailure()
           << "lengths differ: " << a.size() << " vs " << b.size();
  }
  for (std::size_t i = 0; i < a.size(); i++) {
    if (std::isnan(a[i]) || std::isnan(b[i])) {
      if (std::isnan(a[i]) && std::isnan(b[i])) continue;
      return ::testing::AssertionFailure()
             << "element " << i << ": " << a[i] << " vs " << b[i];
    }
    if (std::fabs(a[i] - b[i]) > (atol + rtol * std::fabs(b[i]))) {
      return ::testing::AssertionFailure()
             << "element " << i << ": " << a[i] << " vs " << b[i];
    }
  }
  return ::testing::AssertionSuccess();
}

/// Like arrays_close, but requires bitwise-equal values (NaNs match NaNs)
inline ::testing::AssertionResult arrays_identical(
    const std::vector<double>& a, const std::vector<double>& b) {
  return arrays_close(a, b, 0.0, 0.0);
}

/// Two-pass reference computation of the per-bin weight, weighted mean and
/// weighted population variance. Bins with zero weight get NaN statistics.
struct ReferenceStats {
  std::vector<double> weight;
  std::vector<double> mean;
  std::vector<double> variance;
};

inline ReferenceStats reference_stats(const std::vector<Datum>& data,
                                      std::size_t n_bins) {
  std::vector<long double> wsum(n_bins, 0), wxsum(n_bins, 0);
  for (const Datum& d : data) {
    if ((d.bin < 0) || (std::size_t(d.bin) >= n_bins)) continue;
    wsum[d.bin] += d.weight;
    wxsum[d.bin] += d.weight * (long double)d.value;
  }

  std::vector<long double> mean(n_bins, 0), sqdev(n_bins, 0);
  for (std::size_t i = 0; i < n_bins; i++) {
    if (wsum[i] > 0) mean[i] = wxsum[i] / wsum[i];
  }
  for (const Datum& d : data) {
    if ((d.bin < 0) || (std::size_t(d.bin) >= n_bins)) continue;
    long double dev = d.value - mean[d.bin];
    sqdev[d.bin] += d.weight * dev * dev;
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  ReferenceStats out;
  for (std::size_t i = 0; i < n_bins; i++) {
    out.weight.push_back(double(wsum[i]));
    out.mean.push_back((wsum[i] > 0) ? double(mean[i]) : nan);
    out.variance.push_back((wsum[i] > 0) ? double(sqdev[i] / wsum[i]) : nan);
  }
  return out;
}

/// Generates a random dataset. Bin `empty_bin` (when it's in range) never
/// receives any entries.
inline std::vector<Datum> make_dataset(std::size_t n_data, std::size_t n_bins,
                                       bool weighted, unsigned seed,
                                       std::int64_t empty_bin = -1) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<std::int64_t> bin_dist(0, n_bins - 1);
  std::uniform_real_distribution<double> val_dist(0.0, 1.0);

  std::vector<Datum> out;
  out.reserve(n_data);
  for (std::size_t i = 0; i < n_data; i++) {
    Datum d{bin_dist(gen), val_dist(gen), weighted ? val_dist(gen) : 1.0};
    if (d.bin == empty_bin) d.bin = (empty_bin + 1) % std::int64_t(n_bins);
    out.push_back(d);
  }
  return out;
}

#endif /* TESTING_UTILS_H */
