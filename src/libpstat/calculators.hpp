#ifndef CALCULATORS_H
#define CALCULATORS_H

// The calculators are the user-facing part of the library. The usual
// life-cycle of a calculator is:
//   * construct an instance on every participant (with identical sizes)
//   * repeatedly call add_datum (or add_data) with the locally visible data
//   * call collect exactly once, on every participant, to combine the
//     per-participant results
//
// After collect, a calculator can't accept more data and can't be collected
// again.

#include <cstdint>
#include <utility>  // std::move
#include <vector>

#include "accum_storage.hpp"
#include "accumulators.hpp"
#include "communicator.hpp"
#include "reduction.hpp"
#include "utils.hpp"

/// A chunk of entries that all belong to the same bin. ``weights`` may be a
/// nullptr, in which case every entry has a weight of 1.
struct BinnedChunk {
  std::int64_t bin;
  const double* values;
  std::size_t n;
  const double* weights = nullptr;
};

/// A chunk of entries for a histogram (the histogram bins the values itself)
struct ValueChunk {
  const double* values;
  std::size_t n;
  const double* weights = nullptr;
};

/// Holds one accumulator record for each of ``size`` bins
///
/// @tparam Accum The accumulator record tracked in each bin
template <typename Accum>
class BinnedCalculator {
public:
  /// @param size The number of bins
  /// @param sparse When true, only the touched bins are stored. This uses
  ///     less memory (and less communication) when most bins stay empty.
  BinnedCalculator(std::size_t size, bool sparse)
      : size_(size),
        sparse_(sparse),
        collected_(false),
        storage_(build_storage<Accum>(size, sparse)) {
    require(size > 0, "size must be positive");
  }

  std::size_t size() const noexcept { return size_; }
  bool is_sparse() const noexcept { return sparse_; }
  bool is_collected() const noexcept { return collected_; }

  /// Add a single entry to a bin.
  ///
  /// Entries with a bin index outside of ``[0, size())`` are silently
  /// dropped. Negative (or NaN) weights are a fatal error.
  FORCE_INLINE void add_datum(std::int64_t bin, double value,
                              double weight = 1.0) {
    require(!collected_, "can't add data after collect was called");
    require(weight >= 0, "weights must be non-negative");
    if ((bin < 0) || (std::uint64_t(bin) >= size_)) return;
    // a zero-weight entry would still claim a slot in sparse storage
    if ((weight == 0) && (Accum::kind != AccumKind::count)) return;
    storage_add_entry(storage_, std::size_t(bin), value, weight);
  }

  /// Add a sequence of entries that all belong to the same bin.
  ///
  /// @param bin The bin index
  /// @param values Array of ``n`` values
  /// @param n Number of entries
  /// @param weights Optional array of ``n`` weights. When it's a nullptr,
  ///     every entry has a weight of 1.
  void add_data(std::int64_t bin, const double* values, std::size_t n,
                const double* weights = nullptr) {
    for (std::size_t i = 0; i < n; i++) {
      add_datum(bin, values[i], (weights == nullptr) ? 1.0 : weights[i]);
    }
  }

  /// Returns the local (not yet collected) record for bin
  Accum local_accum(std::size_t bin) const {
    require(bin < size_, "bin index is too large");
    return std::visit([=](const auto& s) { return Accum(s.get(bin)); },
                      storage_);
  }

  /// Returns a dense copy of the local (not yet collected) records
  std::vector<Accum> local_records() const {
    return storage_to_dense(storage_);
  }

  /// Overwrites the local records with the contents of `records`
  void restore_records(const std::vector<Accum>& records) {
    require(!collected_, "can't restore data after collect was called");
    require(records.size() == size_, "records has the wrong length");
    for (const Accum& accum : records) {
      require(is_valid_record(accum),
              "records hold a negative (or NaN) weight, count or m2");
    }
    if (sparse_) {
      storage_ = SparseAccumMap<Accum>::from_dense(records);
    } else {
      storage_ = DenseAccumArray<Accum>(std::vector<Accum>(records));
    }
  }

  /// reset the local contents (it looks as though we just initialized)
  void purge() {
    require(!collected_, "can't purge after collect was called");
    storage_ = build_storage<Accum>(size_, sparse_);
  }

  /// Updates the values of `*this` to include the values from `other`.
  ///
  /// This combines two calculators on the same participant (e.g. ones that
  /// were filled from different chunks), without any communication.
  void consolidate_with_other(const BinnedCalculator& other) {
    require(!(collected_ || other.collected_),
            "can't consolidate a calculator after collect was called");
    require(other.size_ == size_,
            "a mismatch was encountered during consolidation");
    consolidate_storage(storage_, other.storage_);
  }

protected:
  /// Adds every chunk in ``[first, last)``. The iterators must dereference
  /// to BinnedChunk.
  template <typename ChunkIt>
  void add_chunks_(ChunkIt first, ChunkIt last) {
    for (; first != last; ++first) {
      const BinnedChunk& chunk = *first;
      add_data(chunk.bin, chunk.values, chunk.n, chunk.weights);
    }
  }

  /// Implements the collective part of collect.
  ///
  /// On success ``*has_data`` indicates whether `records` was filled with
  /// the combined records.
  CollectStatus collect_records_(Communicator& comm, CollectMode mode,
                                 int root, std::uint64_t extra_digest,
                                 std::vector<Accum>* records, bool* has_data) {
    require(!collected_, "collect can only be called once");
    collected_ = true;

    CollectSignature signature;
    signature.kind = static_cast<std::int32_t>(Accum::kind);
    signature.n_bins = size_;
    signature.extra_digest = extra_digest;

    CollectStatus status =
        reduce_storage<Accum>(comm, mode, root, signature, storage_, has_data);
    if ((status == CollectStatus::success) && *has_data) {
      *records = storage_to_dense(storage_);
    } else {
      *has_data = false;
    }
    release_storage_();
    return status;
  }

  /// Implements the serial version of collect
  std::vector<Accum> collect_local_records_() {
    require(!collected_, "collect can only be called once");
    collected_ = true;
    std::vector<Accum> out = storage_to_dense(storage_);
    release_storage_();
    return out;
  }

private:
  void release_storage_() {
    storage_ = AccumStorage<Accum>(DenseAccumArray<Accum>());
  }

  std::size_t size_;
  bool sparse_;
  bool collected_;
  AccumStorage<Accum> storage_;
};

// ---------------------------------------------------------------------------
// results
// ---------------------------------------------------------------------------

// When a participant doesn't receive the combined result (the non-root
// participants in gather mode, or any participant after a failure),
// has_data is false and every array is empty. Otherwise, each array has one
// entry per bin.

struct SumResult {
  bool has_data = false;
  std::vector<double> weight;
  std::vector<double> sum;
};

struct MeanResult {
  bool has_data = false;
  std::vector<double> weight;
  /// NaN in bins with zero total weight
  std::vector<double> mean;
};

struct MeanVarianceResult {
  bool has_data = false;
  std::vector<double> weight;
  /// NaN in bins with zero total weight
  std::vector<double> mean;
  /// the population variance. NaN in bins with zero total weight
  std::vector<double> variance;
};

template <typename T>
struct HistogramResult {
  bool has_data = false;
  std::vector<T> counts;
};

// ---------------------------------------------------------------------------
// calculators
// ---------------------------------------------------------------------------

/// Computes the total weight and the weighted sum of values in each bin.
///
/// Bins without entries have a weight and a sum of 0.
class ParallelSum : public BinnedCalculator<WeightedSumAccum> {
public:
  explicit ParallelSum(std::size_t size, bool sparse = false)
      : BinnedCalculator<WeightedSumAccum>(size, sparse) {}

  CollectStatus collect(Communicator& comm, CollectMode mode, SumResult* out,
                        int root = 0);

  /// serial version of collect (only uses the local data)
  void collect(SumResult* out);

  /// Runs the whole life cycle: adds every chunk in ``[first, last)`` (the
  /// iterators dereference to BinnedChunk) and then calls collect.
  template <typename ChunkIt>
  CollectStatus run(ChunkIt first, ChunkIt last, Communicator& comm,
                    CollectMode mode, SumResult* out, int root = 0) {
    this->add_chunks_(first, last);
    return collect(comm, mode, out, root);
  }

  /// serial version of run
  template <typename ChunkIt>
  void run(ChunkIt first, ChunkIt last, SumResult* out) {
    this->add_chunks_(first, last);
    collect(out);
  }
};

/// Computes the total weight and the weighted mean in each bin.
class ParallelMean : public BinnedCalculator<WeightedMeanAccum> {
public:
  explicit ParallelMean(std::size_t size, bool sparse = false)
      : BinnedCalculator<WeightedMeanAccum>(size, sparse) {}

  CollectStatus collect(Communicator& comm, CollectMode mode, MeanResult* out,
                        int root = 0);

  /// serial version of collect (only uses the local data)
  void collect(MeanResult* out);

  /// Runs the whole life cycle: adds every chunk in ``[first, last)`` (the
  /// iterators dereference to BinnedChunk) and then calls collect.
  template <typename ChunkIt>
  CollectStatus run(ChunkIt first, ChunkIt last, Communicator& comm,
                    CollectMode mode, MeanResult* out, int root = 0) {
    this->add_chunks_(first, last);
    return collect(comm, mode, out, root);
  }

  /// serial version of run
  template <typename ChunkIt>
  void run(ChunkIt first, ChunkIt last, MeanResult* out) {
    this->add_chunks_(first, last);
    collect(out);
  }
};

/// Computes the total weight, the weighted mean and the weighted
/// (population) variance in each bin.
///
/// The online update is the weighted version of Welford's algorithm and
/// partial results are combined with the parallel algorithm of Chan et al.
/// (see also Schubert & Gertz 2018, Numerically Stable Parallel Computation
/// of (Co-)Variance).
class ParallelMeanVariance : public BinnedCalculator<WeightedMeanVarAccum> {
public:
  explicit ParallelMeanVariance(std::size_t size, bool sparse = false)
      : BinnedCalculator<WeightedMeanVarAccum>(size, sparse) {}

  CollectStatus collect(Communicator& comm, CollectMode mode,
                        MeanVarianceResult* out, int root = 0);

  /// serial version of collect (only uses the local data)
  void collect(MeanVarianceResult* out);

  /// Runs the whole life cycle: adds every chunk in ``[first, last)`` (the
  /// iterators dereference to BinnedChunk) and then calls collect.
  template <typename ChunkIt>
  CollectStatus run(ChunkIt first, ChunkIt last, Communicator& comm,
                    CollectMode mode, MeanVarianceResult* out, int root = 0) {
    this->add_chunks_(first, last);
    return collect(comm, mode, out, root);
  }

  /// serial version of run
  template <typename ChunkIt>
  void run(ChunkIt first, ChunkIt last, MeanVarianceResult* out) {
    this->add_chunks_(first, last);
    collect(out);
  }
};

namespace detail {

template <typename Accum>
struct HistCountType_;

template <>
struct HistCountType_<CountAccum> {
  using type = std::int64_t;
  static type get(const CountAccum& accum) noexcept { return accum.count; }
};

template <>
struct HistCountType_<WeightedSumAccum> {
  using type = double;
  static type get(const WeightedSumAccum& accum) noexcept {
    return accum.weight;
  }
};

}  // namespace detail

/// Builds a histogram with pre-defined bin edges
///
/// The ith bin covers ``edges[i] <= x < edges[i+1]``. Values outside of all
/// bins (including NaN) are ignored.
///
/// @tparam Accum Either CountAccum (each value counts once and weights are
///     ignored) or WeightedSumAccum (each value contributes its weight).
template <typename Accum>
class HistogramCalculator : protected BinnedCalculator<Accum> {
  using Base = BinnedCalculator<Accum>;

public:
  using count_type = typename detail::HistCountType_<Accum>::type;
  using Result = HistogramResult<count_type>;

  /// @param edges Strictly increasing bin edges. There must be at least 2.
  /// @param sparse When true, only the touched bins are stored.
  explicit HistogramCalculator(std::vector<double> edges, bool sparse = false)
      : Base(check_edges_(edges), sparse), edges_(std::move(edges)) {}

  using Base::is_collected;
  using Base::is_sparse;
  using Base::local_accum;
  using Base::local_records;
  using Base::purge;
  using Base::restore_records;
  using Base::size;

  const std::vector<double>& edges() const noexcept { return edges_; }

  /// Add a single value to the histogram
  void add_datum(double value, double weight = 1.0) {
    require(!this->is_collected(), "can't add data after collect was called");
    require(weight >= 0, "weights must be non-negative");
    const std::size_t nbins = edges_.size() - 1;
    std::size_t bin = identify_bin_index(value, edges_.data(), nbins);
    if (bin < nbins) Base::add_datum(std::int64_t(bin), value, weight);
  }

  /// Add a chunk of ``n`` values, with optional weights (a nullptr means that
  /// every value has a weight of 1)
  void add_data(const double* values, std::size_t n,
                const double* weights = nullptr) {
    for (std::size_t i = 0; i < n; i++) {
      add_datum(values[i], (weights == nullptr) ? 1.0 : weights[i]);
    }
  }

  /// Updates the values of `*this` to include the values from `other`
  void consolidate_with_other(const HistogramCalculator& other) {
    require(other.edges_ == edges_,
            "can't consolidate histograms with different bin edges");
    Base::consolidate_with_other(other);
  }

  CollectStatus collect(Communicator& comm, CollectMode mode, Result* out,
                        int root = 0) {
    std::vector<Accum> records;
    bool has_data;
    CollectStatus status = this->collect_records_(
        comm, mode, root, digest_f64_array(edges_.data(), edges_.size()),
        &records, &has_data);
    fill_result_(records, has_data, out);
    return status;
  }

  /// serial version of collect (only uses the local data)
  void collect(Result* out) {
    fill_result_(this->collect_local_records_(), true, out);
  }

  /// Runs the whole life cycle: adds every chunk in ``[first, last)`` (the
  /// iterators dereference to ValueChunk) and then calls collect.
  template <typename ChunkIt>
  CollectStatus run(ChunkIt first, ChunkIt last, Communicator& comm,
                    CollectMode mode, Result* out, int root = 0) {
    add_chunks_(first, last);
    return collect(comm, mode, out, root);
  }

  /// serial version of run
  template <typename ChunkIt>
  void run(ChunkIt first, ChunkIt last, Result* out) {
    add_chunks_(first, last);
    collect(out);
  }

private:
  template <typename ChunkIt>
  void add_chunks_(ChunkIt first, ChunkIt last) {
    for (; first != last; ++first) {
      const ValueChunk& chunk = *first;
      add_data(chunk.values, chunk.n, chunk.weights);
    }
  }

  static std::size_t check_edges_(const std::vector<double>& edges) {
    require(edges.size() >= 2, "a histogram needs at least 2 bin edges");
    for (std::size_t i = 0; (i + 1) < edges.size(); i++) {
      require(edges[i] < edges[i + 1], "bin edges must strictly increase");
    }
    return edges.size() - 1;
  }

  static void fill_result_(const std::vector<Accum>& records, bool has_data,
                           Result* out) {
    out->has_data = has_data;
    out->counts.clear();
    if (!has_data) return;
    out->counts.reserve(records.size());
    for (const Accum& accum : records) {
      out->counts.push_back(detail::HistCountType_<Accum>::get(accum));
    }
  }

  std::vector<double> edges_;
};

using ParallelHistogram = HistogramCalculator<CountAccum>;
using ParallelWeightedHistogram = HistogramCalculator<WeightedSumAccum>;

#endif /* CALCULATORS_H */
