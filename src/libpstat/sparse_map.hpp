#ifndef SPARSE_MAP_H
#define SPARSE_MAP_H

#include <algorithm>  // std::sort
#include <cstdint>
#include <numeric>  // std::iota
#include <unordered_map>
#include <utility>  // std::move, std::swap
#include <vector>

#include "accumulators.hpp"
#include "payload.hpp"
#include "utils.hpp"

/// Maps bin indices to accumulator records, only storing the bins that have
/// been touched.
///
/// Bins that were never touched behave like a freshly constructed record.
/// The records live in an arena (a plain vector, in order of first touch) and
/// an index map translates a bin index to its slot in the arena. Slots are
/// never removed, so the map only grows during a run.
template <typename Accum>
class SparseAccumMap {
public:
  SparseAccumMap() = default;

  /// @param n_bins The number of bins represented by the map. Bin indices must
  ///     lie in ``[0, n_bins)``.
  explicit SparseAccumMap(std::size_t n_bins)
      : n_bins_(n_bins), bin_of_slot_(), arena_(), slot_of_bin_() {}

  std::size_t n_bins() const noexcept { return n_bins_; }

  /// The number of bins that have been touched
  std::size_t count_nonzero() const noexcept { return arena_.size(); }

  /// Returns the record for bin (an empty record if bin was never touched)
  Accum get(std::size_t bin) const {
    auto it = slot_of_bin_.find(static_cast<std::int64_t>(bin));
    return (it == slot_of_bin_.end()) ? Accum{} : arena_[it->second];
  }

  void set(std::size_t bin, const Accum& accum) {
    require(bin < n_bins_, "bin index is too large for the sparse map");
    slot_for_(bin) = accum;
  }

  /// Adds an entry, creating the bin's record on first touch
  void add_entry(std::size_t bin, double val, double weight) {
    ::add_entry(slot_for_(bin), val, weight);
  }

  /// Updates the values of `*this` to include the values from `other`
  ///
  /// The smaller of the two maps is walked and folded into the larger one.
  void consolidate_with_other(const SparseAccumMap& other) {
    require(other.n_bins_ == n_bins_,
            "a mismatch was encountered during consolidation");

    if (other.count_nonzero() <= count_nonzero()) {
      for (std::size_t slot = 0; slot < other.arena_.size(); slot++) {
        Accum& dest = slot_for_(other.bin_of_slot_[slot]);
        dest = consolidate(dest, other.arena_[slot]);
      }
    } else {
      SparseAccumMap out(other);
      for (std::size_t slot = 0; slot < arena_.size(); slot++) {
        Accum& dest = out.slot_for_(bin_of_slot_[slot]);
        dest = consolidate(arena_[slot], dest);
      }
      *this = std::move(out);
    }
  }

  /// Returns a new map holding the union of the keys of `*this` and `other`
  SparseAccumMap merge(const SparseAccumMap& other) const {
    SparseAccumMap out(*this);
    out.consolidate_with_other(other);
    return out;
  }

  /// Make a dense copy. Bins that were never touched hold empty records.
  std::vector<Accum> to_dense() const {
    std::vector<Accum> out(n_bins_);
    for (std::size_t slot = 0; slot < arena_.size(); slot++) {
      out[bin_of_slot_[slot]] = arena_[slot];
    }
    return out;
  }

  /// Convert a dense array of records into a sparse map. Empty records are
  /// not stored in the new map.
  static SparseAccumMap from_dense(const std::vector<Accum>& dense) {
    SparseAccumMap out(dense.size());
    for (std::size_t i = 0; i < dense.size(); i++) {
      if (!is_empty(dense[i])) out.slot_for_(i) = dense[i];
    }
    return out;
  }

  /// Retrieve the indices of the touched bins (in ascending order) and the
  /// matching records
  void to_arrays(std::vector<std::int64_t>* indices,
                 std::vector<Accum>* records) const {
    std::vector<std::size_t> order(arena_.size());
    std::iota(order.begin(), order.end(), std::size_t(0));
    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
      return bin_of_slot_[a] < bin_of_slot_[b];
    });

    indices->clear();
    records->clear();
    indices->reserve(order.size());
    records->reserve(order.size());
    for (std::size_t slot : order) {
      indices->push_back(bin_of_slot_[slot]);
      records->push_back(arena_[slot]);
    }
  }

  /// Calls ``fn(bin, record)`` for every touched bin, in order of first touch
  template <typename Fn>
  void for_each(Fn fn) const {
    for (std::size_t slot = 0; slot < arena_.size(); slot++) {
      fn(static_cast<std::size_t>(bin_of_slot_[slot]), arena_[slot]);
    }
  }

  /// Appends the serialized contents to `payload`
  void pack(Payload& payload) const {
    PayloadHeader header{static_cast<std::int32_t>(Accum::kind), 1,
                         static_cast<std::uint64_t>(n_bins_),
                         static_cast<std::uint64_t>(arena_.size())};
    detail::append_vals_(payload, &header, 1);
    detail::append_vals_(payload, bin_of_slot_.data(), bin_of_slot_.size());
    detail::append_vals_(payload, arena_.data(), arena_.size());
  }

  /// Reconstructs an instance from a payload written by pack
  static SparseAccumMap unpack(const Payload& payload) {
    PayloadHeader header = read_payload_header(payload);
    require(header.kind == static_cast<std::int32_t>(Accum::kind),
            "payload holds a different kind of accumulator");
    require(header.is_sparse == 1, "payload doesn't hold a sparse map");

    SparseAccumMap out(header.n_bins);
    std::size_t offset = sizeof(PayloadHeader);
    out.bin_of_slot_.resize(header.n_records);
    out.arena_.resize(header.n_records);
    detail::read_vals_(payload, &offset, out.bin_of_slot_.data(),
                       header.n_records);
    detail::read_vals_(payload, &offset, out.arena_.data(), header.n_records);

    out.slot_of_bin_.reserve(header.n_records);
    for (std::size_t slot = 0; slot < header.n_records; slot++) {
      require((out.bin_of_slot_[slot] >= 0) &&
                  (std::uint64_t(out.bin_of_slot_[slot]) < header.n_bins),
              "payload holds an invalid bin index");
      out.slot_of_bin_[out.bin_of_slot_[slot]] = slot;
    }
    return out;
  }

private:
  /// returns a reference to the record for bin, creating it if necessary
  Accum& slot_for_(std::size_t bin) {
    const std::int64_t key = static_cast<std::int64_t>(bin);
    auto it = slot_of_bin_.find(key);
    if (it != slot_of_bin_.end()) return arena_[it->second];

    slot_of_bin_.emplace(key, arena_.size());
    bin_of_slot_.push_back(key);
    arena_.emplace_back();
    return arena_.back();
  }

  std::size_t n_bins_ = 0;
  /// bin index of each arena slot
  std::vector<std::int64_t> bin_of_slot_;
  std::vector<Accum> arena_;
  std::unordered_map<std::int64_t, std::size_t> slot_of_bin_;
};

#endif /* SPARSE_MAP_H */
