#ifndef DENSE_ARRAY_H
#define DENSE_ARRAY_H

#include <algorithm>  // std::fill
#include <cstdint>
#include <utility>  // std::move
#include <vector>

#include "accumulators.hpp"
#include "payload.hpp"
#include "utils.hpp"

/// Stores one accumulator record per bin in a contiguous array
template <typename Accum>
class DenseAccumArray {
public:
  DenseAccumArray() noexcept : accum_list_() {}

  explicit DenseAccumArray(std::size_t n_bins) : accum_list_(n_bins) {}

  explicit DenseAccumArray(std::vector<Accum>&& accum_list)
      : accum_list_(std::move(accum_list)) {}

  std::size_t n_bins() const noexcept { return accum_list_.size(); }

  const Accum& get(std::size_t bin) const noexcept { return accum_list_[bin]; }

  void set(std::size_t bin, const Accum& accum) {
    require(bin < accum_list_.size(), "bin index is too large");
    accum_list_[bin] = accum;
  }

  FORCE_INLINE void add_entry(std::size_t bin, double val,
                              double weight) noexcept {
    ::add_entry(accum_list_[bin], val, weight);
  }

  /// Updates the values of `*this` to include the values from `other`
  void consolidate_with_other(const DenseAccumArray& other) noexcept {
    require(other.n_bins() == n_bins(),
            "a mismatch was encountered during consolidation");
    const std::size_t stop = accum_list_.size();
    for (std::size_t i = 0; i < stop; i++) {
      accum_list_[i] = consolidate(accum_list_[i], other.accum_list_[i]);
    }
  }

  /// reset the contents (it looks as though we just initialized)
  void purge() noexcept {
    std::fill(accum_list_.begin(), accum_list_.end(), Accum{});
  }

  std::vector<Accum> to_dense() const { return accum_list_; }

  /// Appends the serialized contents to `payload`
  void pack(Payload& payload) const {
    const std::uint64_t n = accum_list_.size();
    PayloadHeader header{static_cast<std::int32_t>(Accum::kind), 0, n, n};
    detail::append_vals_(payload, &header, 1);
    detail::append_vals_(payload, accum_list_.data(), accum_list_.size());
  }

  /// Reconstructs an instance from a payload written by pack
  static DenseAccumArray unpack(const Payload& payload) {
    PayloadHeader header = read_payload_header(payload);
    require(header.kind == static_cast<std::int32_t>(Accum::kind),
            "payload holds a different kind of accumulator");
    require((header.is_sparse == 0) && (header.n_records == header.n_bins),
            "payload doesn't hold a dense array");
    std::size_t offset = sizeof(PayloadHeader);
    std::vector<Accum> accum_list(header.n_bins);
    detail::read_vals_(payload, &offset, accum_list.data(), header.n_bins);
    return DenseAccumArray(std::move(accum_list));
  }

private:
  std::vector<Accum> accum_list_;
};

#endif /* DENSE_ARRAY_H */
