#ifndef ACCUM_STORAGE_H
#define ACCUM_STORAGE_H

#include <type_traits>  // std::decay_t
#include <variant>
#include <vector>

#include "dense_array.hpp"
#include "payload.hpp"
#include "sparse_map.hpp"

/// Per-bin storage of a calculator: either a dense array or a sparse map
template <typename Accum>
using AccumStorage = std::variant<DenseAccumArray<Accum>, SparseAccumMap<Accum>>;

template <typename Accum>
AccumStorage<Accum> build_storage(std::size_t n_bins, bool sparse) {
  if (sparse) return SparseAccumMap<Accum>(n_bins);
  return DenseAccumArray<Accum>(n_bins);
}

template <typename Accum>
std::size_t storage_n_bins(const AccumStorage<Accum>& storage) noexcept {
  return std::visit([](const auto& s) { return s.n_bins(); }, storage);
}

template <typename Accum>
FORCE_INLINE void storage_add_entry(AccumStorage<Accum>& storage,
                                    std::size_t bin, double val,
                                    double weight) {
  std::visit([=](auto& s) { s.add_entry(bin, val, weight); }, storage);
}

template <typename Accum>
std::vector<Accum> storage_to_dense(const AccumStorage<Accum>& storage) {
  return std::visit([](const auto& s) { return s.to_dense(); }, storage);
}

template <typename Accum>
void pack_storage(const AccumStorage<Accum>& storage, Payload& payload) {
  std::visit([&](const auto& s) { s.pack(payload); }, storage);
}

/// Reconstructs the storage from a payload written by pack_storage. The
/// alternative (dense or sparse) is taken from the payload header.
template <typename Accum>
AccumStorage<Accum> unpack_storage(const Payload& payload) {
  PayloadHeader header = read_payload_header(payload);
  if (header.is_sparse) return SparseAccumMap<Accum>::unpack(payload);
  return DenseAccumArray<Accum>::unpack(payload);
}

/// Updates `primary` to include the values from `other`
///
/// The two arguments don't need to hold the same alternative. When a dense
/// array meets a sparse map, the result is dense.
template <typename Accum>
void consolidate_storage(AccumStorage<Accum>& primary,
                         const AccumStorage<Accum>& other) {
  using Dense = DenseAccumArray<Accum>;
  using Sparse = SparseAccumMap<Accum>;

  if (std::holds_alternative<Sparse>(primary) &&
      std::holds_alternative<Dense>(other)) {
    primary = Dense(std::get<Sparse>(primary).to_dense());
  }

  std::visit(
      [&](auto& p) {
        using T = std::decay_t<decltype(p)>;
        if (std::holds_alternative<T>(other)) {
          p.consolidate_with_other(std::get<T>(other));
        } else {
          // p must be dense and other must be sparse
          std::get<Sparse>(other).for_each(
              [&](std::size_t bin, const Accum& accum) {
                p.set(bin, consolidate(p.get(bin), accum));
              });
        }
      },
      primary);
}

#endif /* ACCUM_STORAGE_H */
