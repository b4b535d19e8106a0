#ifndef REDUCTION_H
#define REDUCTION_H

#include <cstdint>
#include <cstring>  // std::memcpy
#include <vector>

#include "accum_storage.hpp"
#include "communicator.hpp"
#include "payload.hpp"

/// Outcome of a collect call
enum class CollectStatus {
  success,
  /// the participants were constructed with different sizes, bin edges or
  /// accumulator kinds. Every participant gets this status.
  size_mismatch,
  /// the communication backend reported an error
  comm_failure
};

inline const char* collect_status_str(CollectStatus status) noexcept {
  switch (status) {
    case CollectStatus::success:
      return "success";
    case CollectStatus::size_mismatch:
      return "size mismatch between participants";
    case CollectStatus::comm_failure:
      return "collective communication failure";
  }
  return "unknown";
}

/// Summarizes the shape of a participant's storage. The signatures of all
/// participants are compared before any accumulator data moves.
struct CollectSignature {
  std::int32_t kind = 0;
  std::int32_t mismatch = 0;
  std::uint64_t n_bins = 0;
  /// digest of any additional construction arguments (e.g. histogram edges)
  std::uint64_t extra_digest = 0;
};

/// FNV-1a digest of an array of doubles. Used to compare bin edges across
/// participants without sending them.
inline std::uint64_t digest_f64_array(const double* vals, std::size_t n) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (std::size_t i = 0; i < n; i++) {
    unsigned char bytes[sizeof(double)];
    std::memcpy(bytes, vals + i, sizeof(double));
    for (unsigned char byte : bytes) {
      hash ^= byte;
      hash *= 1099511628211ULL;
    }
  }
  return hash;
}

namespace detail {

inline CollectSignature unpack_signature_(const Payload& payload) {
  CollectSignature out;
  std::size_t offset = 0;
  read_vals_(payload, &offset, &out, 1);
  return out;
}

/// all participants learn whether any signatures differ
inline CollectStatus validate_signatures_(Communicator& comm,
                                          const CollectSignature& signature) {
  Payload payload;
  append_vals_(payload, &signature, 1);

  CombineFn combine = [](Payload& primary, const Payload& other) {
    CollectSignature p = unpack_signature_(primary);
    CollectSignature o = unpack_signature_(other);
    if ((p.kind != o.kind) || (p.n_bins != o.n_bins) ||
        (p.extra_digest != o.extra_digest) || (o.mismatch != 0)) {
      p.mismatch = 1;
    }
    primary.clear();
    append_vals_(primary, &p, 1);
  };

  if (!comm.allreduce(payload, combine)) return CollectStatus::comm_failure;
  if (unpack_signature_(payload).mismatch != 0) {
    return CollectStatus::size_mismatch;
  }
  return CollectStatus::success;
}

}  // namespace detail

/// Combines the per-bin storage of every participant in the group.
///
/// This is a collective operation: every participant must call it with the
/// same `mode` and `root`. The steps are:
///   1. the signatures are all-reduced, so that every participant can detect
///      a mismatch before any accumulator data is exchanged
///   2. the storage is packed into a payload, and the payloads are reduced
///      (or all-reduced) with a combine function that unpacks both operands,
///      consolidates them bin by bin and repacks the result
///   3. the participants that receive the result overwrite `storage` with it
///
/// @param[in]     comm The group of participants
/// @param[in]     mode Whether only `root` or all participants get the result
/// @param[in]     root Rank of the participant that receives the result in
///     gather mode (ignored in allreduce mode)
/// @param[in]     signature The shape of the local storage
/// @param[in,out] storage The local storage. It holds the combined values if
///     ``*has_result`` is set to ``true``.
/// @param[out]    has_result Indicates whether `storage` holds the result
template <typename Accum>
CollectStatus reduce_storage(Communicator& comm, CollectMode mode, int root,
                             const CollectSignature& signature,
                             AccumStorage<Accum>& storage, bool* has_result) {
  *has_result = false;

  CollectStatus status = detail::validate_signatures_(comm, signature);
  if (status != CollectStatus::success) return status;

  Payload payload;
  pack_storage(storage, payload);

  CombineFn combine = [](Payload& primary, const Payload& other) {
    AccumStorage<Accum> p = unpack_storage<Accum>(primary);
    consolidate_storage(p, unpack_storage<Accum>(other));
    primary.clear();
    pack_storage(p, primary);
  };

  bool success;
  if (mode == CollectMode::allreduce) {
    success = comm.allreduce(payload, combine);
  } else {
    success = comm.reduce(payload, combine, root);
  }
  if (!success) return CollectStatus::comm_failure;

  if ((mode == CollectMode::allreduce) || (comm.rank() == root)) {
    storage = unpack_storage<Accum>(payload);
    *has_result = true;
  }
  return CollectStatus::success;
}

#endif /* REDUCTION_H */
