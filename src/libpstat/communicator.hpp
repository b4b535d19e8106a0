#ifndef COMMUNICATOR_H
#define COMMUNICATOR_H

#include <functional>
#include <string>

#include "payload.hpp"

/// Specifies where the result of a collective reduction ends up
enum class CollectMode {
  gather,    ///< only the root receives the combined result
  allreduce  ///< every participant receives the combined result
};

/// Parses a collect-mode name.
///
/// "gather" and "allreduce" are recognized. "allgather" is also accepted as
/// an alias for "allreduce".
///
/// @returns ``true`` on success and ``false`` for an unrecognized name (in
///     that case `mode` is left unchanged).
inline bool parse_collect_mode(const std::string& name, CollectMode* mode) {
  if (name == "gather") {
    *mode = CollectMode::gather;
  } else if ((name == "allreduce") || (name == "allgather")) {
    *mode = CollectMode::allreduce;
  } else {
    return false;
  }
  return true;
}

/// Combines the contribution held in `other` into `primary`.
///
/// Both payloads were produced by the same packing routine on different
/// participants. The combination must be associative and commutative (up to
/// floating point rounding) since backends may apply it in any order.
using CombineFn = std::function<void(Payload& primary, const Payload& other)>;

/// Abstract interface to the collective operations of a group of
/// participants.
///
/// Every method is a collective operation: all participants in the group must
/// call it (in the same order, with the same `root`) before any of them can
/// return. Failures of the underlying transport are reported by returning
/// ``false``.
class Communicator {
public:
  virtual ~Communicator() = default;

  /// the rank of the calling participant, in ``[0, size())``
  virtual int rank() const noexcept = 0;

  /// the number of participants in the group
  virtual int size() const noexcept = 0;

  /// Combines the payloads of all participants with `combine` and stores the
  /// result in `payload` on `root`. The contents of `payload` on other
  /// participants are unspecified afterwards.
  virtual bool reduce(Payload& payload, const CombineFn& combine,
                      int root) = 0;

  /// Like reduce, but every participant receives the combined result
  virtual bool allreduce(Payload& payload, const CombineFn& combine) = 0;

  /// Overwrites `payload` on every participant with the payload from `root`
  virtual bool bcast(Payload& payload, int root) = 0;
};

#endif /* COMMUNICATOR_H */
