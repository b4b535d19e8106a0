#ifndef PAYLOAD_H
#define PAYLOAD_H

#include <cstdint>
#include <cstring>  // std::memcpy
#include <type_traits>
#include <vector>

#include "accumulators.hpp"  // AccumKind
#include "utils.hpp"

/// An opaque message exchanged by the communicator backends
using Payload = std::vector<char>;

/// Leading bytes of every payload that carries accumulator storage
///
/// A dense payload is followed by ``n_records`` records (one per bin). A
/// sparse payload is followed by ``n_records`` int64 bin indices and then by
/// ``n_records`` records.
struct PayloadHeader {
  std::int32_t kind;
  std::int32_t is_sparse;
  std::uint64_t n_bins;
  std::uint64_t n_records;
};

namespace detail {

template <typename T>
void append_vals_(Payload& payload, const T* vals, std::size_t n) {
  static_assert(std::is_trivially_copyable_v<T>);
  if (n == 0) return;
  std::size_t offset = payload.size();
  payload.resize(offset + sizeof(T) * n);
  std::memcpy(payload.data() + offset, vals, sizeof(T) * n);
}

/// copies ``n`` values out of payload, starting at ``*offset``, and advances
/// ``*offset`` past them
template <typename T>
void read_vals_(const Payload& payload, std::size_t* offset, T* vals,
                std::size_t n) {
  static_assert(std::is_trivially_copyable_v<T>);
  require((*offset + sizeof(T) * n) <= payload.size(),
          "payload is shorter than its header claims");
  if (n == 0) return;
  std::memcpy(vals, payload.data() + *offset, sizeof(T) * n);
  *offset += sizeof(T) * n;
}

}  // namespace detail

/// Reads the header at the start of a payload
inline PayloadHeader read_payload_header(const Payload& payload) {
  PayloadHeader header;
  std::size_t offset = 0;
  detail::read_vals_(payload, &offset, &header, 1);
  return header;
}

#endif /* PAYLOAD_H */
