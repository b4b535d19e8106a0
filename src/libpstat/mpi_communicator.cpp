#include "mpi_communicator.hpp"

#include <algorithm>  // std::min
#include <climits>    // INT_MAX
#include <cstdint>

#include "utils.hpp"

namespace {  // anonymous namespace

constexpr int REDUCE_TAG = 7301;

FORCE_INLINE bool mpi_ok_(int rc) noexcept { return rc == MPI_SUCCESS; }

// A payload travels as its length (one uint64) followed by as many messages
// of at most max_chunk bytes as it takes to cover it. MPI doesn't let
// messages with the same source, tag and communicator overtake each other,
// so the pieces arrive in order.

bool send_payload_(const Payload& payload, int dest, std::size_t max_chunk,
                   MPI_Comm comm) {
  std::uint64_t nbytes = payload.size();
  if (!mpi_ok_(MPI_Send(&nbytes, 1, MPI_UINT64_T, dest, REDUCE_TAG, comm))) {
    return false;
  }
  for (std::size_t offset = 0; offset < payload.size(); offset += max_chunk) {
    const int count = int(std::min(max_chunk, payload.size() - offset));
    if (!mpi_ok_(MPI_Send(payload.data() + offset, count, MPI_BYTE, dest,
                          REDUCE_TAG, comm))) {
      return false;
    }
  }
  return true;
}

bool recv_payload_(Payload* payload, int src, std::size_t max_chunk,
                   MPI_Comm comm) {
  std::uint64_t nbytes;
  if (!mpi_ok_(MPI_Recv(&nbytes, 1, MPI_UINT64_T, src, REDUCE_TAG, comm,
                        MPI_STATUS_IGNORE))) {
    return false;
  }
  payload->resize(nbytes);
  for (std::size_t offset = 0; offset < payload->size(); offset += max_chunk) {
    const int count = int(std::min(max_chunk, payload->size() - offset));
    if (!mpi_ok_(MPI_Recv(payload->data() + offset, count, MPI_BYTE, src,
                          REDUCE_TAG, comm, MPI_STATUS_IGNORE))) {
      return false;
    }
  }
  return true;
}

}  // namespace

MpiCommunicator::MpiCommunicator(MPI_Comm comm, std::size_t max_message_bytes)
    : comm_(MPI_COMM_NULL),
      rank_(0),
      size_(0),
      max_message_bytes_(max_message_bytes) {
  require((max_message_bytes > 0) &&
              (max_message_bytes <= std::size_t(INT_MAX)),
          "max_message_bytes must lie in [1, INT_MAX]");

  int initialized = 0;
  MPI_Initialized(&initialized);
  require(initialized != 0, "MPI must be initialized first");

  require(mpi_ok_(MPI_Comm_dup(comm, &comm_)), "MPI_Comm_dup failed");
  MPI_Comm_set_errhandler(comm_, MPI_ERRORS_RETURN);
  MPI_Comm_rank(comm_, &rank_);
  MPI_Comm_size(comm_, &size_);
}

MpiCommunicator::~MpiCommunicator() {
  int finalized = 0;
  MPI_Finalized(&finalized);
  if ((!finalized) && (comm_ != MPI_COMM_NULL)) MPI_Comm_free(&comm_);
}

bool MpiCommunicator::reduce(Payload& payload, const CombineFn& combine,
                             int root) {
  require((0 <= root) && (root < size_), "invalid root");

  // binomial tree, using ranks relative to root. In the round with stride
  // `step`, a participant whose relative rank is a multiple of 2*step
  // receives from the participant `step` places after it, while a
  // participant whose relative rank is an odd multiple of step sends its
  // (partially combined) payload and drops out.
  const int rel_rank = (rank_ - root + size_) % size_;
  for (int step = 1; step < size_; step *= 2) {
    if ((rel_rank % (2 * step)) == 0) {
      if ((rel_rank + step) >= size_) continue;
      const int src = (rel_rank + step + root) % size_;

      Payload other;
      if (!recv_payload_(&other, src, max_message_bytes_, comm_)) {
        return false;
      }
      combine(payload, other);
    } else {
      const int dest = (rel_rank - step + root) % size_;
      if (!send_payload_(payload, dest, max_message_bytes_, comm_)) {
        return false;
      }
      break;
    }
  }

  if (rank_ != root) payload.clear();
  return true;
}

bool MpiCommunicator::allreduce(Payload& payload, const CombineFn& combine) {
  return reduce(payload, combine, 0) && bcast(payload, 0);
}

bool MpiCommunicator::bcast(Payload& payload, int root) {
  require((0 <= root) && (root < size_), "invalid root");

  // the receivers don't know the length in advance, so it goes first
  std::uint64_t nbytes = payload.size();
  if (!mpi_ok_(MPI_Bcast(&nbytes, 1, MPI_UINT64_T, root, comm_))) return false;

  if (rank_ != root) payload.resize(nbytes);
  for (std::size_t offset = 0; offset < payload.size();
       offset += max_message_bytes_) {
    const int count =
        int(std::min(max_message_bytes_, payload.size() - offset));
    if (!mpi_ok_(MPI_Bcast(payload.data() + offset, count, MPI_BYTE, root,
                           comm_))) {
      return false;
    }
  }
  return true;
}
