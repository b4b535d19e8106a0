#ifndef MPI_COMMUNICATOR_H
#define MPI_COMMUNICATOR_H

#include <mpi.h>

#include <climits>  // INT_MAX
#include <cstddef>

#include "communicator.hpp"

/// Communicator backed by an MPI communicator
///
/// The constructor duplicates the supplied communicator, so messages sent by
/// this class never match receives posted by the caller. The duplicate uses
/// the MPI_ERRORS_RETURN error handler: failures of MPI calls are reported by
/// returning ``false`` from the collective operations rather than aborting.
///
/// Payloads of any length are supported: they are split into messages of at
/// most ``max_message_bytes`` bytes, since MPI counts are ints.
class MpiCommunicator : public Communicator {
public:
  explicit MpiCommunicator(MPI_Comm comm,
                           std::size_t max_message_bytes = INT_MAX);
  ~MpiCommunicator() override;

  MpiCommunicator(const MpiCommunicator&) = delete;
  MpiCommunicator& operator=(const MpiCommunicator&) = delete;

  int rank() const noexcept override { return rank_; }
  int size() const noexcept override { return size_; }

  bool reduce(Payload& payload, const CombineFn& combine, int root) override;
  bool allreduce(Payload& payload, const CombineFn& combine) override;
  bool bcast(Payload& payload, int root) override;

private:
  MPI_Comm comm_;
  int rank_;
  int size_;
  std::size_t max_message_bytes_;
};

#endif /* MPI_COMMUNICATOR_H */
