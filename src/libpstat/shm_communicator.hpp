#ifndef SHM_COMMUNICATOR_H
#define SHM_COMMUNICATOR_H

#include <cstddef>
#include <functional>
#include <vector>

#include "communicator.hpp"

/// State shared by the participants of an in-process group
///
/// Each participant owns one slot. During a collective operation a
/// participant only writes to its own slot; it reads other slots only after a
/// team barrier.
class ProcessGroup {
public:
  explicit ProcessGroup(int nproc);

  ProcessGroup(const ProcessGroup&) = delete;
  ProcessGroup& operator=(const ProcessGroup&) = delete;

  int nproc() const noexcept { return static_cast<int>(slots_.size()); }

private:
  friend class ThreadCommunicator;
  std::vector<Payload> slots_;
};

/// Communicator whose participants are the threads of a single OpenMP
/// parallel region.
///
/// Instances must only be used inside the parallel region that was launched
/// for the group (run_in_process_group sets this up). The team barrier is
/// the only synchronization primitive, so every thread of the team must
/// participate in every collective call.
class ThreadCommunicator : public Communicator {
public:
  ThreadCommunicator(ProcessGroup& group, int rank);

  int rank() const noexcept override { return rank_; }
  int size() const noexcept override { return group_->nproc(); }

  bool reduce(Payload& payload, const CombineFn& combine, int root) override;
  bool allreduce(Payload& payload, const CombineFn& combine) override;
  bool bcast(Payload& payload, int root) override;

private:
  ProcessGroup* group_;
  int rank_;
};

/// Runs ``fn`` once per participant of a freshly created in-process group.
///
/// Each participant runs on its own OpenMP thread and receives its own
/// ThreadCommunicator. This returns after every participant has finished.
///
/// @param nproc The number of participants. A value of 0 falls back to
///     the OMP_NUM_THREADS environment variable (or 1 if it isn't set).
///
/// @note
/// When the library is compiled without OpenMP, only groups with a single
/// participant can be created.
void run_in_process_group(std::size_t nproc,
                          const std::function<void(Communicator&)>& fn);

/// returns whether the library was compiled with openmp support
bool compiled_with_openmp();

#endif /* SHM_COMMUNICATOR_H */
