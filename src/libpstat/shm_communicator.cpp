#include "shm_communicator.hpp"

#include <cstdlib>  // std::getenv
#include <utility>  // std::move

#ifdef _OPENMP
#include <omp.h>
#endif

#include "utils.hpp"

namespace {  // anonymous namespace

std::size_t get_nominal_nproc_(std::size_t nproc) noexcept {
  if (nproc != 0) return nproc;

  // this approach is crude. OMP_NUM_THREADS may not be an int
  char* var_val = std::getenv("OMP_NUM_THREADS");
  if (var_val == nullptr) return 1;
  int tmp = std::atoi(var_val);
  if (tmp <= 0) error("OMP_NUM_THREADS has an invalid value");
  return tmp;
}

}  // namespace

ProcessGroup::ProcessGroup(int nproc) : slots_() {
  require(nproc > 0, "a process group needs at least 1 participant");
  slots_.resize(nproc);
}

ThreadCommunicator::ThreadCommunicator(ProcessGroup& group, int rank)
    : group_(&group), rank_(rank) {
  require((0 <= rank) && (rank < group.nproc()), "invalid rank");
}

bool ThreadCommunicator::reduce(Payload& payload, const CombineFn& combine,
                                int root) {
  const int n = size();
  require((0 <= root) && (root < n), "invalid root");
  std::vector<Payload>& slots = group_->slots_;

  slots[rank_] = std::move(payload);
  OMP_PRAGMA(omp barrier)

  // binomial tree, using ranks relative to root. In the round with stride
  // `step`, each participant whose relative rank is a multiple of 2*step
  // folds in the slot of the participant `step` places after it. That
  // partner is idle for the rest of the reduction.
  const int rel_rank = (rank_ - root + n) % n;
  for (int step = 1; step < n; step *= 2) {
    if (((rel_rank % (2 * step)) == 0) && ((rel_rank + step) < n)) {
      const int partner = (rel_rank + step + root) % n;
      combine(slots[rank_], slots[partner]);
    }
    OMP_PRAGMA(omp barrier)
  }

  if (rank_ == root) {
    payload = std::move(slots[rank_]);
  } else {
    payload.clear();
  }
  slots[rank_].clear();
  OMP_PRAGMA(omp barrier)
  return true;
}

bool ThreadCommunicator::allreduce(Payload& payload, const CombineFn& combine) {
  return reduce(payload, combine, 0) && bcast(payload, 0);
}

bool ThreadCommunicator::bcast(Payload& payload, int root) {
  require((0 <= root) && (root < size()), "invalid root");
  std::vector<Payload>& slots = group_->slots_;

  if (rank_ == root) slots[root] = payload;
  OMP_PRAGMA(omp barrier)
  if (rank_ != root) payload = slots[root];
  OMP_PRAGMA(omp barrier)
  if (rank_ == root) slots[root].clear();
  return true;
}

void run_in_process_group(std::size_t nproc,
                          const std::function<void(Communicator&)>& fn) {
  const std::size_t nominal_nproc = get_nominal_nproc_(nproc);
#ifndef _OPENMP
  require(nominal_nproc == 1,
          "the library was compiled without OpenMP. Only groups with a "
          "single participant are supported");
#endif

  ProcessGroup group(static_cast<int>(nominal_nproc));

  if (nominal_nproc == 1) {
    ThreadCommunicator comm(group, 0);
    fn(comm);
    return;
  }

#ifdef _OPENMP
  // every participant must get its own thread, otherwise the barriers inside
  // of the collective operations deadlock
  omp_set_dynamic(0);
#endif

  OMP_PRAGMA(omp parallel num_threads(nominal_nproc)) {
#ifdef _OPENMP
    require(std::size_t(omp_get_num_threads()) == nominal_nproc,
            "OpenMP didn't provide a thread for every participant");
    const int rank = omp_get_thread_num();
#else
    const int rank = 0;
#endif
    ThreadCommunicator comm(group, rank);
    fn(comm);
  }
}

bool compiled_with_openmp() {
#ifdef _OPENMP
  return true;
#else
  return false;
#endif
}
