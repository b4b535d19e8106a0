// Tests of the MPI backend. This executable is launched with several MPI
// processes, so it provides its own main.

#include <cmath>
#include <cstdint>
#include <vector>

#include <gtest/gtest.h>
#include <mpi.h>

#include "calculators.hpp"
#include "mpi_communicator.hpp"
#include "testing_utils.hpp"

namespace {

std::vector<Datum> chunk_of(const std::vector<Datum>& data, int rank,
                            int nproc) {
  std::vector<Datum> out;
  for (std::size_t i = rank; i < data.size(); i += nproc) {
    out.push_back(data[i]);
  }
  return out;
}

}  // namespace

TEST(MpiCollectTest, EndToEndExample) {
  MpiCommunicator comm(MPI_COMM_WORLD);
  const double nproc = comm.size();

  for (CollectMode mode : {CollectMode::gather, CollectMode::allreduce}) {
    ParallelMeanVariance calc(2);
    calc.add_datum(0, 1.0, 1.0);
    calc.add_datum(0, 3.0, 1.0);
    calc.add_datum(1, 10.0, 2.0);

    MeanVarianceResult out;
    ASSERT_EQ(calc.collect(comm, mode, &out), CollectStatus::success);
    if ((mode == CollectMode::gather) && (comm.rank() != 0)) {
      EXPECT_FALSE(out.has_data);
      continue;
    }
    ASSERT_TRUE(out.has_data);
    EXPECT_TRUE(arrays_close(out.weight, {2.0 * nproc, 2.0 * nproc}));
    EXPECT_TRUE(arrays_close(out.mean, {2.0, 10.0}));
    EXPECT_TRUE(arrays_close(out.variance, {1.0, 0.0}));
  }
}

TEST(MpiCollectTest, MatchesSerialReference) {
  MpiCommunicator comm(MPI_COMM_WORLD);
  const std::size_t n_bins = 11;
  // every process generates the same dataset and keeps its own share
  std::vector<Datum> data = make_dataset(2500, n_bins, true, 1234, 3);
  ReferenceStats ref = reference_stats(data, n_bins);

  for (bool sparse : {false, true}) {
    ParallelMeanVariance calc(n_bins, sparse ^ (comm.rank() == 1));
    for (const Datum& d : chunk_of(data, comm.rank(), comm.size())) {
      calc.add_datum(d.bin, d.value, d.weight);
    }
    MeanVarianceResult out;
    ASSERT_EQ(calc.collect(comm, CollectMode::allreduce, &out),
              CollectStatus::success);
    ASSERT_TRUE(out.has_data);
    EXPECT_TRUE(arrays_close(out.weight, ref.weight));
    EXPECT_TRUE(arrays_close(out.mean, ref.mean));
    EXPECT_TRUE(arrays_close(out.variance, ref.variance, 1e-8, 1e-12));
    EXPECT_TRUE(std::isnan(out.mean[3]));
  }
}

TEST(MpiCollectTest, GatherToLastRank) {
  MpiCommunicator comm(MPI_COMM_WORLD);
  const int root = comm.size() - 1;

  ParallelHistogram hist(std::vector<double>{0.0, 1.0, 2.0});
  hist.add_datum(0.5);
  hist.add_datum(1.5);
  hist.add_datum(-3.0);

  ParallelHistogram::Result out;
  ASSERT_EQ(hist.collect(comm, CollectMode::gather, &out, root),
            CollectStatus::success);
  EXPECT_EQ(out.has_data, comm.rank() == root);
  if (comm.rank() == root) {
    const std::int64_t n = comm.size();
    EXPECT_EQ(out.counts, (std::vector<std::int64_t>{n, n}));
  }
}

TEST(MpiCollectTest, SizeMismatch) {
  MpiCommunicator comm(MPI_COMM_WORLD);
  if (comm.size() < 2) GTEST_SKIP() << "needs at least 2 processes";

  ParallelSum calc((comm.rank() == 0) ? 5 : 6);
  calc.add_datum(0, 1.0);
  SumResult out;
  EXPECT_EQ(calc.collect(comm, CollectMode::allreduce, &out),
            CollectStatus::size_mismatch);
  EXPECT_FALSE(out.has_data);
}

TEST(MpiCommunicatorTest, Bcast) {
  MpiCommunicator comm(MPI_COMM_WORLD);
  const int root = comm.size() / 2;

  Payload payload;
  if (comm.rank() == root) {
    const std::int64_t vals[3] = {7, -8, 9};
    detail::append_vals_(payload, vals, 3);
  }
  ASSERT_TRUE(comm.bcast(payload, root));

  std::int64_t vals[3];
  std::size_t offset = 0;
  detail::read_vals_(payload, &offset, vals, 3);
  EXPECT_EQ(vals[0], 7);
  EXPECT_EQ(vals[1], -8);
  EXPECT_EQ(vals[2], 9);
}

TEST(MpiCommunicatorTest, MultiMessagePayloads) {
  // 7-byte messages split every payload into many pieces
  MpiCommunicator small(MPI_COMM_WORLD, 7);
  MpiCommunicator comm(MPI_COMM_WORLD);

  Payload payload;
  if (comm.rank() == 0) {
    for (std::int64_t i = 0; i < 50; i++) detail::append_vals_(payload, &i, 1);
  }
  ASSERT_TRUE(small.bcast(payload, 0));
  ASSERT_EQ(payload.size(), 50 * sizeof(std::int64_t));
  std::int64_t last;
  std::size_t offset = 49 * sizeof(std::int64_t);
  detail::read_vals_(payload, &offset, &last, 1);
  EXPECT_EQ(last, 49);

  const std::size_t n_bins = 23;
  std::vector<Datum> data = make_dataset(3000, n_bins, true, 99);
  for (CollectMode mode : {CollectMode::gather, CollectMode::allreduce}) {
    MeanVarianceResult expected, out;
    ParallelMeanVariance ref_calc(n_bins), calc(n_bins, true);
    for (const Datum& d : chunk_of(data, comm.rank(), comm.size())) {
      ref_calc.add_datum(d.bin, d.value, d.weight);
      calc.add_datum(d.bin, d.value, d.weight);
    }
    ASSERT_EQ(ref_calc.collect(comm, mode, &expected), CollectStatus::success);
    ASSERT_EQ(calc.collect(small, mode, &out), CollectStatus::success);
    EXPECT_EQ(out.has_data, expected.has_data);
    if (!out.has_data) continue;
    EXPECT_TRUE(arrays_close(out.weight, expected.weight, 1e-12, 0.0));
    EXPECT_TRUE(arrays_close(out.mean, expected.mean, 1e-12, 0.0));
    EXPECT_TRUE(arrays_close(out.variance, expected.variance, 1e-10, 1e-14));
  }
}

int main(int argc, char** argv) {
  MPI_Init(&argc, &argv);
  ::testing::InitGoogleTest(&argc, argv);

  // only the root process reports results
  int rank;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  if (rank != 0) {
    ::testing::TestEventListeners& listeners =
        ::testing::UnitTest::GetInstance()->listeners();
    delete listeners.Release(listeners.default_result_printer());
  }

  int result = RUN_ALL_TESTS();

  // the exit code has to reflect failures on any process
  int global_result;
  MPI_Allreduce(&result, &global_result, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
  MPI_Finalize();
  return global_result;
}
