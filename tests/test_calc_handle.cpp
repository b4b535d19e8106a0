#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include "calc_handle.hpp"
#include "calc_variant.hpp"

namespace {

CalcSpec make_spec(const char* statistic, size_t size, bool sparse = false) {
  CalcSpec spec;
  spec.statistic = statistic;
  spec.size = size;
  spec.bin_edges = nullptr;
  spec.n_bin_edges = 0;
  spec.sparse = sparse;
  return spec;
}

}  // namespace

TEST(CalcHandleTest, InvalidSpecs) {
  CalcSpec spec = make_spec("median", 3);
  EXPECT_EQ(calchandle_create(&spec), nullptr);
  spec = make_spec("mean", 0);
  EXPECT_EQ(calchandle_create(&spec), nullptr);
  spec = make_spec(nullptr, 3);
  EXPECT_EQ(calchandle_create(&spec), nullptr);
  EXPECT_EQ(calchandle_create(nullptr), nullptr);

  const double bad_edges[] = {0.0, 2.0, 1.0};
  spec = make_spec("histogram", 0);
  spec.bin_edges = bad_edges;
  spec.n_bin_edges = 3;
  EXPECT_EQ(calchandle_create(&spec), nullptr);
  spec.n_bin_edges = 1;
  EXPECT_EQ(calchandle_create(&spec), nullptr);
}

TEST(CalcHandleTest, BufferSizes) {
  CalcSpec spec = make_spec("variance", 4);
  void* var = calchandle_create(&spec);
  ASSERT_NE(var, nullptr);
  EXPECT_EQ(calchandle_num_bins(var), 4u);
  EXPECT_EQ(calchandle_num_f64_vals(var), 12u);
  EXPECT_EQ(calchandle_num_i64_vals(var), 0u);
  calchandle_destroy(var);

  const double edges[] = {0.0, 1.0, 2.0};
  spec = make_spec("histogram", 0);
  spec.bin_edges = edges;
  spec.n_bin_edges = 3;
  void* hist = calchandle_create(&spec);
  ASSERT_NE(hist, nullptr);
  EXPECT_EQ(calchandle_num_bins(hist), 2u);
  EXPECT_EQ(calchandle_num_f64_vals(hist), 0u);
  EXPECT_EQ(calchandle_num_i64_vals(hist), 2u);
  calchandle_destroy(hist);

  spec.statistic = "weightedhistogram";
  void* whist = calchandle_create(&spec);
  ASSERT_NE(whist, nullptr);
  EXPECT_EQ(calchandle_num_f64_vals(whist), 4u);
  calchandle_destroy(whist);
}

TEST(CalcHandleTest, AddExportRestore) {
  CalcSpec spec = make_spec("variance", 2, true);
  void* handle = calchandle_create(&spec);
  ASSERT_NE(handle, nullptr);

  const double values[] = {1.0, 3.0};
  calchandle_add_entries(handle, 0, 1, 2, values, nullptr);

  std::vector<double> f64(calchandle_num_f64_vals(handle), -1.0);
  calchandle_export_data(handle, f64.data(), nullptr);
  // layout: property j of bin i is at i + j * n_bins
  EXPECT_EQ(f64, (std::vector<double>{0.0, 2.0, 0.0, 2.0, 0.0, 2.0}));

  void* other = calchandle_create(&spec);
  calchandle_restore(other, f64.data(), nullptr);
  calchandle_consolidate_into_primary(handle, other);

  std::vector<double> merged(f64.size());
  calchandle_export_data(handle, merged.data(), nullptr);
  EXPECT_EQ(merged, (std::vector<double>{0.0, 4.0, 0.0, 2.0, 0.0, 4.0}));

  // purging first drops the existing entries
  const double weights[] = {2.0};
  calchandle_add_entries(handle, 1, 0, 1, values, weights);
  calchandle_export_data(handle, merged.data(), nullptr);
  EXPECT_EQ(merged, (std::vector<double>{2.0, 0.0, 1.0, 0.0, 0.0, 0.0}));

  calchandle_destroy(other);
  calchandle_destroy(handle);
}

TEST(CalcHandleTest, HistogramEntries) {
  const double edges[] = {0.0, 1.0, 2.0};
  CalcSpec spec = make_spec("histogram", 0);
  spec.bin_edges = edges;
  spec.n_bin_edges = 3;
  void* handle = calchandle_create(&spec);
  ASSERT_NE(handle, nullptr);

  const double values[] = {0.5, 1.5, 1.75, 7.0};
  // the bin index is ignored by histograms
  calchandle_add_entries(handle, 0, 99, 4, values, nullptr);

  std::vector<int64_t> counts(2);
  calchandle_export_data(handle, nullptr, counts.data());
  EXPECT_EQ(counts, (std::vector<int64_t>{1, 2}));
  calchandle_destroy(handle);
}

TEST(CalcHandleDeathTest, ConsolidateDifferentCalculators) {
  CalcSpec sum_spec = make_spec("sum", 2);
  CalcSpec mean_spec = make_spec("mean", 2);
  void* sum = calchandle_create(&sum_spec);
  void* mean = calchandle_create(&mean_spec);
  EXPECT_EXIT(calchandle_consolidate_into_primary(sum, mean),
              ::testing::ExitedWithCode(1), "");
  calchandle_destroy(sum);
  calchandle_destroy(mean);
}

TEST(CalcHandleDeathTest, RestoreInvalidValues) {
  CalcSpec spec = make_spec("variance", 2);
  void* handle = calchandle_create(&spec);
  // weights, then means, then m2
  const double negative_weight[] = {1.0, -1.0, 0.0, 0.0, 0.0, 0.0};
  const double negative_m2[] = {1.0, 1.0, 0.0, 0.0, -4.0, 0.0};
  EXPECT_EXIT(calchandle_restore(handle, negative_weight, nullptr),
              ::testing::ExitedWithCode(1), "");
  EXPECT_EXIT(calchandle_restore(handle, negative_m2, nullptr),
              ::testing::ExitedWithCode(1), "");
  calchandle_destroy(handle);

  const double edges[] = {0.0, 1.0, 2.0};
  spec = make_spec("histogram", 0);
  spec.bin_edges = edges;
  spec.n_bin_edges = 3;
  void* hist = calchandle_create(&spec);
  const int64_t negative_counts[] = {3, -1};
  EXPECT_EXIT(calchandle_restore(hist, nullptr, negative_counts),
              ::testing::ExitedWithCode(1), "");
  calchandle_destroy(hist);
}

TEST(CalcHandleDeathTest, ExportAfterCollect) {
  CalcVariant calc(std::in_place_type<ParallelSum>, 2, false);
  std::get<ParallelSum>(calc).add_datum(0, 5.0);
  SumResult result;
  std::get<ParallelSum>(calc).collect(&result);
  ASSERT_EQ(result.sum, (std::vector<double>{5.0, 0.0}));

  std::vector<double> f64(calchandle_num_f64_vals(&calc), -1.0);
  EXPECT_EXIT(calchandle_export_data(&calc, f64.data(), nullptr),
              ::testing::ExitedWithCode(1), "");
}
