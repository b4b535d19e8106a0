#include "calculators.hpp"

#include <vector>

namespace {  // anonymous namespace

// these helpers convert the combined records to result arrays

void fill_result_(const std::vector<WeightedSumAccum>& records, bool has_data,
                  SumResult* out) {
  *out = SumResult();
  out->has_data = has_data;
  if (!has_data) return;

  const std::size_t n_bins = records.size();
  out->weight.resize(n_bins);
  out->sum.resize(n_bins);
  for (std::size_t i = 0; i < n_bins; i++) {
    out->weight[i] = records[i].weight;
    out->sum[i] = records[i].sum;
  }
}

void fill_result_(const std::vector<WeightedMeanAccum>& records,
                  bool has_data, MeanResult* out) {
  *out = MeanResult();
  out->has_data = has_data;
  if (!has_data) return;

  const std::size_t n_bins = records.size();
  out->weight.resize(n_bins);
  out->mean.resize(n_bins);
  for (std::size_t i = 0; i < n_bins; i++) {
    out->weight[i] = records[i].weight;
    out->mean[i] = mean_or_nan(records[i]);
  }
}

void fill_result_(const std::vector<WeightedMeanVarAccum>& records,
                  bool has_data, MeanVarianceResult* out) {
  *out = MeanVarianceResult();
  out->has_data = has_data;
  if (!has_data) return;

  const std::size_t n_bins = records.size();
  out->weight.resize(n_bins);
  out->mean.resize(n_bins);
  out->variance.resize(n_bins);
  for (std::size_t i = 0; i < n_bins; i++) {
    out->weight[i] = records[i].weight;
    out->mean[i] = mean_or_nan(records[i]);
    out->variance[i] = variance_or_nan(records[i]);
  }
}

}  // namespace

CollectStatus ParallelSum::collect(Communicator& comm, CollectMode mode,
                                   SumResult* out, int root) {
  std::vector<WeightedSumAccum> records;
  bool has_data;
  CollectStatus status =
      collect_records_(comm, mode, root, 0, &records, &has_data);
  fill_result_(records, has_data, out);
  return status;
}

void ParallelSum::collect(SumResult* out) {
  fill_result_(collect_local_records_(), true, out);
}

CollectStatus ParallelMean::collect(Communicator& comm, CollectMode mode,
                                    MeanResult* out, int root) {
  std::vector<WeightedMeanAccum> records;
  bool has_data;
  CollectStatus status =
      collect_records_(comm, mode, root, 0, &records, &has_data);
  fill_result_(records, has_data, out);
  return status;
}

void ParallelMean::collect(MeanResult* out) {
  fill_result_(collect_local_records_(), true, out);
}

CollectStatus ParallelMeanVariance::collect(Communicator& comm,
                                            CollectMode mode,
                                            MeanVarianceResult* out,
                                            int root) {
  std::vector<WeightedMeanVarAccum> records;
  bool has_data;
  CollectStatus status =
      collect_records_(comm, mode, root, 0, &records, &has_data);
  fill_result_(records, has_data, out);
  return status;
}

void ParallelMeanVariance::collect(MeanVarianceResult* out) {
  fill_result_(collect_local_records_(), true, out);
}
