#include "gru/model.hpp"
#include "tsforecast/ml/errors.hpp"
#include "tsforecast/ml/sampler.hpp"
#include "tsforecast/ml/trainer.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace tsforecast;
using namespace tsforecast::testing;

namespace {

// mirrors the epoch loop of fit: returns (epochs run, best epoch)
std::pair<int64_t, int64_t> run_schedule(const std::vector<double>& scores, int64_t patience) {
  ml::EarlyStopper stopper(patience);
  int64_t epochs = 0;
  for (int64_t step = 0; step < static_cast<int64_t>(scores.size()); ++step) {
    ++epochs;
    if (!stopper.update(step, scores[step]) && stopper.should_stop()) break;
  }
  return {epochs, stopper.best_epoch()};
}

} // namespace

TEST(EarlyStopper, StopsPatienceEpochsAfterLastImprovement) {
  // improves through epoch index 3 (k = 4 epochs), then flat
  std::vector<double> scores = {-5, -4, -3, -2, -2.5, -3, -2, -2.1, -9, -9, -9, -9};
  auto res = run_schedule(scores, 3);
  EXPECT_EQ(res.first, 4 + 3);
  EXPECT_EQ(res.second, 3);
}

TEST(EarlyStopper, BudgetCapsEpochs) {
  std::vector<double> scores = {-5, -4, -4, -4};
  auto res = run_schedule(scores, 10);
  EXPECT_EQ(res.first, 4);
  EXPECT_EQ(res.second, 1);
}

TEST(EarlyStopper, NanNeverImproves) {
  ml::EarlyStopper stopper(2);
  EXPECT_FALSE(stopper.update(0, std::numeric_limits<double>::quiet_NaN()));
  EXPECT_FALSE(stopper.update(1, std::numeric_limits<double>::quiet_NaN()));
  EXPECT_TRUE(stopper.should_stop());
  EXPECT_EQ(stopper.best_epoch(), 0);
}

TEST(Trainer, UnknownOptimizerIsNotImplemented) {
  torch::nn::Linear lin(2, 1);
  EXPECT_THROW(ml::Trainer::make_optimizer(lin->parameters(), "rmsprop", 0.1), ml::NotImplementedError);
  EXPECT_NO_THROW(ml::Trainer::make_optimizer(lin->parameters(), "ADAM", 0.1));
  EXPECT_NO_THROW(ml::Trainer::make_optimizer(lin->parameters(), "gd", 0.1));
}

TEST(Trainer, NegativeGpuNeverSelectsCuda) {
  EXPECT_FALSE(ml::Trainer::select_device(-1).is_cuda());
  if (!torch::cuda::is_available()) {
    EXPECT_FALSE(ml::Trainer::select_device(0).is_cuda());
  }
}

TEST(Trainer, StateDictRoundTripThroughFile) {
  TempDir tmp;
  torch::manual_seed(1);
  ml::GRUNet a(3, 5, 2, 0.0);
  torch::manual_seed(2);
  ml::GRUNet b(3, 5, 2, 0.0);
  ASSERT_FALSE(same_parameters(*a, *b));

  const auto path = (tmp.path() / "a.pt").string();
  ml::Trainer::save_state(ml::Trainer::state_dict(*a), path);
  ml::Trainer::load_state_dict(*b, ml::Trainer::load_state(path, torch::kCPU));
  EXPECT_TRUE(same_parameters(*a, *b));
}

TEST(Trainer, StateDictIsDeepCopy) {
  ml::GRUNet net(2, 3, 1, 0.0);
  auto original = net->fc_out->bias.detach().clone();
  auto snapshot = ml::Trainer::state_dict(*net);
  {
    torch::NoGradGuard ng;
    for (auto& p : net->parameters()) p.add_(1.0);
  }
  EXPECT_TRUE(torch::equal(snapshot["fc_out.bias"], original));
  EXPECT_FALSE(torch::equal(snapshot["fc_out.bias"], net->fc_out->bias));
}

TEST(Trainer, LoadStateDictRejectsMismatchedShapes) {
  ml::GRUNet small(2, 3, 1, 0.0);
  ml::GRUNet large(2, 4, 1, 0.0);
  EXPECT_THROW(ml::Trainer::load_state_dict(*large, ml::Trainer::state_dict(*small)), std::runtime_error);
  ml::GRUNet deep(2, 3, 2, 0.0);
  EXPECT_THROW(ml::Trainer::load_state_dict(*small, ml::Trainer::state_dict(*deep)), std::runtime_error);
}

TEST(Trainer, CheckpointNames) {
  std::filesystem::path dir("/x/model_ckpt");
  EXPECT_EQ(ml::Trainer::step_checkpoint(dir, 7).filename().string(), "model_7_params.pt");
  EXPECT_EQ(ml::Trainer::best_checkpoint(dir).filename().string(), "base_model_params.pt");
}

TEST(Trainer, ResolveSaveDirCreatesDirectories) {
  TempDir tmp;
  auto nested = ml::Trainer::resolve_save_dir((tmp.path() / "a" / "b").string());
  EXPECT_TRUE(std::filesystem::is_directory(nested));
  auto fresh1 = ml::Trainer::resolve_save_dir("");
  auto fresh2 = ml::Trainer::resolve_save_dir("");
  EXPECT_TRUE(std::filesystem::is_directory(fresh1));
  EXPECT_NE(fresh1, fresh2);
  std::filesystem::remove_all(fresh1);
  std::filesystem::remove_all(fresh2);
}

TEST(ShuffleSampler, SeededPermutationCoversAllIndices) {
  ml::ShuffleSampler a(10, 42), b(10, 42);
  std::vector<size_t> seen_a, seen_b;
  while (auto batch = a.next(3)) seen_a.insert(seen_a.end(), batch->begin(), batch->end());
  while (auto batch = b.next(3)) seen_b.insert(seen_b.end(), batch->begin(), batch->end());
  EXPECT_EQ(seen_a, seen_b);
  EXPECT_EQ(seen_a.size(), 10u);
  EXPECT_EQ(std::set<size_t>(seen_a.begin(), seen_a.end()).size(), 10u);

  a.reset();
  std::vector<size_t> second;
  while (auto batch = a.next(4)) second.insert(second.end(), batch->begin(), batch->end());
  EXPECT_EQ(second.size(), 10u);
}
