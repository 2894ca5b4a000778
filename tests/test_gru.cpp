#include "gru/model.hpp"
#include "tsforecast/ml/errors.hpp"
#include "tsforecast/ml/trainer.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

using namespace tsforecast;
using namespace tsforecast::testing;

namespace {

constexpr int kDays = 40;
constexpr int kInst = 5;
constexpr int64_t kFeat = 4;   // d_feat 2 x 2 steps

ml::ModelConfig gru_cfg() {
  ml::ModelConfig cfg;
  cfg.d_feat = 2;
  cfg.hidden_size = 8;
  cfg.num_layers = 1;
  cfg.n_epochs = 4;
  cfg.lr = 1e-2;
  cfg.batch_size = 16;
  cfg.early_stop = 10;
  cfg.GPU = -1;
  cfg.seed = 3;
  return cfg;
}

ml::DatasetH make_dataset(ml::DatasetH::SegmentMap segments = three_way(kDays)) {
  return ml::DatasetH(make_panel(kDays, kInst, kFeat, 11), std::move(segments));
}

} // namespace

TEST(GRUNet, ForwardShape) {
  ml::GRUNet net(3, 8, 2, 0.0);
  EXPECT_EQ(net->forward(torch::randn({5, 3 * 7})).sizes(), torch::IntArrayRef({5}));
  // a single sample still yields a 1-d batch
  EXPECT_EQ(net->forward(torch::randn({1, 3 * 7})).sizes(), torch::IntArrayRef({1}));
}

TEST(GRU, PredictBeforeFitThrows) {
  ml::GRU model(gru_cfg());
  auto ds = make_dataset();
  EXPECT_EQ(model.state(), ml::ModelState::Uninitialized);
  EXPECT_THROW(model.predict(ds), ml::NotFittedError);
}

TEST(GRU, TrainEpochClipsGradients) {
  auto cfg = gru_cfg();
  cfg.batch_size = 32;
  ml::GRU model(cfg);
  auto ds = make_dataset();
  auto train = ds.prepare("train", ml::ColSet::FeatureLabel, ml::DataKey::Learn);
  train.label = train.label * 1e4;
  model.train_epoch(train);
  for (const auto& p : model.network().parameters()) {
    ASSERT_TRUE(p.grad().defined());
    EXPECT_LE(p.grad().abs().max().item<float>(), 3.0f + 1e-6f);
  }
}

TEST(GRU, FitWritesCheckpointsAndRecords) {
  TempDir tmp;
  auto rec = std::make_shared<CountingRecorder>();
  ml::Collaborators deps;
  deps.recorder = rec;
  ml::GRU model(gru_cfg(), deps);
  auto ds = make_dataset();
  ml::EvalsResult evals;
  model.fit(ds, evals, tmp.str());

  EXPECT_EQ(model.state(), ml::ModelState::Fitted);
  EXPECT_EQ(evals.train.size(), 4u);
  EXPECT_EQ(evals.valid.size(), 4u);
  for (int step = 0; step < 4; ++step) {
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "model_ckpt" / ("model_" + std::to_string(step) + "_params.pt")));
  }
  EXPECT_TRUE(std::filesystem::exists(tmp.path() / "model_ckpt" / "base_model_params.pt"));
  EXPECT_EQ(rec->artifacts.size(), 5u);
  EXPECT_EQ(rec->metrics_calls, 4);
  EXPECT_TRUE(rec->last_metrics.count("valid"));
  for (const auto& dir : rec->artifact_dirs) EXPECT_EQ(dir, "models");
}

TEST(GRU, RestoresBestEpochParameters) {
  TempDir tmp;
  auto cfg = gru_cfg();
  cfg.n_epochs = 6;
  cfg.lr = 5e-2;
  ml::GRU model(cfg);
  auto ds = make_dataset();
  ml::EvalsResult evals;
  model.fit(ds, evals, tmp.str());

  const auto best = std::max_element(evals.valid.begin(), evals.valid.end()) - evals.valid.begin();
  auto expected = ml::Trainer::load_state(
      (tmp.path() / "model_ckpt" / ("model_" + std::to_string(best) + "_params.pt")).string(), torch::kCPU);
  auto base = ml::Trainer::load_state((tmp.path() / "model_ckpt" / "base_model_params.pt").string(), torch::kCPU);
  for (const auto& kv : model.network().named_parameters()) {
    EXPECT_TRUE(torch::equal(kv.value().cpu(), expected[kv.key()])) << kv.key();
    EXPECT_TRUE(torch::equal(kv.value().cpu(), base[kv.key()])) << kv.key();
  }
}

TEST(GRU, EarlyStopsOnFlatValidation) {
  TempDir tmp;
  auto cfg = gru_cfg();
  cfg.optimizer = "GD";
  cfg.lr = 0.0;
  cfg.n_epochs = 50;
  cfg.early_stop = 3;
  ml::GRU model(cfg);
  auto ds = make_dataset();
  ml::EvalsResult evals;
  model.fit(ds, evals, tmp.str());
  EXPECT_EQ(evals.valid.size(), 4u);
  EXPECT_FALSE(std::filesystem::exists(tmp.path() / "model_ckpt" / "model_4_params.pt"));
}

TEST(GRU, SeededFitsAreReproducible) {
  TempDir a, b;
  auto ds = make_dataset();
  ml::GRU first(gru_cfg());
  ml::EvalsResult ea;
  first.fit(ds, ea, a.str());
  ml::GRU second(gru_cfg());
  ml::EvalsResult eb;
  second.fit(ds, eb, b.str());
  EXPECT_TRUE(same_parameters(first.network(), second.network()));
  EXPECT_EQ(ea.valid, eb.valid);
}

TEST(GRU, PredictionsAlignWithSegmentIndex) {
  TempDir tmp;
  ml::GRU model(gru_cfg());
  auto ds = make_dataset();
  ml::EvalsResult evals;
  model.fit(ds, evals, tmp.str());

  auto x_test = ds.prepare("test", ml::ColSet::Feature, ml::DataKey::Infer);
  auto pred = model.predict(ds);
  ASSERT_EQ(pred.size(), 50);   // three full batches plus a partial one
  EXPECT_EQ(pred.index, x_test.index);

  torch::NoGradGuard ng;
  model.network().eval();
  auto* net = dynamic_cast<ml::GRUNetImpl*>(&model.network());
  ASSERT_NE(net, nullptr);
  EXPECT_TRUE(torch::allclose(pred.values, net->forward(x_test.feature)));
}

TEST(GRU, ReloadsBestCheckpoint) {
  TempDir tmp;
  ml::GRU model(gru_cfg());
  auto ds = make_dataset();
  ml::EvalsResult evals;
  model.fit(ds, evals, tmp.str());

  auto cfg = gru_cfg();
  cfg.seed = 99;
  cfg.init_model_path = (tmp.path() / "model_ckpt" / "base_model_params.pt").string();
  ml::GRU loaded(cfg);
  EXPECT_EQ(loaded.state(), ml::ModelState::Loaded);
  EXPECT_TRUE(torch::equal(model.predict(ds).values, loaded.predict(ds).values));
}

TEST(GRU, EmptyTrainingSegmentFails) {
  TempDir tmp;
  ml::GRU model(gru_cfg());
  auto ds = make_dataset({{"train", {"X0000", "X0009"}}, {"valid", {day(0), day(9)}}});
  ml::EvalsResult evals;
  EXPECT_THROW(model.fit(ds, evals, tmp.str()), std::invalid_argument);
  EXPECT_EQ(model.state(), ml::ModelState::Failed);
  EXPECT_THROW(model.predict(ds, ml::Segment("valid")), ml::NotFittedError);
}

TEST(GRU, FitWithoutValidationKeepsLastEpoch) {
  TempDir tmp;
  auto rec = std::make_shared<CountingRecorder>();
  ml::Collaborators deps;
  deps.recorder = rec;
  ml::GRU model(gru_cfg(), deps);
  auto ds = make_dataset({{"train", {day(0), day(29)}}});
  ml::EvalsResult evals;
  model.fit(ds, evals, tmp.str());

  EXPECT_EQ(evals.train.size(), 4u);
  EXPECT_TRUE(evals.valid.empty());
  EXPECT_FALSE(rec->last_metrics.count("valid"));
  auto last = ml::Trainer::load_state((tmp.path() / "model_ckpt" / "model_3_params.pt").string(), torch::kCPU);
  for (const auto& kv : model.network().named_parameters()) {
    EXPECT_TRUE(torch::equal(kv.value().cpu(), last[kv.key()])) << kv.key();
  }
}

TEST(GRU, SavePathFallsBackToKwargs) {
  TempDir tmp;
  auto cfg = gru_cfg();
  cfg.n_epochs = 1;
  cfg.kwargs["save_path"] = tmp.str();
  ml::GRU model(cfg);
  auto ds = make_dataset();
  ml::EvalsResult evals;
  model.fit(ds, evals);
  EXPECT_TRUE(std::filesystem::exists(tmp.path() / "model_ckpt" / "base_model_params.pt"));
}

TEST(GRU, FailedFitCanBeRetried) {
  TempDir tmp;
  ml::GRU model(gru_cfg());
  auto bad = make_dataset({{"train", {"X0000", "X0009"}}});
  ml::EvalsResult evals;
  EXPECT_THROW(model.fit(bad, evals, tmp.str()), std::invalid_argument);
  ASSERT_EQ(model.state(), ml::ModelState::Failed);

  auto good = make_dataset();
  model.fit(good, evals, tmp.str());
  EXPECT_EQ(model.state(), ml::ModelState::Fitted);
  EXPECT_EQ(model.predict(good).size(), 50);
}

TEST(GRU, WarnsWhenValidationHasNoFullBatch) {
  TempDir tmp;
  auto cfg = gru_cfg();
  cfg.n_epochs = 2;
  ml::GRU model(cfg);
  // 5 validation rows against a batch of 16
  auto ds = make_dataset({{"train", {day(0), day(19)}}, {"valid", {day(20), day(20)}}});
  ml::EvalsResult evals;
  ::testing::internal::CaptureStderr();
  model.fit(ds, evals, tmp.str());
  const auto err = ::testing::internal::GetCapturedStderr();

  ASSERT_EQ(evals.valid.size(), 2u);
  EXPECT_TRUE(std::isnan(evals.valid[0]));
  EXPECT_NE(err.find("no full batch of 16 in 5 samples"), std::string::npos);
  EXPECT_EQ(model.state(), ml::ModelState::Fitted);
}
