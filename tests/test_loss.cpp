#include "alstm/model.hpp"
#include "gru/model.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace tsforecast;

namespace {

ml::ModelConfig small_cfg() {
  ml::ModelConfig cfg;
  cfg.d_feat = 2;
  cfg.hidden_size = 4;
  cfg.num_layers = 1;
  cfg.GPU = -1;
  cfg.seed = 0;
  cfg.n_jobs = 0;
  return cfg;
}

const float kNan = std::numeric_limits<float>::quiet_NaN();

} // namespace

TEST(GRULoss, MasksNanLabels) {
  ml::GRU model(small_cfg());
  auto pred = torch::tensor({1.f, 2.f, 3.f, 4.f});
  auto label = torch::tensor({1.5f, kNan, 2.f, kNan});
  auto masked = model.loss_fn(pred, label).item<float>();
  auto filtered = model.loss_fn(torch::tensor({1.f, 3.f}), torch::tensor({1.5f, 2.f})).item<float>();
  EXPECT_FLOAT_EQ(masked, filtered);
  EXPECT_FLOAT_EQ(masked, (0.25f + 1.f) / 2.f);
}

TEST(GRULoss, MetricIsNegatedLossOverFiniteLabels) {
  ml::GRU model(small_cfg());
  auto pred = torch::tensor({1.f, 2.f, 3.f});
  auto label = torch::tensor({2.f, kNan, std::numeric_limits<float>::infinity()});
  EXPECT_FLOAT_EQ(model.metric_fn(pred, label).item<float>(), -1.f);
}

TEST(GRULoss, UnknownLossFailsOnFirstUse) {
  auto cfg = small_cfg();
  cfg.loss = "huber";
  ml::GRU model(cfg);   // construction still succeeds
  EXPECT_THROW(model.loss_fn(torch::ones({2}), torch::ones({2})), std::invalid_argument);
}

TEST(GRULoss, UnknownMetricFailsOnFirstUse) {
  auto cfg = small_cfg();
  cfg.metric = "ic";
  ml::GRU model(cfg);
  EXPECT_THROW(model.metric_fn(torch::ones({2}), torch::ones({2})), std::invalid_argument);
}

TEST(ALSTMLoss, DefaultWeightMatchesUnweighted) {
  ml::ALSTM model(small_cfg());
  auto pred = torch::tensor({0.f, 1.f, 2.f});
  auto label = torch::tensor({1.f, kNan, 0.f});
  EXPECT_FLOAT_EQ(model.loss_fn(pred, label).item<float>(), 2.5f);
  EXPECT_FLOAT_EQ(model.loss_fn(pred, label, torch::ones({3})).item<float>(), 2.5f);
}

TEST(ALSTMLoss, WeightsApplyPerSampleAfterMasking) {
  ml::ALSTM model(small_cfg());
  auto pred = torch::tensor({0.f, 1.f, 2.f});
  auto label = torch::tensor({1.f, kNan, 0.f});
  auto weight = torch::tensor({2.f, 100.f, 0.5f});
  // (2*1 + 0.5*4) / 2
  EXPECT_FLOAT_EQ(model.loss_fn(pred, label, weight).item<float>(), 2.f);
}

TEST(ALSTMLoss, MseMetricIgnoresWeights) {
  auto cfg = small_cfg();
  cfg.metric = "mse";
  ml::ALSTM model(cfg);
  auto pred = torch::tensor({0.f, 2.f});
  auto label = torch::tensor({1.f, kNan});
  EXPECT_FLOAT_EQ(model.metric_fn(pred, label).item<float>(), -1.f);
}
