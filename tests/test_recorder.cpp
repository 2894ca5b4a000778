#include "tsforecast/ml/recorder.hpp"
#include "tsforecast/ml/reweighter.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <fstream>

using namespace tsforecast;
using namespace tsforecast::testing;

TEST(FileRecorder, AppendsMetricsAsJsonLines) {
  TempDir tmp;
  ml::FileRecorder rec(tmp.path() / "rec");
  rec.log_metrics(0, {{"train_loss", 1.5}, {"val_loss", std::numeric_limits<double>::quiet_NaN()}});
  rec.log_metrics(1, {{"train_loss", 1.25}});

  std::ifstream ifs(tmp.path() / "rec" / "metrics.jsonl");
  std::string line;
  std::vector<nlohmann::json> rows;
  while (std::getline(ifs, line)) rows.push_back(nlohmann::json::parse(line));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0]["step"], 0);
  EXPECT_DOUBLE_EQ(rows[0]["train_loss"].get<double>(), 1.5);
  EXPECT_TRUE(rows[0]["val_loss"].is_null());
  EXPECT_EQ(rows[1]["step"], 1);
}

TEST(FileRecorder, CopiesArtifacts) {
  TempDir tmp;
  const auto src = tmp.path() / "model_0_params.pt";
  std::ofstream(src) << "weights";
  ml::FileRecorder rec(tmp.path() / "rec");
  rec.log_artifact(src.string(), "models");
  EXPECT_TRUE(std::filesystem::exists(tmp.path() / "rec" / "artifacts" / "models" / "model_0_params.pt"));
}

TEST(TimeDecayReweighter, NewestDateHasUnitWeight) {
  ml::TSDatasetH ds(make_panel(4, 2, 2, 1), {{"all", {day(0), day(3)}}}, 2);
  auto sampler = ds.prepare_ts("all");
  auto w = ml::TimeDecayReweighter(1.0).reweight(sampler);
  ASSERT_EQ(w.size(0), sampler.size());
  for (int64_t i = 0; i < sampler.size(); ++i) {
    const auto& dt = sampler.get_index()[i].datetime;
    const float expected = dt == day(3) ? 1.f : dt == day(2) ? 0.5f : dt == day(1) ? 0.25f : 0.125f;
    EXPECT_FLOAT_EQ(w[i].item<float>(), expected);
  }
}
