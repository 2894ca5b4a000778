#include "tsforecast/ml/workflow.hpp"
#include "tsforecast/ml/recorder.hpp"
#include "tsforecast/ml/registry.hpp"
#include "tsforecast/ml/reweighter.hpp"
#include "tsforecast/ml/trainer.hpp"
#include "tsforecast/log.h"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>

using nlohmann::json;
namespace fs = std::filesystem;

namespace tsforecast {
namespace ml {

namespace {

DatasetConfig read_dataset_cfg(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("'dataset' must be a json object");
  DatasetConfig d;
  d.csv = j.value("csv", "");
  if (d.csv.empty()) throw std::invalid_argument("missing 'dataset.csv'");
  d.label = j.value("label", "label");
  d.step_len = j.value("step_len", int64_t{0});
  if (j.contains("segments")) {
    for (auto it = j["segments"].begin(); it != j["segments"].end(); ++it) {
      const auto& r = it.value();
      if (!r.is_array() || r.size() != 2) {
        throw std::invalid_argument("segment '" + it.key() + "' must be [start, end]");
      }
      d.segments[it.key()] = {r[0].get<std::string>(), r[1].get<std::string>()};
    }
  }
  return d;
}

} // namespace

ExperimentConfig ExperimentConfig::from_json(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("experiment config must be a json object");
  ExperimentConfig c;
  c.model = j.value("model", "gru");
  c.model_cfg = ModelConfig::from_json(j.value("kwargs", json::object()));
  if (!j.contains("dataset")) throw std::invalid_argument("missing 'dataset'");
  c.dataset = read_dataset_cfg(j["dataset"]);
  c.save_path = j.value("save_path", "");
  c.predict_segment = j.value("predict_segment", "test");
  c.reweighter = j.value("reweighter", json::object());
  return c;
}

std::unique_ptr<DatasetH> make_dataset(const DatasetConfig& cfg) {
  auto panel = load_panel_csv(cfg.csv, cfg.label);
  if (cfg.step_len > 0) return std::make_unique<TSDatasetH>(std::move(panel), cfg.segments, cfg.step_len);
  return std::make_unique<DatasetH>(std::move(panel), cfg.segments);
}

ExperimentResult run_training(const ExperimentConfig& cfg) {
  ExperimentResult res;
  res.save_dir = Trainer::resolve_save_dir(cfg.save_path);

  Collaborators deps;
  deps.recorder = std::make_shared<FileRecorder>(res.save_dir / "recorder");
  deps.reweighter = make_reweighter(cfg.reweighter);

  auto dataset = make_dataset(cfg.dataset);
  auto model = Registry::get().create(cfg.model, cfg.model_cfg, deps);
  model->fit(*dataset, res.evals, res.save_dir.string());

  std::ofstream(res.save_dir / "evals.json") << to_json(res.evals).dump(2) << "\n";

  if (!cfg.predict_segment.empty() && dataset->has_segment(cfg.predict_segment)) {
    res.predictions = model->predict(*dataset, cfg.predict_segment);
    write_predictions_csv(res.predictions, res.save_dir / "pred.csv");
  }
  TSFLOG_I("experiment finished: model=%s save_dir=%s", cfg.model.c_str(), res.save_dir.string().c_str());
  return res;
}

Series run_prediction(const ExperimentConfig& cfg) {
  if (!cfg.model_cfg.init_model_path || !fs::exists(*cfg.model_cfg.init_model_path)) {
    throw std::invalid_argument("predict requires an existing kwargs.init_model_path");
  }
  auto dataset = make_dataset(cfg.dataset);
  auto model = Registry::get().create(cfg.model, cfg.model_cfg);
  auto pred = model->predict(*dataset, cfg.predict_segment);
  if (!cfg.save_path.empty()) {
    fs::create_directories(cfg.save_path);
    write_predictions_csv(pred, fs::path(cfg.save_path) / "pred.csv");
  }
  return pred;
}

void write_predictions_csv(const Series& pred, const fs::path& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("cannot write " + path.string());
  ofs << std::setprecision(9);   // round-trips float32
  ofs << "datetime,instrument,score\n";
  auto values = pred.values.to(torch::kFloat32).contiguous();
  const float* v = values.data_ptr<float>();
  for (int64_t i = 0; i < pred.size(); ++i) {
    ofs << pred.index[i].datetime << "," << pred.index[i].instrument << "," << v[i] << "\n";
  }
}

json to_json(const EvalsResult& evals) {
  auto list = [](const std::vector<double>& xs) {
    json a = json::array();
    for (double x : xs) a.push_back(std::isfinite(x) ? json(x) : json(nullptr));
    return a;
  };
  return {{"train", list(evals.train)}, {"valid", list(evals.valid)}};
}

json to_json(const Series& pred) {
  json a = json::array();
  auto values = pred.values.to(torch::kFloat32).contiguous();
  const float* v = values.data_ptr<float>();
  for (int64_t i = 0; i < pred.size(); ++i) {
    a.push_back({{"datetime", pred.index[i].datetime},
                 {"instrument", pred.index[i].instrument},
                 {"score", std::isfinite(v[i]) ? json(v[i]) : json(nullptr)}});
  }
  return a;
}

} // namespace ml
} // namespace tsforecast
