#pragma once
#include "tsforecast/ml/model_base.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace tsforecast {
namespace ml {

struct DatasetConfig {
  std::string csv;
  std::string label{"label"};
  DatasetH::SegmentMap segments;   // name -> [start, end] datetimes, inclusive
  int64_t step_len{0};             // > 0 builds a TSDatasetH
};

struct ExperimentConfig {
  std::string model{"gru"};
  ModelConfig model_cfg;
  DatasetConfig dataset;
  std::string save_path;
  std::string predict_segment{"test"};   // empty skips prediction after fit
  nlohmann::json reweighter = nlohmann::json::object();

  // {"model": "...", "kwargs": {...}, "dataset": {...}, "save_path": "...", ...}
  static ExperimentConfig from_json(const nlohmann::json& j);
};

struct ExperimentResult {
  std::filesystem::path save_dir;
  EvalsResult evals;
  Series predictions;
};

std::unique_ptr<DatasetH> make_dataset(const DatasetConfig& cfg);

// fit, then predict `predict_segment`; writes evals.json, pred.csv and recorder/ under the save dir
ExperimentResult run_training(const ExperimentConfig& cfg);
// loads kwargs.init_model_path and predicts `predict_segment`
Series run_prediction(const ExperimentConfig& cfg);

void write_predictions_csv(const Series& pred, const std::filesystem::path& path);
nlohmann::json to_json(const EvalsResult& evals);
nlohmann::json to_json(const Series& pred);

} // namespace ml
} // namespace tsforecast
