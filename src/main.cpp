#include "tsforecast/engine/engine.hpp"
#include "tsforecast/ml/workflow.hpp"
#include "tsforecast/log.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <string>

namespace {

nlohmann::json readJson(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("cannot open " + path);
  return nlohmann::json::parse(ifs);
}

int usage() {
  TSFLOG_E("usage: tsforecast train <experiment.json> | predict <experiment.json> | serve [engine.json]");
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  if (const char* dir = std::getenv("TSFORECAST_LOG_DIR")) {
    tsforecast::log::start_log_thread(dir);
  }

  const std::string mode = (argc > 1) ? argv[1] : "serve";

  // 1) CLI train / predict
  if (mode == "train" || mode == "predict") {
    if (argc < 3) return usage();
    try {
      auto cfg = tsforecast::ml::ExperimentConfig::from_json(readJson(argv[2]));
      if (mode == "train") {
        auto res = tsforecast::ml::run_training(cfg);
        TSFLOG_I("CLI training finished: %s -> %s", cfg.model.c_str(), res.save_dir.string().c_str());
      } else {
        auto pred = tsforecast::ml::run_prediction(cfg);
        TSFLOG_I("CLI prediction finished: %lld rows", (long long)pred.size());
      }
    } catch (const std::exception& e) {
      TSFLOG_E("CLI %s failed: %s", mode.c_str(), e.what());
      tsforecast::log::stop_log_thread();
      return 1;
    }
    tsforecast::log::stop_log_thread();
    return 0;
  }
  if (mode != "serve") return usage();

  // 2) server
  const std::string cfg_path = (argc > 2) ? argv[2] : "./config/engine-config.json";
  auto eng = tsforecast::engine::Engine::create();
  if (eng->loadConfig(cfg_path) != tsforecast::engine::EngineState::Success) {
    eng->release();
    return 2;
  }
  if (eng->init() != tsforecast::engine::EngineState::Success) {
    eng->release();
    return 3;
  }
  auto ret = eng->run();
  eng->release();
  return ret==tsforecast::engine::EngineState::Success ? 0 : 4;
}
