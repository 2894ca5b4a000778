#include "tsforecast/engine/engine.hpp"
#include "tsforecast/api/api_server.hpp"
#include "tsforecast/engine/stop_signal.hpp"
#include "tsforecast/log.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace tsforecast {
namespace engine {

std::unique_ptr<Engine> Engine::create(){ return std::make_unique<Engine>(); }
Engine::~Engine() = default;

EngineState Engine::loadConfig(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    TSFLOG_W("engine config %s not found, using defaults", path.c_str());
    return EngineState::Success;
  }
  std::ifstream ifs(path);
  auto j = nlohmann::json::parse(ifs, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    TSFLOG_E("invalid engine config: %s", path.c_str());
    return EngineState::ConfigError;
  }
  try {
    cfg_.ip        = j.value("ip", cfg_.ip);
    cfg_.api_port  = j.value("api_port", cfg_.api_port);
    cfg_.runs_dir  = j.value("runs_dir", cfg_.runs_dir);
    cfg_.log_dir   = j.value("log_dir", cfg_.log_dir);
    cfg_.log_level = j.value("log_level", cfg_.log_level);
  } catch (const nlohmann::json::exception& e) {
    TSFLOG_E("engine config %s: %s", path.c_str(), e.what());
    return EngineState::ConfigError;
  }

  log::Level lv;
  if (!log::parse_level(cfg_.log_level, lv)) {
    TSFLOG_E("unknown log_level %s", cfg_.log_level.c_str());
    return EngineState::ConfigError;
  }
  log::set_log_level(lv);
  if (!cfg_.log_dir.empty()) log::start_log_thread(cfg_.log_dir);
  return EngineState::Success;
}

EngineState Engine::init() {
  try {
    api_ = std::make_unique<ApiServer>(cfg_.ip, cfg_.api_port, cfg_.runs_dir);
    api_->init();
  } catch (const std::exception& e) {
    TSFLOG_E("engine init failed: %s", e.what());
    return EngineState::InitError;
  }
  return EngineState::Success;
}

EngineState Engine::run() const {
  if (!api_) return EngineState::RunError;
  StopSignal::install();
  std::thread t([this](){ api_->start(); });

  while(!StopSignal::requested()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
  TSFLOG_W("signal %d, stopping api server", StopSignal::last());

  api_->stop();
  if (t.joinable()) t.join();
  return EngineState::Success;
}

EngineState Engine::release() {
  api_.reset();
  log::stop_log_thread();
  return EngineState::Success;
}

} // namespace engine
} // namespace tsforecast
