#include "tsforecast/api/api_server.hpp"
#include "tsforecast/api/handler/handler_base.hpp"
#include "tsforecast/ml/errors.hpp"
#include "tsforecast/ml/registry.hpp"
#include "tsforecast/ml/workflow.hpp"
#include "tsforecast/log.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>

using nlohmann::json;

namespace tsforecast {
namespace engine {

ApiServer::ApiServer(const std::string& ip, int port, const std::string& runs_dir)
    : ip_(ip), port_(port), runs_dir_(runs_dir) {}

void ApiServer::init() {
  registerRoutes();
  TSFLOG_I("Crow API initialized at %s:%d", ip_.c_str(), port_);
}

void ApiServer::start() {
  app_.signal_clear();
  app_.bindaddr(ip_).port(port_).multithreaded().run();
}

void ApiServer::stop() { app_.stop(); }

void ApiServer::addRoute(const std::string& path, crow::HTTPMethod method, Handler h) {
  app_.route_dynamic(path).methods(method)([h](const crow::request& req){ return h(req); });
  TSFLOG_I("Route: [%d] %s", (int)method, path.c_str());
}

void ApiServer::registerRoutes() {
  addRoute("/health", crow::HTTPMethod::Get, [this](auto& r){ return health(r); });
  addRoute("/ml/models", crow::HTTPMethod::Get, [this](auto& r){ return listModels(r); });
  addRoute("/ml/train", crow::HTTPMethod::Post, [this](auto& r){ return train(r); });
  addRoute("/ml/predict", crow::HTTPMethod::Post, [this](auto& r){ return predict(r); });
}

crow::response ApiServer::health(const crow::request&) {
  return handler::jsonResp(handler::StatusCode::_200, {{"status","ok"},{"service","tsforecast"}});
}

crow::response ApiServer::listModels(const crow::request&) {
  json j;
  j["models"] = ml::Registry::get().names();
  return handler::jsonResp(handler::StatusCode::_200, j);
}

crow::response ApiServer::train(const crow::request& req) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded()) return handler::msg(handler::StatusCode::_400, "invalid json");

  ml::ExperimentConfig cfg;
  try {
    cfg = ml::ExperimentConfig::from_json(body);
  } catch (const std::exception& e) {
    return handler::msg(handler::StatusCode::_400, e.what());
  }
  if (!ml::Registry::get().contains(cfg.model)) {
    return handler::msg(handler::StatusCode::_404, "unknown model '" + cfg.model + "'");
  }
  if (cfg.save_path.empty()) {
    const auto ts = std::chrono::system_clock::now().time_since_epoch() / std::chrono::milliseconds(1);
    cfg.save_path = (std::filesystem::path(runs_dir_) / (cfg.model + "_" + std::to_string(ts))).string();
  }

  std::unique_lock<std::mutex> lk(train_mu_, std::try_to_lock);
  if (!lk.owns_lock()) return handler::msg(handler::StatusCode::_409, "a training job is already running");

  try {
    auto res = ml::run_training(cfg);
    return handler::jsonResp(handler::StatusCode::_200, {
      {"model", cfg.model},
      {"status", "ok"},
      {"save_dir", res.save_dir.string()},
      {"evals", ml::to_json(res.evals)},
      {"n_predictions", res.predictions.size()}
    });
  } catch (const std::invalid_argument& e) {
    return handler::jsonResp(handler::StatusCode::_400, {{"model",cfg.model},{"status","fail"},{"error",e.what()}});
  } catch (const std::exception& e) {
    TSFLOG_E("train %s failed: %s", cfg.model.c_str(), e.what());
    return handler::jsonResp(handler::StatusCode::_500, {{"model",cfg.model},{"status","fail"},{"error",e.what()}});
  }
}

crow::response ApiServer::predict(const crow::request& req) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded()) return handler::msg(handler::StatusCode::_400, "invalid json");

  ml::ExperimentConfig cfg;
  try {
    cfg = ml::ExperimentConfig::from_json(body);
  } catch (const std::exception& e) {
    return handler::msg(handler::StatusCode::_400, e.what());
  }
  if (!ml::Registry::get().contains(cfg.model)) {
    return handler::msg(handler::StatusCode::_404, "unknown model '" + cfg.model + "'");
  }

  try {
    auto pred = ml::run_prediction(cfg);
    return handler::jsonResp(handler::StatusCode::_200, {
      {"model", cfg.model},
      {"segment", cfg.predict_segment},
      {"predictions", ml::to_json(pred)}
    });
  } catch (const std::invalid_argument& e) {
    return handler::msg(handler::StatusCode::_400, e.what());
  } catch (const ml::NotFittedError& e) {
    return handler::msg(handler::StatusCode::_409, e.what());
  } catch (const std::exception& e) {
    TSFLOG_E("predict %s failed: %s", cfg.model.c_str(), e.what());
    return handler::msg(handler::StatusCode::_500, e.what());
  }
}

} // namespace engine
} // namespace tsforecast
