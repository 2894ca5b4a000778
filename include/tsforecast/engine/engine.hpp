#pragma once
#include "tsforecast/engine/engine_state.hpp"
#include <memory>
#include <string>

namespace tsforecast {
namespace engine {
class ApiServer;

struct EngineConfig {
  std::string ip{"0.0.0.0"};
  int api_port{18080};
  std::string runs_dir{"./runs"};
  std::string log_dir;         // empty: console only
  std::string log_level{"INFO"};
};

class Engine {
public:
  static std::unique_ptr<Engine> create();
  ~Engine();
  EngineState loadConfig(const std::string& path);
  EngineState init();
  EngineState run() const;
  EngineState release();

  const EngineConfig& config() const { return cfg_; }

private:
  std::unique_ptr<ApiServer> api_;
  EngineConfig cfg_;
};
} // namespace engine
} // namespace tsforecast
