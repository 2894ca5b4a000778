#pragma once

namespace tsforecast {
namespace engine {
enum class EngineState { Success, ConfigError, InitError, RunError };
} // namespace engine
} // namespace tsforecast
