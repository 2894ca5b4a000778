#pragma once
#include <atomic>
#include <csignal>

namespace tsforecast {
namespace engine {

// SIGINT/SIGTERM latch. The handler only stores atomics; callers log after observing it.
class StopSignal {
public:
  static void install() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
  }
  static bool requested() { return flag().load(); }
  static int last() { return last_signal().load(); }
  static void reset() {
    flag() = false;
    last_signal() = 0;
  }

private:
  static void onSignal(int s) {
    last_signal() = s;
    flag() = true;
  }
  static std::atomic<bool>& flag() {
    static std::atomic<bool> f{false};
    return f;
  }
  static std::atomic<int>& last_signal() {
    static std::atomic<int> s{0};
    return s;
  }
};

} // namespace engine
} // namespace tsforecast
