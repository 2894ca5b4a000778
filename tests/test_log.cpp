#include "tsforecast/engine/stop_signal.hpp"
#include "tsforecast/log.h"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace tsforecast;
using namespace tsforecast::testing;

namespace {

std::string slurp(const std::filesystem::path& p) {
  std::ifstream ifs(p);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

} // namespace

TEST(Log, FileSinkSplitsByLevelAndFlushesOnStop) {
  TempDir tmp;
  const auto saved = log::log_level();
  log::set_log_level(log::Level::Info);
  log::start_log_thread(tmp.str());
  TSFLOG_D("hidden %d", 1);
  TSFLOG_I("epoch %d", 3);
  TSFLOG_W("no full batch in %s", "valid");
  log::stop_log_thread();
  log::stop_log_thread();
  log::set_log_level(saved);

  const auto info = slurp(tmp.path() / "INFO.log");
  EXPECT_NE(info.find("[INFO] ["), std::string::npos);
  EXPECT_NE(info.find("epoch 3"), std::string::npos);
  EXPECT_NE(slurp(tmp.path() / "WARN.log").find("no full batch in valid"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(tmp.path() / "DEBUG.log"));
}

TEST(LogDeathTest, RunningSinkIsJoinedAtExit) {
  TempDir tmp;
  const auto dir = tmp.str();
  EXPECT_EXIT(
      {
        log::start_log_thread(dir);
        TSFLOG_I("exiting without stop");
        std::exit(0);
      },
      ::testing::ExitedWithCode(0), "");
}

TEST(StopSignal, HandlerDoesNotTouchLogger) {
  engine::StopSignal::reset();
  engine::StopSignal::install();
  {
    // a signal landing while this thread holds the log mutex must not block
    std::lock_guard<std::mutex> lk(log::Sink::get().mu);
    std::raise(SIGTERM);
  }
  EXPECT_TRUE(engine::StopSignal::requested());
  EXPECT_EQ(engine::StopSignal::last(), SIGTERM);
  engine::StopSignal::reset();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}
