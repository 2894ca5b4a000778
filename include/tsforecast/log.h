/*
 * @file log.h
 * @brief printf-style logging with an optional asynchronous file sink
 */

#ifndef TSFLOG_H
#define TSFLOG_H

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

#define TSFLOG_MSG_BUF_SIZE   1024    // user message max
#define TSFLOG_META_BUF_SIZE   128    // header
#define TSFLOG_LINE_BUF_SIZE (TSFLOG_META_BUF_SIZE + TSFLOG_MSG_BUF_SIZE)

namespace tsforecast {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* level_name(Level lv) {
  switch (lv) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
  }
  return "INFO";
}

inline bool parse_level(const std::string& s, Level& out) {
  if (s == "DEBUG" || s == "debug") { out = Level::Debug; return true; }
  if (s == "INFO"  || s == "info")  { out = Level::Info;  return true; }
  if (s == "WARN"  || s == "warn")  { out = Level::Warn;  return true; }
  if (s == "ERROR" || s == "error") { out = Level::Error; return true; }
  return false;
}

struct Sink {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::pair<Level, std::string>> queue;
  std::thread worker;
  std::filesystem::path dir;
  bool running{false};
  Level threshold{Level::Info};

  static Sink& get() {
    static Sink s;
    return s;
  }

  // joins a still-running sink at static destruction
  ~Sink() {
    {
      std::lock_guard<std::mutex> lk(mu);
      running = false;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
  }

 private:
  Sink() {
    if (const char* env = std::getenv("TSFORECAST_LOG_LEVEL")) parse_level(env, threshold);
  }
};

inline void set_log_level(Level lv) {
  auto& s = Sink::get();
  std::lock_guard<std::mutex> lk(s.mu);
  s.threshold = lv;
}

inline Level log_level() {
  auto& s = Sink::get();
  std::lock_guard<std::mutex> lk(s.mu);
  return s.threshold;
}

inline std::string time_string() {
  char buffer[20];
  std::time_t now = std::time(nullptr);
  std::tm tm_info{};
#ifdef _WIN32
  localtime_s(&tm_info, &now);
#else
  localtime_r(&now, &tm_info);
#endif
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_info);
  return buffer;
}

// drains queued lines into <dir>/<LEVEL>.log
inline void sink_loop() {
  auto& s = Sink::get();
  std::unique_lock<std::mutex> lk(s.mu);
  while (true) {
    s.cv.wait(lk, [&s] { return !s.queue.empty() || !s.running; });
    while (!s.queue.empty()) {
      auto item = std::move(s.queue.front());
      s.queue.pop_front();
      const auto path = s.dir / (std::string(level_name(item.first)) + ".log");
      lk.unlock();
      std::ofstream ofs(path, std::ios::app);
      if (ofs) ofs << item.second;
      lk.lock();
    }
    if (!s.running) break;
  }
}

inline void start_log_thread(const std::string& dir) {
  auto& s = Sink::get();
  std::lock_guard<std::mutex> lk(s.mu);
  if (s.running) return;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::fprintf(stderr, "[LOGGER] Directory create failed: %s\n", dir.c_str());
    return;
  }
  s.dir = dir;
  s.running = true;
  s.worker = std::thread(sink_loop);
}

inline void stop_log_thread() {
  auto& s = Sink::get();
  {
    std::lock_guard<std::mutex> lk(s.mu);
    if (!s.running) return;
    s.running = false;
  }
  s.cv.notify_all();
  if (s.worker.joinable()) s.worker.join();
}

inline void write(Level lv, const char* func, int line, const char* format, ...) {
  auto& s = Sink::get();
  bool to_file = false;
  {
    std::lock_guard<std::mutex> lk(s.mu);
    if (lv < s.threshold) return;
    to_file = s.running;
  }

  char buf[TSFLOG_MSG_BUF_SIZE];
  va_list args;
  va_start(args, format);
  std::vsnprintf(buf, sizeof(buf), format, args);
  va_end(args);

  char meta[TSFLOG_META_BUF_SIZE];
#ifdef _DEBUG
  std::snprintf(meta, sizeof(meta), "[%s] [%s] (%s:%d) - ", level_name(lv), time_string().c_str(), func, line);
#else
  (void)func; (void)line;
  std::snprintf(meta, sizeof(meta), "[%s] [%s] - ", level_name(lv), time_string().c_str());
#endif

  char log_line[TSFLOG_LINE_BUF_SIZE];
  std::snprintf(log_line, sizeof(log_line), "%.127s%.1022s\n", meta, buf);

  if (to_file) {
    std::lock_guard<std::mutex> lk(s.mu);
    s.queue.emplace_back(lv, log_line);
    s.cv.notify_one();
  }

  std::FILE* out = (lv >= Level::Warn) ? stderr : stdout;
  std::fputs(log_line, out);
}

} // namespace log
} // namespace tsforecast

#define TSFLOG_D(format, ...) ::tsforecast::log::write(::tsforecast::log::Level::Debug, __func__, __LINE__, format, ##__VA_ARGS__)
#define TSFLOG_I(format, ...) ::tsforecast::log::write(::tsforecast::log::Level::Info,  __func__, __LINE__, format, ##__VA_ARGS__)
#define TSFLOG_W(format, ...) ::tsforecast::log::write(::tsforecast::log::Level::Warn,  __func__, __LINE__, format, ##__VA_ARGS__)
#define TSFLOG_E(format, ...) ::tsforecast::log::write(::tsforecast::log::Level::Error, __func__, __LINE__, format, ##__VA_ARGS__)

#endif // TSFLOG_H
