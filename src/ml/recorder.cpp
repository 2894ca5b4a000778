#include "tsforecast/ml/recorder.hpp"
#include "tsforecast/log.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tsforecast {
namespace ml {

FileRecorder::FileRecorder(fs::path root) : root_(std::move(root)) {
  fs::create_directories(root_);
}

void FileRecorder::log_metrics(int64_t step, const std::map<std::string, double>& metrics) {
  nlohmann::json j;
  j["step"] = step;
  for (const auto& kv : metrics) {
    // json has no NaN
    if (std::isfinite(kv.second)) j[kv.first] = kv.second;
    else j[kv.first] = nullptr;
  }
  std::lock_guard<std::mutex> lk(mu_);
  std::ofstream ofs(root_ / "metrics.jsonl", std::ios::app);
  if (!ofs) throw std::runtime_error("cannot write " + (root_ / "metrics.jsonl").string());
  ofs << j.dump() << "\n";
}

void FileRecorder::log_artifact(const std::string& local_path, const std::string& artifact_path) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto dir = root_ / "artifacts" / artifact_path;
  fs::create_directories(dir);
  const auto dst = dir / fs::path(local_path).filename();
  fs::copy_file(local_path, dst, fs::copy_options::overwrite_existing);
  TSFLOG_D("artifact %s -> %s", local_path.c_str(), dst.string().c_str());
}

} // namespace ml
} // namespace tsforecast
