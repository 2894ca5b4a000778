#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tsforecast {
namespace ml {

// Experiment tracking sink for per-epoch metrics and checkpoint artifacts.
class Recorder {
public:
  using Ptr = std::shared_ptr<Recorder>;
  virtual ~Recorder() = default;

  virtual void log_metrics(int64_t step, const std::map<std::string, double>& metrics) = 0;
  virtual void log_artifact(const std::string& local_path, const std::string& artifact_path) = 0;
};

class NullRecorder : public Recorder {
public:
  void log_metrics(int64_t, const std::map<std::string, double>&) override {}
  void log_artifact(const std::string&, const std::string&) override {}
};

// <root>/metrics.jsonl, one json object per call; artifacts copied to <root>/artifacts/<artifact_path>/
class FileRecorder : public Recorder {
public:
  explicit FileRecorder(std::filesystem::path root);

  void log_metrics(int64_t step, const std::map<std::string, double>& metrics) override;
  void log_artifact(const std::string& local_path, const std::string& artifact_path) override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
  std::mutex mu_;
};

} // namespace ml
} // namespace tsforecast
