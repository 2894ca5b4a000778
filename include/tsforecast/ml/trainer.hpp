#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace tsforecast {
namespace ml {

// parameter and buffer name -> tensor
using StateDict = torch::OrderedDict<std::string, torch::Tensor>;

// Training plumbing shared by the sequence models.
class Trainer {
public:
  // cuda:<gpu> when available and gpu >= 0, else mps, else cpu
  static torch::Device select_device(int64_t gpu);
  static void seed_everything(uint64_t seed);
  static std::unique_ptr<torch::optim::Optimizer> make_optimizer(std::vector<torch::Tensor> params,
                                                                 const std::string& name, double lr);

  static StateDict state_dict(const torch::nn::Module& module);   // deep copy
  static void load_state_dict(torch::nn::Module& module, const StateDict& state);
  static void save_state(const StateDict& state, const std::string& path);
  static StateDict load_state(const std::string& path, const torch::Device& device);

  // parameter count in millions
  static double count_parameters(const torch::nn::Module& module);
  static void release_device_memory(const torch::Device& device);

  // empty -> fresh directory under the system temp dir
  static std::filesystem::path resolve_save_dir(const std::string& save_path);
  static std::filesystem::path step_checkpoint(const std::filesystem::path& ckpt_dir, int64_t step);
  static std::filesystem::path best_checkpoint(const std::filesystem::path& ckpt_dir);
};

// Tracks the best validation score and the number of epochs since it improved.
class EarlyStopper {
public:
  explicit EarlyStopper(int64_t patience) : patience_(patience) {}

  // true when score beats the best so far
  bool update(int64_t epoch, double score) {
    if (score > best_score_) {
      best_score_ = score;
      best_epoch_ = epoch;
      stall_ = 0;
      return true;
    }
    ++stall_;
    return false;
  }

  bool should_stop() const { return stall_ >= patience_; }
  double best_score() const { return best_score_; }
  int64_t best_epoch() const { return best_epoch_; }
  int64_t stall() const { return stall_; }

private:
  int64_t patience_;
  double best_score_{-std::numeric_limits<double>::infinity()};
  int64_t best_epoch_{0};
  int64_t stall_{0};
};

} // namespace ml
} // namespace tsforecast
