#include "tsforecast/ml/trainer.hpp"
#include "tsforecast/ml/errors.hpp"
#include "tsforecast/log.h"
#include <torch/mps.h>
#ifdef TSFORECAST_WITH_CUDA
#include <c10/cuda/CUDACachingAllocator.h>
#endif
#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tsforecast {
namespace ml {

torch::Device Trainer::select_device(int64_t gpu) {
  if (torch::cuda::is_available() && gpu >= 0) {
    return torch::Device(torch::kCUDA, static_cast<c10::DeviceIndex>(gpu));
  }
  if (torch::mps::is_available()) return torch::Device(torch::kMPS);
  return torch::Device(torch::kCPU);
}

void Trainer::seed_everything(uint64_t seed) {
  torch::manual_seed(seed);
  if (torch::mps::is_available()) torch::mps::manual_seed(seed);
  if (torch::cuda::is_available()) {
    torch::cuda::manual_seed_all(seed);
    at::globalContext().setDeterministicCuDNN(true);
    at::globalContext().setBenchmarkCuDNN(false);
  }
}

std::unique_ptr<torch::optim::Optimizer> Trainer::make_optimizer(std::vector<torch::Tensor> params,
                                                                 const std::string& name, double lr) {
  std::string n = name;
  std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
  if (n == "adam") return std::make_unique<torch::optim::Adam>(std::move(params), torch::optim::AdamOptions(lr));
  if (n == "gd") return std::make_unique<torch::optim::SGD>(std::move(params), torch::optim::SGDOptions(lr));
  throw NotImplementedError("optimizer " + name + " is not supported!");
}

StateDict Trainer::state_dict(const torch::nn::Module& module) {
  StateDict out;
  for (const auto& kv : module.named_parameters()) out.insert(kv.key(), kv.value().detach().clone());
  for (const auto& kv : module.named_buffers()) out.insert(kv.key(), kv.value().detach().clone());
  return out;
}

void Trainer::load_state_dict(torch::nn::Module& module, const StateDict& state) {
  torch::NoGradGuard ng;
  size_t matched = 0;
  auto assign = [&](const std::string& name, torch::Tensor& dst) {
    const torch::Tensor* src = state.find(name);
    if (!src) throw std::runtime_error("missing key in state dict: " + name);
    if (src->sizes() != dst.sizes()) {
      throw std::runtime_error("size mismatch for " + name + " in state dict");
    }
    dst.copy_(*src);
    ++matched;
  };
  for (auto& kv : module.named_parameters()) assign(kv.key(), kv.value());
  for (auto& kv : module.named_buffers()) assign(kv.key(), kv.value());
  if (matched != state.size()) {
    throw std::runtime_error("unexpected keys in state dict (" + std::to_string(state.size() - matched) + ")");
  }
}

void Trainer::save_state(const StateDict& state, const std::string& path) {
  torch::serialize::OutputArchive archive;
  for (const auto& kv : state) archive.write(kv.key(), kv.value().cpu());
  archive.save_to(path);
}

StateDict Trainer::load_state(const std::string& path, const torch::Device& device) {
  torch::serialize::InputArchive archive;
  archive.load_from(path, torch::Device(torch::kCPU));
  StateDict out;
  for (const auto& key : archive.keys()) {
    torch::Tensor t;
    archive.read(key, t);
    out.insert(key, t.to(device));
  }
  return out;
}

double Trainer::count_parameters(const torch::nn::Module& module) {
  int64_t n = 0;
  for (const auto& p : module.parameters()) n += p.numel();
  return static_cast<double>(n) / 1e6;
}

void Trainer::release_device_memory(const torch::Device& device) {
  if (device.is_cuda()) {
    torch::cuda::synchronize();
#ifdef TSFORECAST_WITH_CUDA
    c10::cuda::CUDACachingAllocator::emptyCache();
#endif
  } else if (device.is_mps()) {
    torch::mps::synchronize();
  }
}

fs::path Trainer::resolve_save_dir(const std::string& save_path) {
  fs::path dir;
  if (save_path.empty()) {
    std::random_device rd;
    const auto ts = std::chrono::system_clock::now().time_since_epoch().count();
    dir = fs::temp_directory_path() / ("tsforecast_" + std::to_string(ts) + "_" + std::to_string(rd()));
  } else {
    dir = save_path;
  }
  fs::create_directories(dir);
  return dir;
}

fs::path Trainer::step_checkpoint(const fs::path& ckpt_dir, int64_t step) {
  return ckpt_dir / ("model_" + std::to_string(step) + "_params.pt");
}

fs::path Trainer::best_checkpoint(const fs::path& ckpt_dir) {
  return ckpt_dir / "base_model_params.pt";
}

} // namespace ml
} // namespace tsforecast
