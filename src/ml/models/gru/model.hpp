#pragma once
#include "tsforecast/ml/model_base.hpp"
#include <random>
#include <utility>

namespace tsforecast {
namespace ml {

// [N, d_feat * T] -> [N]
struct GRUNetImpl : public torch::nn::Module {
  GRUNetImpl(int64_t d_feat, int64_t hidden_size, int64_t num_layers, double dropout);
  torch::Tensor forward(torch::Tensor x);

  torch::nn::GRU rnn{nullptr};
  torch::nn::Linear fc_out{nullptr};
  int64_t d_feat;
};
TORCH_MODULE(GRUNet);

class GRU : public IModel {
public:
  explicit GRU(ModelConfig cfg, Collaborators deps = {});

  void fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path = "") override;
  Series predict(DatasetH& dataset, const Segment& segment = Segment("test")) override;

  void train_epoch(const Frame& train);
  // (mean loss, mean score) over full batches
  std::pair<double, double> test_epoch(const Frame& data);

  torch::Tensor loss_fn(const torch::Tensor& pred, const torch::Tensor& label) const;
  torch::Tensor metric_fn(const torch::Tensor& pred, const torch::Tensor& label) const;

  ModelState state() const override { return state_; }
  torch::Device device() const override { return device_; }
  torch::nn::Module& network() override { return *net_; }
  const ModelConfig& config() const { return cfg_; }
  torch::optim::Optimizer& optimizer() { return *optimizer_; }

private:
  void fit_impl(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path);

  ModelConfig cfg_;
  Collaborators deps_;
  torch::Device device_;
  std::mt19937_64 rng_;
  GRUNet net_{nullptr};
  std::unique_ptr<torch::optim::Optimizer> optimizer_;
  ModelState state_{ModelState::Uninitialized};
};

} // namespace ml
} // namespace tsforecast
