#pragma once
#include "tsforecast/ml/model_base.hpp"
#include <random>
#include <utility>

namespace tsforecast {
namespace ml {

// [N, T, d_feat] -> [N]
struct ALSTMNetImpl : public torch::nn::Module {
  ALSTMNetImpl(int64_t d_feat, int64_t hidden_size, int64_t num_layers, double dropout, RnnType rnn_type);
  torch::Tensor forward(torch::Tensor x);
  // softmax over time, [N, T]
  torch::Tensor attention_weights(torch::Tensor x);

  torch::nn::Sequential net{nullptr};       // fc_in, act
  torch::nn::GRU gru{nullptr};              // exactly one of gru/lstm/vanilla is built, as "rnn"
  torch::nn::LSTM lstm{nullptr};
  torch::nn::RNN vanilla{nullptr};
  torch::nn::Sequential att_net{nullptr};
  torch::nn::Linear fc_out{nullptr};
  RnnType rnn_type;

private:
  torch::Tensor encode(torch::Tensor x);    // [N, T, hidden]
};
TORCH_MODULE(ALSTMNet);

// Window samples paired with their training weight: data [T, C], target [].
class WindowDataset : public torch::data::datasets::Dataset<WindowDataset> {
public:
  WindowDataset(TSDataSampler data, torch::Tensor weights);
  torch::data::Example<> get(size_t index) override;
  torch::optional<size_t> size() const override;

private:
  TSDataSampler data_;
  torch::Tensor weights_;
};

class ALSTM : public IModel {
public:
  explicit ALSTM(ModelConfig cfg, Collaborators deps = {});

  void fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path = "") override;
  void fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path,
           const Reweighter& reweighter);
  Series predict(DatasetH& dataset, const Segment& segment = Segment("test")) override;

  void train_epoch(const WindowDataset& data);
  std::pair<double, double> test_epoch(const WindowDataset& data);

  torch::Tensor loss_fn(const torch::Tensor& pred, const torch::Tensor& label,
                        torch::Tensor weight = torch::Tensor()) const;
  torch::Tensor metric_fn(const torch::Tensor& pred, const torch::Tensor& label) const;

  ModelState state() const override { return state_; }
  torch::Device device() const override { return device_; }
  torch::nn::Module& network() override { return *net_; }
  ALSTMNet& net() { return net_; }
  const ModelConfig& config() const { return cfg_; }
  torch::optim::Optimizer& optimizer() { return *optimizer_; }

private:
  void fit_impl(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path,
                const Reweighter& reweighter);

  ModelConfig cfg_;
  Collaborators deps_;
  torch::Device device_;
  std::mt19937_64 rng_;
  ALSTMNet net_{nullptr};
  std::unique_ptr<torch::optim::Optimizer> optimizer_;
  ModelState state_{ModelState::Uninitialized};
};

} // namespace ml
} // namespace tsforecast
