#include "model.hpp"
#include "tsforecast/ml/errors.hpp"
#include "tsforecast/ml/loss.hpp"
#include "tsforecast/ml/registry.hpp"
#include "tsforecast/ml/trainer.hpp"
#include "tsforecast/log.h"
#include <algorithm>
#include <filesystem>
#include <limits>
#include <numeric>
#include <sstream>

namespace fs = std::filesystem;

namespace tsforecast {
namespace ml {

GRUNetImpl::GRUNetImpl(int64_t d_feat_, int64_t hidden_size, int64_t num_layers, double dropout)
    : d_feat(d_feat_) {
  rnn = register_module("rnn", torch::nn::GRU(torch::nn::GRUOptions(d_feat, hidden_size)
                                                  .num_layers(num_layers)
                                                  .batch_first(true)
                                                  .dropout(dropout)));
  fc_out = register_module("fc_out", torch::nn::Linear(hidden_size, 1));
}

torch::Tensor GRUNetImpl::forward(torch::Tensor x) {
  x = x.reshape({x.size(0), d_feat, -1});   // [N, F, T]
  x = x.permute({0, 2, 1});                 // [N, T, F]
  auto out = std::get<0>(rnn->forward(x));
  return fc_out->forward(out.select(1, -1)).squeeze(-1);
}

GRU::GRU(ModelConfig cfg, Collaborators deps)
    : cfg_(std::move(cfg)), deps_(deps.with_defaults()), device_(Trainer::select_device(cfg_.GPU)) {
  cfg_.validate();
  TSFLOG_I("GRU libtorch version...");
  TSFLOG_I("GRU parameters setting:\nd_feat : %lld\nhidden_size : %lld\nnum_layers : %lld\ndropout : %g"
           "\nn_epochs : %lld\nlr : %g\nmetric : %s\nbatch_size : %lld\nearly_stop : %lld"
           "\noptimizer : %s\nloss_type : %s\ndevice : %s\nuse_GPU : %d\nseed : %s",
           (long long)cfg_.d_feat, (long long)cfg_.hidden_size, (long long)cfg_.num_layers, cfg_.dropout,
           (long long)cfg_.n_epochs, cfg_.lr, cfg_.metric.c_str(), (long long)cfg_.batch_size,
           (long long)cfg_.early_stop, cfg_.optimizer.c_str(), cfg_.loss.c_str(), device_.str().c_str(),
           device_.is_cpu() ? 0 : 1, cfg_.seed ? std::to_string(*cfg_.seed).c_str() : "None");

  if (cfg_.seed) {
    Trainer::seed_everything(static_cast<uint64_t>(*cfg_.seed));
    rng_.seed(static_cast<uint64_t>(*cfg_.seed));
  } else {
    rng_.seed(std::random_device{}());
  }

  net_ = GRUNet(cfg_.d_feat, cfg_.hidden_size, cfg_.num_layers, cfg_.dropout);
  std::ostringstream oss;
  oss << *net_;
  TSFLOG_I("model:\n%s", oss.str().c_str());
  TSFLOG_I("model size: %.4f MB", Trainer::count_parameters(*net_));

  optimizer_ = Trainer::make_optimizer(net_->parameters(), cfg_.optimizer, cfg_.lr);

  if (cfg_.init_model_path && fs::exists(*cfg_.init_model_path)) {
    TSFLOG_I("Loading model weights from %s", cfg_.init_model_path->c_str());
    Trainer::load_state_dict(*net_, Trainer::load_state(*cfg_.init_model_path, torch::kCPU));
    state_ = ModelState::Loaded;
  }
  net_->to(device_);
}

torch::Tensor GRU::loss_fn(const torch::Tensor& pred, const torch::Tensor& label) const {
  auto mask = valid_label_mask(label);
  if (cfg_.loss == "mse") return mse(pred.masked_select(mask), label.masked_select(mask));
  throw std::invalid_argument("unknown loss `" + cfg_.loss + "`");
}

torch::Tensor GRU::metric_fn(const torch::Tensor& pred, const torch::Tensor& label) const {
  auto mask = finite_label_mask(label);
  if (cfg_.metric.empty() || cfg_.metric == "loss") {
    return -loss_fn(pred.masked_select(mask), label.masked_select(mask));
  }
  throw std::invalid_argument("unknown metric `" + cfg_.metric + "`");
}

void GRU::train_epoch(const Frame& train) {
  net_->train();
  const int64_t n = train.size();
  std::vector<int64_t> indices(n);
  std::iota(indices.begin(), indices.end(), 0);
  std::shuffle(indices.begin(), indices.end(), rng_);

  for (int64_t i = 0; i + cfg_.batch_size <= n; i += cfg_.batch_size) {
    auto idx = torch::tensor(std::vector<int64_t>(indices.begin() + i, indices.begin() + i + cfg_.batch_size),
                             torch::kInt64);
    auto feature = train.feature.index_select(0, idx).to(device_, torch::kFloat32);
    auto label = train.label.index_select(0, idx).to(device_, torch::kFloat32);

    auto pred = net_->forward(feature);
    auto loss = loss_fn(pred, label);

    optimizer_->zero_grad();
    loss.backward();
    torch::nn::utils::clip_grad_value_(net_->parameters(), 3.0);
    optimizer_->step();
  }
}

std::pair<double, double> GRU::test_epoch(const Frame& data) {
  net_->eval();
  torch::NoGradGuard ng;
  double loss_sum = 0.0, score_sum = 0.0;
  size_t steps = 0;

  const int64_t n = data.size();
  for (int64_t i = 0; i + cfg_.batch_size <= n; i += cfg_.batch_size) {
    auto feature = data.feature.slice(0, i, i + cfg_.batch_size).to(device_, torch::kFloat32);
    auto label = data.label.slice(0, i, i + cfg_.batch_size).to(device_, torch::kFloat32);

    auto pred = net_->forward(feature);
    loss_sum += loss_fn(pred, label).item<double>();
    score_sum += metric_fn(pred, label).item<double>();
    ++steps;
  }
  if (steps == 0) {
    TSFLOG_W("no full batch of %lld in %lld samples, score is NaN", (long long)cfg_.batch_size, (long long)n);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return {nan, nan};
  }
  return {loss_sum / steps, score_sum / steps};
}

void GRU::fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path) {
  state_ = ModelState::Fitting;
  try {
    fit_impl(dataset, evals_result, save_path);
    state_ = ModelState::Fitted;
  } catch (const std::exception& e) {
    state_ = ModelState::Failed;
    TSFLOG_E("GRU fit failed: %s", e.what());
    Trainer::release_device_memory(device_);
    throw;
  }
}

void GRU::fit_impl(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path_arg) {
  std::string save_path = save_path_arg;
  if (save_path.empty() && cfg_.kwargs.contains("save_path")) save_path = cfg_.kwargs["save_path"].get<std::string>();
  TSFLOG_I("fit params save_path:%s:", save_path.c_str());

  Frame df_train, df_valid;
  if (dataset.has_segment("train")) df_train = dataset.prepare("train", ColSet::FeatureLabel, DataKey::Learn);
  if (dataset.has_segment("valid")) df_valid = dataset.prepare("valid", ColSet::FeatureLabel, DataKey::Learn);

  if (df_train.empty()) {
    throw std::invalid_argument("Empty training data from dataset, please check your dataset config.");
  }
  df_train = df_train.dropna();
  const bool has_valid = !df_valid.empty();
  if (has_valid) df_valid = df_valid.dropna();

  const auto model_save_dir = Trainer::resolve_save_dir(save_path) / "model_ckpt";
  fs::create_directories(model_save_dir);

  EarlyStopper stopper(cfg_.early_stop);
  evals_result.train.clear();
  evals_result.valid.clear();

  TSFLOG_I("training...");
  auto best_param = Trainer::state_dict(*net_);
  for (int64_t step = 0; step < cfg_.n_epochs; ++step) {
    TSFLOG_I("Epoch%lld:", (long long)step);
    TSFLOG_I("training...");
    train_epoch(df_train);
    TSFLOG_I("evaluating...");
    const auto train_res = test_epoch(df_train);
    evals_result.train.push_back(train_res.second);

    const auto step_model_path = Trainer::step_checkpoint(model_save_dir, step).string();
    Trainer::save_state(Trainer::state_dict(*net_), step_model_path);
    deps_.recorder->log_artifact(step_model_path, "models");

    std::map<std::string, double> metrics{{"train_loss", train_res.first}, {"train", train_res.second}};
    if (!has_valid) {
      deps_.recorder->log_metrics(step, metrics);
      continue;
    }

    const auto valid_res = test_epoch(df_valid);
    TSFLOG_I("train %.6f, valid %.6f", train_res.second, valid_res.second);
    evals_result.valid.push_back(valid_res.second);
    metrics["valid_loss"] = valid_res.first;
    metrics["valid"] = valid_res.second;
    deps_.recorder->log_metrics(step, metrics);

    if (stopper.update(step, valid_res.second)) {
      best_param = Trainer::state_dict(*net_);
    } else if (stopper.should_stop()) {
      TSFLOG_I("early stop");
      break;
    }
  }

  if (has_valid) {
    TSFLOG_I("best score: %.6lf @ %lld", stopper.best_score(), (long long)stopper.best_epoch());
    Trainer::load_state_dict(*net_, best_param);
  } else {
    best_param = Trainer::state_dict(*net_);   // no valid split: keep the last epoch
  }
  const auto best_model_path = Trainer::best_checkpoint(model_save_dir).string();
  Trainer::save_state(best_param, best_model_path);
  deps_.recorder->log_artifact(best_model_path, "models");

  best_param.clear();
  Trainer::release_device_memory(device_);
}

Series GRU::predict(DatasetH& dataset, const Segment& segment) {
  if (state_ != ModelState::Loaded && state_ != ModelState::Fitted) {
    throw NotFittedError(std::string("model is not fitted yet! (state: ") + model_state_name(state_) + ")");
  }

  auto x_test = dataset.prepare(segment, ColSet::Feature, DataKey::Infer);
  net_->eval();
  torch::NoGradGuard ng;

  const int64_t sample_num = x_test.size();
  std::vector<torch::Tensor> preds;
  for (int64_t begin = 0; begin < sample_num; begin += cfg_.batch_size) {
    const int64_t end = std::min(begin + cfg_.batch_size, sample_num);
    auto x_batch = x_test.feature.slice(0, begin, end).to(device_, torch::kFloat32);
    preds.push_back(net_->forward(x_batch).detach().cpu());
  }

  Series out;
  out.index = std::move(x_test.index);
  out.values = preds.empty() ? torch::empty({0}, torch::kFloat32) : torch::cat(preds, 0);
  return out;
}

static IModel::Ptr make_gru(const ModelConfig& cfg, const Collaborators& deps) {
  return std::make_shared<GRU>(cfg, deps);
}
REGISTER_MODEL(gru, make_gru);

} // namespace ml
} // namespace tsforecast
