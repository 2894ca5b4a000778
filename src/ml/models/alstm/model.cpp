#include "model.hpp"
#include "tsforecast/ml/errors.hpp"
#include "tsforecast/ml/loss.hpp"
#include "tsforecast/ml/registry.hpp"
#include "tsforecast/ml/sampler.hpp"
#include "tsforecast/ml/trainer.hpp"
#include "tsforecast/log.h"
#include <filesystem>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace tsforecast {
namespace ml {

ALSTMNetImpl::ALSTMNetImpl(int64_t d_feat, int64_t hidden_size, int64_t num_layers, double dropout,
                           RnnType rnn_type_)
    : rnn_type(rnn_type_) {
  net = register_module("net", torch::nn::Sequential());
  net->push_back("fc_in", torch::nn::Linear(d_feat, hidden_size));
  net->push_back("act", torch::nn::Tanh());

  switch (rnn_type) {
    case RnnType::GRU:
      gru = register_module("rnn", torch::nn::GRU(torch::nn::GRUOptions(hidden_size, hidden_size)
                                                      .num_layers(num_layers)
                                                      .batch_first(true)
                                                      .dropout(dropout)));
      break;
    case RnnType::LSTM:
      lstm = register_module("rnn", torch::nn::LSTM(torch::nn::LSTMOptions(hidden_size, hidden_size)
                                                        .num_layers(num_layers)
                                                        .batch_first(true)
                                                        .dropout(dropout)));
      break;
    case RnnType::RNN:
      vanilla = register_module("rnn", torch::nn::RNN(torch::nn::RNNOptions(hidden_size, hidden_size)
                                                          .num_layers(num_layers)
                                                          .batch_first(true)
                                                          .dropout(dropout)));
      break;
  }

  fc_out = register_module("fc_out", torch::nn::Linear(hidden_size * 2, 1));

  att_net = register_module("att_net", torch::nn::Sequential());
  att_net->push_back("att_fc_in", torch::nn::Linear(hidden_size, hidden_size / 2));
  att_net->push_back("att_dropout", torch::nn::Dropout(dropout));
  att_net->push_back("att_act", torch::nn::Tanh());
  att_net->push_back("att_fc_out", torch::nn::Linear(torch::nn::LinearOptions(hidden_size / 2, 1).bias(false)));
  att_net->push_back("att_softmax", torch::nn::Softmax(torch::nn::SoftmaxOptions(1)));
}

torch::Tensor ALSTMNetImpl::encode(torch::Tensor x) {
  auto h = net->forward(x);
  switch (rnn_type) {
    case RnnType::LSTM: return std::get<0>(lstm->forward(h));
    case RnnType::RNN:  return std::get<0>(vanilla->forward(h));
    case RnnType::GRU:  break;
  }
  return std::get<0>(gru->forward(h));
}

torch::Tensor ALSTMNetImpl::forward(torch::Tensor x) {
  auto rnn_out = encode(x);                                    // [N, T, H]
  auto attention_score = att_net->forward(rnn_out);            // [N, T, 1]
  auto out_att = torch::mul(rnn_out, attention_score).sum(1);  // [N, H]
  auto out = fc_out->forward(torch::cat({rnn_out.select(1, -1), out_att}, 1));
  return out.select(-1, 0);
}

torch::Tensor ALSTMNetImpl::attention_weights(torch::Tensor x) {
  return att_net->forward(encode(x)).squeeze(-1);
}

WindowDataset::WindowDataset(TSDataSampler data, torch::Tensor weights)
    : data_(std::move(data)), weights_(std::move(weights)) {
  if (weights_.size(0) != data_.size()) {
    throw std::invalid_argument("window weights length " + std::to_string(weights_.size(0)) +
                                " does not match sample count " + std::to_string(data_.size()));
  }
}

torch::data::Example<> WindowDataset::get(size_t index) {
  const auto i = static_cast<int64_t>(index);
  return {data_.get(i), weights_[i]};
}

torch::optional<size_t> WindowDataset::size() const {
  return static_cast<size_t>(data_.size());
}

namespace {

torch::Tensor split_weights(const Reweighter& reweighter, const TSDataSampler& data) {
  auto w = reweighter.reweight(data);
  if (!w.defined() || w.dim() != 1 || w.size(0) != data.size()) {
    throw std::invalid_argument("Unsupported reweighter type: it must return one weight per sample.");
  }
  return w.to(torch::kFloat32).contiguous();
}

} // namespace

ALSTM::ALSTM(ModelConfig cfg, Collaborators deps)
    : cfg_(std::move(cfg)), deps_(deps.with_defaults()), device_(Trainer::select_device(cfg_.GPU)) {
  cfg_.validate();
  if (cfg_.hidden_size < 2) throw std::invalid_argument("ALSTM hidden_size must be at least 2");

  TSFLOG_I("ALSTM libtorch version...");
  TSFLOG_I("ALSTM parameters setting:\nd_feat : %lld\nhidden_size : %lld\nnum_layers : %lld\ndropout : %g"
           "\nn_epochs : %lld\nlr : %g\nmetric : %s\nbatch_size : %lld\nearly_stop : %lld"
           "\noptimizer : %s\nloss_type : %s\ndevice : %s\nn_jobs : %lld\nuse_GPU : %d\nseed : %s"
           "\nrnn_type : %s\ninit_model_path: %s\nkwargs: %s",
           (long long)cfg_.d_feat, (long long)cfg_.hidden_size, (long long)cfg_.num_layers, cfg_.dropout,
           (long long)cfg_.n_epochs, cfg_.lr, cfg_.metric.c_str(), (long long)cfg_.batch_size,
           (long long)cfg_.early_stop, cfg_.optimizer.c_str(), cfg_.loss.c_str(), device_.str().c_str(),
           (long long)cfg_.n_jobs, device_.is_cpu() ? 0 : 1,
           cfg_.seed ? std::to_string(*cfg_.seed).c_str() : "None", rnn_type_name(cfg_.rnn_type),
           cfg_.init_model_path ? cfg_.init_model_path->c_str() : "None", cfg_.kwargs.dump().c_str());

  if (cfg_.seed) {
    Trainer::seed_everything(static_cast<uint64_t>(*cfg_.seed));
    rng_.seed(static_cast<uint64_t>(*cfg_.seed));
  } else {
    rng_.seed(std::random_device{}());
  }

  net_ = ALSTMNet(cfg_.d_feat, cfg_.hidden_size, cfg_.num_layers, cfg_.dropout, cfg_.rnn_type);
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

torch::Tensor ALSTM::loss_fn(const torch::Tensor& pred, const torch::Tensor& label, torch::Tensor weight) const {
  auto mask = valid_label_mask(label);
  if (!weight.defined()) weight = torch::ones_like(label);
  if (cfg_.loss == "mse") {
    return mse(pred.masked_select(mask), label.masked_select(mask), weight.masked_select(mask));
  }
  throw std::invalid_argument("unknown loss `" + cfg_.loss + "`");
}

torch::Tensor ALSTM::metric_fn(const torch::Tensor& pred, const torch::Tensor& label) const {
  if (cfg_.metric.empty() || cfg_.metric == "loss") {
    auto mask = finite_label_mask(label);
    return -loss_fn(pred.masked_select(mask), label.masked_select(mask));
  }
  if (cfg_.metric == "mse") {
    auto mask = valid_label_mask(label);
    return -mse(pred.masked_select(mask), label.masked_select(mask));
  }
  throw std::invalid_argument("unknown metric `" + cfg_.metric + "`");
}

void ALSTM::train_epoch(const WindowDataset& data) {
  net_->train();
  const auto n = *data.size();
  auto loader = torch::data::make_data_loader(
      WindowDataset(data).map(torch::data::transforms::Stack<>()),
      ShuffleSampler(n, rng_()),
      torch::data::DataLoaderOptions()
          .batch_size(static_cast<size_t>(cfg_.batch_size))
          .workers(static_cast<size_t>(cfg_.n_jobs))
          .drop_last(true));

  for (auto& batch : *loader) {
    auto window = batch.data.to(device_, torch::kFloat32);       // [B, T, F+1]
    auto feature = window.slice(2, 0, window.size(2) - 1);
    auto label = window.select(1, -1).select(-1, -1);
    auto weight = batch.target.to(device_, torch::kFloat32);

    auto pred = net_->forward(feature);
    auto loss = loss_fn(pred, label, weight);

    optimizer_->zero_grad();
    loss.backward();
    torch::nn::utils::clip_grad_value_(net_->parameters(), 3.0);
    optimizer_->step();
  }
}

std::pair<double, double> ALSTM::test_epoch(const WindowDataset& data) {
  net_->eval();
  torch::NoGradGuard ng;
  auto loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
      WindowDataset(data).map(torch::data::transforms::Stack<>()),
      torch::data::DataLoaderOptions()
          .batch_size(static_cast<size_t>(cfg_.batch_size))
          .workers(static_cast<size_t>(cfg_.n_jobs))
          .drop_last(true));

  double loss_sum = 0.0, score_sum = 0.0;
  size_t steps = 0;
  for (auto& batch : *loader) {
    auto window = batch.data.to(device_, torch::kFloat32);
    auto feature = window.slice(2, 0, window.size(2) - 1);
    auto label = window.select(1, -1).select(-1, -1);
    auto weight = batch.target.to(device_, torch::kFloat32);

    auto pred = net_->forward(feature);
    loss_sum += loss_fn(pred, label, weight).item<double>();
    score_sum += metric_fn(pred, label).item<double>();
    ++steps;
  }
  if (steps == 0) {
    TSFLOG_W("no full batch of %lld in %zu samples, score is NaN", (long long)cfg_.batch_size, *data.size());
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return {nan, nan};
  }
  return {loss_sum / steps, score_sum / steps};
}

void ALSTM::fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path) {
  fit(dataset, evals_result, save_path, *deps_.reweighter);
}

void ALSTM::fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path,
                const Reweighter& reweighter) {
  state_ = ModelState::Fitting;
  try {
    fit_impl(dataset, evals_result, save_path, reweighter);
    state_ = ModelState::Fitted;
  } catch (const std::exception& e) {
    state_ = ModelState::Failed;
    TSFLOG_E("ALSTM fit failed: %s", e.what());
    Trainer::release_device_memory(device_);
    throw;
  }
}

void ALSTM::fit_impl(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path_arg,
                     const Reweighter& reweighter) {
  std::string save_path = save_path_arg;
  if (save_path.empty() && cfg_.kwargs.contains("save_path")) save_path = cfg_.kwargs["save_path"].get<std::string>();
  TSFLOG_I("fit params save_path:%s:", save_path.c_str());

  auto* ts = dynamic_cast<TSDatasetH*>(&dataset);
  if (!ts) throw std::invalid_argument("ALSTM requires a time-series dataset (TSDatasetH).");
  if (!ts->has_segment("train") || !ts->has_segment("valid")) {
    throw std::invalid_argument("Empty data from dataset, please check your dataset config.");
  }
  auto dl_train = ts->prepare_ts("train", DataKey::Learn);
  auto dl_valid = ts->prepare_ts("valid", DataKey::Learn);
  if (dl_train.empty() || dl_valid.empty()) {
    throw std::invalid_argument("Empty data from dataset, please check your dataset config.");
  }

  dl_train.config(FillnaType::FFillBFill);   // nan brought by windowing
  dl_valid.config(FillnaType::FFillBFill);

  auto wl_train = split_weights(reweighter, dl_train);
  auto wl_valid = split_weights(reweighter, dl_valid);
  WindowDataset train_data(std::move(dl_train), std::move(wl_train));
  WindowDataset valid_data(std::move(dl_valid), std::move(wl_valid));

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
    train_epoch(train_data);
    TSFLOG_I("evaluating...");
    const auto train_res = test_epoch(train_data);
    const auto valid_res = test_epoch(valid_data);
    TSFLOG_I("train %.6f, valid %.6f", train_res.second, valid_res.second);
    evals_result.train.push_back(train_res.second);
    evals_result.valid.push_back(valid_res.second);
    deps_.recorder->log_metrics(step, {{"train_loss", train_res.first},
                                       {"val_loss", valid_res.first},
                                       {"train_score", train_res.second},
                                       {"val_score", valid_res.second}});

    const auto step_model_path = Trainer::step_checkpoint(model_save_dir, step).string();
    Trainer::save_state(Trainer::state_dict(*net_), step_model_path);
    deps_.recorder->log_artifact(step_model_path, "models");

    if (stopper.update(step, valid_res.second)) {
      best_param = Trainer::state_dict(*net_);
    } else if (stopper.should_stop()) {
      TSFLOG_I("early stop");
      break;
    }
  }

  TSFLOG_I("best score: %.6lf @ %lld", stopper.best_score(), (long long)stopper.best_epoch());
  Trainer::load_state_dict(*net_, best_param);
  const auto best_model_path = Trainer::best_checkpoint(model_save_dir).string();
  Trainer::save_state(best_param, best_model_path);
  deps_.recorder->log_artifact(best_model_path, "models");

  best_param.clear();
  Trainer::release_device_memory(device_);
}

Series ALSTM::predict(DatasetH& dataset, const Segment& segment) {
  if (state_ != ModelState::Loaded && state_ != ModelState::Fitted) {
    throw NotFittedError(std::string("model is not fitted yet! (state: ") + model_state_name(state_) + ")");
  }
  auto* ts = dynamic_cast<TSDatasetH*>(&dataset);
  if (!ts) throw std::invalid_argument("ALSTM requires a time-series dataset (TSDatasetH).");

  auto dl_test = ts->prepare_ts(segment, DataKey::Infer);
  dl_test.config(FillnaType::FFillBFill);
  Index index = dl_test.get_index();
  const auto n = dl_test.size();

  auto loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
      WindowDataset(std::move(dl_test), torch::ones({n}, torch::kFloat32)).map(torch::data::transforms::Stack<>()),
      torch::data::DataLoaderOptions()
          .batch_size(static_cast<size_t>(cfg_.batch_size))
          .workers(static_cast<size_t>(cfg_.n_jobs)));

  net_->eval();
  torch::NoGradGuard ng;
  std::vector<torch::Tensor> preds;
  for (auto& batch : *loader) {
    auto window = batch.data.to(device_, torch::kFloat32);
    auto feature = window.slice(2, 0, window.size(2) - 1);
    preds.push_back(net_->forward(feature).detach().cpu());
  }

  Series out;
  out.index = std::move(index);
  out.values = preds.empty() ? torch::empty({0}, torch::kFloat32) : torch::cat(preds, 0);
  return out;
}

static IModel::Ptr make_alstm(const ModelConfig& cfg, const Collaborators& deps) {
  return std::make_shared<ALSTM>(cfg, deps);
}
REGISTER_MODEL(alstm, make_alstm);

} // namespace ml
} // namespace tsforecast
