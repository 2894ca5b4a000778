#include "tsforecast/ml/model_base.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

using nlohmann::json;

namespace tsforecast {
namespace ml {

RnnType parse_rnn_type(const std::string& s) {
  std::string u = s;
  std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return std::toupper(c); });
  if (u == "GRU") return RnnType::GRU;
  if (u == "LSTM") return RnnType::LSTM;
  if (u == "RNN") return RnnType::RNN;
  throw std::invalid_argument("unknown rnn_type `" + s + "`");
}

const char* rnn_type_name(RnnType t) {
  switch (t) {
    case RnnType::GRU:  return "GRU";
    case RnnType::LSTM: return "LSTM";
    case RnnType::RNN:  return "RNN";
  }
  return "GRU";
}

const char* model_state_name(ModelState s) {
  switch (s) {
    case ModelState::Uninitialized: return "uninitialized";
    case ModelState::Loaded:        return "loaded";
    case ModelState::Fitting:       return "fitting";
    case ModelState::Fitted:        return "fitted";
    case ModelState::Failed:        return "failed";
  }
  return "uninitialized";
}

namespace {

template <typename T>
void read_opt(const json& j, const char* key, T& out) {
  if (!j.contains(key) || j[key].is_null()) return;
  try {
    out = j[key].get<T>();
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("bad value for '") + key + "': " + e.what());
  }
}

} // namespace

ModelConfig ModelConfig::from_json(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("model config must be a json object");
  static const std::set<std::string> known = {
      "d_feat", "hidden_size", "num_layers", "dropout", "n_epochs", "lr", "metric", "batch_size",
      "early_stop", "loss", "optimizer", "n_jobs", "GPU", "seed", "init_model_path", "rnn_type"};

  ModelConfig c;
  read_opt(j, "d_feat", c.d_feat);
  read_opt(j, "hidden_size", c.hidden_size);
  read_opt(j, "num_layers", c.num_layers);
  read_opt(j, "dropout", c.dropout);
  read_opt(j, "n_epochs", c.n_epochs);
  read_opt(j, "lr", c.lr);
  read_opt(j, "metric", c.metric);
  read_opt(j, "batch_size", c.batch_size);
  read_opt(j, "early_stop", c.early_stop);
  read_opt(j, "loss", c.loss);
  read_opt(j, "optimizer", c.optimizer);
  read_opt(j, "n_jobs", c.n_jobs);
  read_opt(j, "GPU", c.GPU);
  if (j.contains("seed") && !j["seed"].is_null()) {
    int64_t seed = 0;
    read_opt(j, "seed", seed);
    c.seed = seed;
  }
  if (j.contains("init_model_path") && !j["init_model_path"].is_null()) {
    std::string p;
    read_opt(j, "init_model_path", p);
    c.init_model_path = p;
  }
  if (j.contains("rnn_type")) {
    std::string t;
    read_opt(j, "rnn_type", t);
    c.rnn_type = parse_rnn_type(t);
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!known.count(it.key())) c.kwargs[it.key()] = it.value();
  }
  c.validate();
  return c;
}

void ModelConfig::validate() const {
  auto positive = [](int64_t v, const char* name) {
    if (v <= 0) throw std::invalid_argument(std::string(name) + " must be positive, got " + std::to_string(v));
  };
  positive(d_feat, "d_feat");
  positive(hidden_size, "hidden_size");
  positive(num_layers, "num_layers");
  positive(batch_size, "batch_size");
  if (n_epochs < 0) throw std::invalid_argument("n_epochs must be non-negative");
  if (early_stop < 0) throw std::invalid_argument("early_stop must be non-negative");
  if (n_jobs < 0) throw std::invalid_argument("n_jobs must be non-negative");
  if (dropout < 0.0 || dropout >= 1.0) throw std::invalid_argument("dropout must be in [0, 1)");
  if (lr < 0.0) throw std::invalid_argument("lr must be non-negative");
}

} // namespace ml
} // namespace tsforecast
