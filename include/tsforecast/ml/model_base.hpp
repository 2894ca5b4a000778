#pragma once
#include "tsforecast/ml/dataset.hpp"
#include "tsforecast/ml/recorder.hpp"
#include "tsforecast/ml/reweighter.hpp"
#include <nlohmann/json.hpp>
#include <torch/torch.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast {
namespace ml {

enum class RnnType { GRU, LSTM, RNN };

RnnType parse_rnn_type(const std::string& s);
const char* rnn_type_name(RnnType t);

struct ModelConfig {
  int64_t d_feat{6};
  int64_t hidden_size{64};
  int64_t num_layers{2};
  double  dropout{0.0};
  int64_t n_epochs{200};
  double  lr{1e-3};
  std::string metric{""};
  int64_t batch_size{2000};
  int64_t early_stop{20};
  std::string loss{"mse"};
  std::string optimizer{"adam"};   // "adam"|"gd"
  int64_t n_jobs{10};              // data loader workers (alstm)
  int64_t GPU{0};                  // <0 forces cpu
  std::optional<int64_t> seed;
  std::optional<std::string> init_model_path;
  RnnType rnn_type{RnnType::GRU};
  nlohmann::json kwargs = nlohmann::json::object();  // pass-through, e.g. save_path

  // unknown keys land in kwargs; bad values throw std::invalid_argument
  static ModelConfig from_json(const nlohmann::json& j);
  void validate() const;
};

enum class ModelState { Uninitialized, Loaded, Fitting, Fitted, Failed };

const char* model_state_name(ModelState s);

struct EvalsResult {
  std::vector<double> train;
  std::vector<double> valid;
};

// optional capabilities, null objects when not supplied
struct Collaborators {
  Recorder::Ptr recorder;
  Reweighter::Ptr reweighter;

  Collaborators with_defaults() const {
    Collaborators c = *this;
    if (!c.recorder) c.recorder = std::make_shared<NullRecorder>();
    if (!c.reweighter) c.reweighter = std::make_shared<UniformReweighter>();
    return c;
  }
};

class IModel {
public:
  using Ptr = std::shared_ptr<IModel>;
  virtual ~IModel() = default;

  virtual void fit(DatasetH& dataset, EvalsResult& evals_result, const std::string& save_path = "") = 0;
  virtual Series predict(DatasetH& dataset, const Segment& segment = Segment("test")) = 0;

  virtual ModelState state() const = 0;
  virtual torch::Device device() const = 0;
  virtual torch::nn::Module& network() = 0;
};

} // namespace ml
} // namespace tsforecast
