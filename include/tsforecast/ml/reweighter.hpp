#pragma once
#include "tsforecast/ml/dataset.hpp"
#include <nlohmann/json.hpp>
#include <torch/torch.h>
#include <memory>

namespace tsforecast {
namespace ml {

// Supplies one training weight per sample of a prepared split.
class Reweighter {
public:
  using Ptr = std::shared_ptr<Reweighter>;
  virtual ~Reweighter() = default;
  virtual torch::Tensor reweight(const TSDataSampler& data) const = 0;   // [N] float32
};

class UniformReweighter : public Reweighter {
public:
  torch::Tensor reweight(const TSDataSampler& data) const override;
};

// Weights decay with age: the newest datetime in the split has weight 1,
// a row `half_life` distinct datetimes older has weight 0.5.
class TimeDecayReweighter : public Reweighter {
public:
  explicit TimeDecayReweighter(double half_life);
  torch::Tensor reweight(const TSDataSampler& data) const override;

private:
  double half_life_;
};

// {"class": "uniform"} | {"class": "time_decay", "half_life": 20}
Reweighter::Ptr make_reweighter(const nlohmann::json& j);

} // namespace ml
} // namespace tsforecast
