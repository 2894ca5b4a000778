#pragma once
#include <torch/torch.h>

namespace tsforecast {
namespace ml {

inline torch::Tensor mse(const torch::Tensor& pred, const torch::Tensor& label) {
  return torch::mean((pred - label).pow(2));
}

inline torch::Tensor mse(const torch::Tensor& pred, const torch::Tensor& label, const torch::Tensor& weight) {
  return torch::mean(weight * (pred - label).pow(2));
}

inline torch::Tensor valid_label_mask(const torch::Tensor& label) { return torch::isnan(label).logical_not(); }
inline torch::Tensor finite_label_mask(const torch::Tensor& label) { return torch::isfinite(label); }

} // namespace ml
} // namespace tsforecast
