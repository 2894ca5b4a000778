#pragma once
#include <torch/torch.h>
#include <stdexcept>
#include <string>

namespace tsforecast {
namespace ml {

enum class FillnaType { None, FFill, FFillBFill };

inline FillnaType parse_fillna_type(const std::string& s) {
  if (s == "none" || s.empty()) return FillnaType::None;
  if (s == "ffill") return FillnaType::FFill;
  if (s == "ffill+bfill") return FillnaType::FFillBFill;
  throw std::invalid_argument("unknown fillna_type `" + s + "`");
}

namespace transforms {

// Fills NaN along dim 0 (time) of a [T, C] window, column by column.
inline torch::Tensor fill_along_time(torch::Tensor x, FillnaType type) {
  if (type == FillnaType::None || x.size(0) < 2) return x;
  x = x.clone();
  const int64_t T = x.size(0);
  for (int64_t t = 1; t < T; ++t) {
    auto cur = x[t];
    cur.copy_(torch::where(torch::isnan(cur), x[t - 1], cur));
  }
  if (type == FillnaType::FFillBFill) {
    for (int64_t t = T - 2; t >= 0; --t) {
      auto cur = x[t];
      cur.copy_(torch::where(torch::isnan(cur), x[t + 1], cur));
    }
  }
  return x;
}

} // namespace transforms
} // namespace ml
} // namespace tsforecast
