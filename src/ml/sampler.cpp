#include "tsforecast/ml/sampler.hpp"
#include <algorithm>
#include <numeric>

namespace tsforecast {
namespace ml {

ShuffleSampler::ShuffleSampler(size_t size, uint64_t seed) : engine_(seed), indices_(size) {
  reset();
}

void ShuffleSampler::reset(torch::optional<size_t> new_size) {
  if (new_size.has_value()) indices_.resize(*new_size);
  std::iota(indices_.begin(), indices_.end(), size_t{0});
  std::shuffle(indices_.begin(), indices_.end(), engine_);
  next_ = 0;
}

torch::optional<std::vector<size_t>> ShuffleSampler::next(size_t batch_size) {
  if (next_ >= indices_.size()) return torch::nullopt;
  const size_t end = std::min(next_ + batch_size, indices_.size());
  std::vector<size_t> batch(indices_.begin() + next_, indices_.begin() + end);
  next_ = end;
  return batch;
}

void ShuffleSampler::save(torch::serialize::OutputArchive& archive) const {
  std::vector<int64_t> idx(indices_.begin(), indices_.end());
  archive.write("index", torch::tensor(static_cast<int64_t>(next_), torch::kInt64), /*is_buffer=*/true);
  archive.write("indices", torch::tensor(idx, torch::kInt64), /*is_buffer=*/true);
}

void ShuffleSampler::load(torch::serialize::InputArchive& archive) {
  auto index = torch::empty(1, torch::kInt64);
  archive.read("index", index, /*is_buffer=*/true);
  next_ = static_cast<size_t>(index.item<int64_t>());
  auto indices = torch::empty(0, torch::kInt64);
  archive.read("indices", indices, /*is_buffer=*/true);
  indices = indices.contiguous();
  const auto* p = indices.data_ptr<int64_t>();
  indices_.assign(p, p + indices.numel());
}

} // namespace ml
} // namespace tsforecast
