#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <random>
#include <vector>

namespace tsforecast {
namespace ml {

// Random permutation sampler driven by its own engine rather than the global torch generator.
class ShuffleSampler : public torch::data::samplers::Sampler<> {
public:
  ShuffleSampler(size_t size, uint64_t seed);

  // reshuffles; called by the data loader at the start of every pass
  void reset(torch::optional<size_t> new_size = torch::nullopt) override;
  torch::optional<std::vector<size_t>> next(size_t batch_size) override;

  void save(torch::serialize::OutputArchive& archive) const override;
  void load(torch::serialize::InputArchive& archive) override;

  size_t index() const noexcept { return next_; }

private:
  std::mt19937_64 engine_;
  std::vector<size_t> indices_;
  size_t next_{0};
};

} // namespace ml
} // namespace tsforecast
