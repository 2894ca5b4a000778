#include "tsforecast/ml/reweighter.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <vector>

namespace tsforecast {
namespace ml {

torch::Tensor UniformReweighter::reweight(const TSDataSampler& data) const {
  return torch::ones({data.size()}, torch::kFloat32);
}

TimeDecayReweighter::TimeDecayReweighter(double half_life) : half_life_(half_life) {
  if (!(half_life_ > 0.0)) throw std::invalid_argument("time_decay half_life must be positive");
}

torch::Tensor TimeDecayReweighter::reweight(const TSDataSampler& data) const {
  const auto& index = data.get_index();
  std::set<std::string> dates;
  for (const auto& k : index) dates.insert(k.datetime);
  std::vector<std::string> ordered(dates.begin(), dates.end());

  std::vector<float> w;
  w.reserve(index.size());
  for (const auto& k : index) {
    auto it = std::lower_bound(ordered.begin(), ordered.end(), k.datetime);
    const double age = static_cast<double>(ordered.end() - it - 1);
    w.push_back(static_cast<float>(std::pow(0.5, age / half_life_)));
  }
  return torch::tensor(w, torch::kFloat32);
}

Reweighter::Ptr make_reweighter(const nlohmann::json& j) {
  const std::string cls = j.value("class", "uniform");
  if (cls == "uniform") return std::make_shared<UniformReweighter>();
  if (cls == "time_decay") return std::make_shared<TimeDecayReweighter>(j.value("half_life", 20.0));
  throw std::invalid_argument("Unsupported reweighter type `" + cls + "`.");
}

} // namespace ml
} // namespace tsforecast
