#include "tsforecast/ml/registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace tsforecast {
namespace ml {
IModel::Ptr Registry::create(const std::string& name, const ModelConfig& cfg, const Collaborators& deps) const {
  auto it = map_.find(name);
  if (it==map_.end()) throw std::invalid_argument("Model not found: " + name);
  return (it->second)(cfg, deps);
}
std::vector<std::string> Registry::names() const {
  std::vector<std::string> v; v.reserve(map_.size());
  for (auto& kv: map_) v.push_back(kv.first);
  std::sort(v.begin(), v.end());
  return v;
}
} // namespace ml
} // namespace tsforecast
