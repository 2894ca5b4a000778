#pragma once
#include "tsforecast/ml/model_base.hpp"
#include <functional>
#include <unordered_map>
#include <vector>

namespace tsforecast {
namespace ml {

class Registry {
public:
  using Factory = std::function<IModel::Ptr(const ModelConfig&, const Collaborators&)>;
  static Registry& get() { static Registry r; return r; }
  void add(const std::string& name, Factory f) { map_[name]=std::move(f); }
  bool contains(const std::string& name) const { return map_.count(name) > 0; }
  IModel::Ptr create(const std::string& name, const ModelConfig& cfg, const Collaborators& deps = {}) const;
  std::vector<std::string> names() const;
private:
  std::unordered_map<std::string, Factory> map_;
};

#define REGISTER_MODEL(NAME, FACTORY) \
  static bool _reg_##NAME = [](){ \
    ::tsforecast::ml::Registry::get().add(#NAME, FACTORY); \
    return true; \
  }()

} // namespace ml
} // namespace tsforecast
