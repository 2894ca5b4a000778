#pragma once
#include <stdexcept>
#include <string>

namespace tsforecast {
namespace ml {

// configuration names a feature that is not implemented (e.g. optimizer "rmsprop")
struct NotImplementedError : public std::logic_error {
  explicit NotImplementedError(const std::string& what) : std::logic_error(what) {}
};

// predict requested before the model was fitted or loaded
struct NotFittedError : public std::logic_error {
  explicit NotFittedError(const std::string& what) : std::logic_error(what) {}
};

} // namespace ml
} // namespace tsforecast
