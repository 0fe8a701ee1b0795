#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace reactblessed {

class UnknownWidgetTypeError : public std::invalid_argument {
public:
  explicit UnknownWidgetTypeError(const std::string& type)
    : std::invalid_argument("Invalid blessed element \"" + type + "\"."),
      type_(type) {}

  const std::string& type() const {
    return type_;
  }

private:
  std::string type_;
};

class UnknownNodeError : public std::out_of_range {
public:
  explicit UnknownNodeError(const std::string& what)
    : std::out_of_range(what) {}
};

// A deferred post-mount callback threw while its pass committed.
struct CallbackFailure {
  std::size_t index{0};
  std::string message;
};

} // namespace reactblessed
