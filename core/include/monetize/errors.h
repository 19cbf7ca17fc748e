#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace monetize {

struct MonetizeError : public std::runtime_error {
  explicit MonetizeError(const std::string& msg) : std::runtime_error(msg) {}
};

struct InvalidAmount : public MonetizeError {
  explicit InvalidAmount(const std::string& msg) : MonetizeError(msg) {}
};

struct UnsupportedValueType : public MonetizeError {
  explicit UnsupportedValueType(const std::string& msg) : MonetizeError(msg) {}
};

struct UnknownCurrency : public MonetizeError {
  explicit UnknownCurrency(std::string id)
      : MonetizeError("unknown currency: " + id), identifier(std::move(id)) {}

  std::string identifier;
};

struct ConfigError : public MonetizeError {
  explicit ConfigError(const std::string& msg) : MonetizeError(msg) {}
};

}  // namespace monetize
