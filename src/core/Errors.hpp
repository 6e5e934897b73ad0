#pragma once

#include <stdexcept>
#include <string>

// Raised when a profile cannot be analysed: too few points, negative or
// decreasing distances, non-finite values, or a malformed JSON shape.
class InvalidInputError : public std::runtime_error {
public:
  explicit InvalidInputError(const std::string &what)
      : std::runtime_error(what) {}
};

// Raised before any computation when detection parameters are unusable.
class InvalidConfigError : public std::runtime_error {
public:
  explicit InvalidConfigError(const std::string &what)
      : std::runtime_error(what) {}
};
