#pragma once

#include <stdexcept>
#include <string>

// Raised when game parameters cannot describe a valid puzzle.
class InvalidConfiguration : public std::invalid_argument {
public:
  explicit InvalidConfiguration(const std::string &what)
      : std::invalid_argument(what) {}
};

// Raised when the strategy search hits its depth guard or node limit.
class SearchExhausted : public std::runtime_error {
public:
  explicit SearchExhausted(const std::string &what)
      : std::runtime_error(what) {}
};
