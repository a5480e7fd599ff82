#pragma once
#ifndef TESIM_ERRORS_HPP
#define TESIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tesim {

// Action vector does not match the link list (wrong length or non-binary flag).
class InvalidActionError : public std::invalid_argument {
public:
  explicit InvalidActionError(const std::string& what) : std::invalid_argument(what) {}
};

// Out-of-range construction parameters or malformed config/topology input.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace tesim

#endif // TESIM_ERRORS_HPP
