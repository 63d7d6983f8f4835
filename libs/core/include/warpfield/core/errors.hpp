/**
 * @file errors.hpp
 * @brief Construction-time error type.
 * @author Watosn
 */
#pragma once

#include <stdexcept>
#include <string>

namespace warpfield::core {

/**
 * @brief Raised by factories when model parameters are malformed.
 *
 * Per-element numerical failures never throw; they are reported via `Status`.
 */
class ModelConfigurationError final : public std::invalid_argument {
 public:
  explicit ModelConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace warpfield::core
