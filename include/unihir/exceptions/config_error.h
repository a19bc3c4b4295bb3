/***
 * Name: unihir::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from UnihirException.
 */
#pragma once

#include <string>
#include <utility>

#include "unihir/exceptions/unihir_exception.h"

namespace unihir {
namespace exceptions {

class ConfigError : public UnihirException {
 public:
  explicit ConfigError(std::string msg) noexcept : UnihirException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace unihir
