/***
 * Name: unihir::exceptions::FrontendError
 * Purpose: Exception for malformed frontend input (message carries file:line:col).
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

class FrontendError : public UnihirException {
 public:
  explicit FrontendError(std::string msg) noexcept : UnihirException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace unihir
