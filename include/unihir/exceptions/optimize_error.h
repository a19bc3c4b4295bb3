/***
 * Name: unihir::exceptions::OptimizeError
 * Purpose: Exception for a failing optimizer pass.
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

class OptimizeError : public UnihirException {
 public:
  explicit OptimizeError(std::string msg) noexcept : UnihirException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace unihir
