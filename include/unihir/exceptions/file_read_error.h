/***
 * Name: unihir::exceptions::FileReadError
 * Purpose: Exception for source files that cannot be opened or read.
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

class FileReadError : public UnihirException {
 public:
  explicit FileReadError(std::string msg) noexcept : UnihirException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace unihir
