/***
 * Name: unihir::exceptions::UnihirException
 * Purpose: Base class for all unihir exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites.
 *   Recoverable, user-facing failures are returned as values; only environment
 *   failures (files, frontend input, configuration, optimizer passes) throw.
 */
#pragma once

#include <exception>
#include <string>

namespace unihir {
namespace exceptions {

class UnihirException : public std::exception {
 public:
  virtual ~UnihirException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit UnihirException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace unihir
