/***
 * Name: unihir::exceptions::UnihirException::UnihirException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 */
#include "unihir/exceptions/unihir_exception.h"

#include <utility>

namespace unihir {
namespace exceptions {

UnihirException::UnihirException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace unihir
