/***
 * Name: unihir::exceptions::UnihirException::what
 * Purpose: Return the stored error message.
 * Outputs: C-string pointer valid for the lifetime of the exception
 */
#include "unihir/exceptions/unihir_exception.h"

namespace unihir::exceptions {

const char* UnihirException::what() const noexcept { return message_.c_str(); }

}  // namespace unihir::exceptions
