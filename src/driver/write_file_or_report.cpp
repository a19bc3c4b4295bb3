/***
 * Name: unihir::driver::Transpiler::write_file_or_report
 * Purpose: Write a file and standardize error reporting.
 * Theory of Operation: Wraps support::WriteFile and prints a 'unihir: ' prefixed message.
 */
#include "driver/Transpiler.h"
#include "unihir/support/fs.h"

#include <ostream>
#include <string>

namespace unihir::driver {

bool Transpiler::write_file_or_report(const std::string &path, const std::string &data, std::ostream &err) {
  std::string error;
  const bool is_ok = support::WriteFile(path, data, error);
  if (!is_ok) {
    err << "unihir: " << error << '\n';
  }
  return is_ok;
}

}  // namespace unihir::driver
