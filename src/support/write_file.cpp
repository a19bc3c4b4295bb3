/***
 * Name: unihir::support::WriteFile
 * Purpose: Write a string to a file, replacing any previous contents.
 */
#include "unihir/support/fs.h"

#include <fstream>
#include <string>

namespace unihir {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.good()) {
    err = "failed to open file for writing: " + path;
    return false;
  }
  out << data;
  if (!out.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace unihir
