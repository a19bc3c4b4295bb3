/***
 * Name: unihir::support::ReadFile / LoadFile
 * Purpose: Read the full contents of a text file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Binary read so "\r\n" reaches the lexer untouched.
 *   Directories are rejected up front; LoadFile turns failure into FileReadError.
 */
#include "unihir/support/fs.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "unihir/exceptions/file_read_error.h"

namespace unihir {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "is a directory: " + path;
    return false;
  }
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    err = "failed to open file: " + path;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  return true;
}

std::string LoadFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!ReadFile(path, text, err)) { throw exceptions::FileReadError(err); }
  return text;
}

}  // namespace support
}  // namespace unihir
