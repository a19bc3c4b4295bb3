#pragma once

#include <string>

namespace unihir::cli {

    // Help text printed for -h/--help and after usage errors.
    std::string Usage();

} // namespace unihir::cli
