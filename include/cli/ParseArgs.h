#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"
#include "Options.h"

namespace unihir::cli {

    // Parse argv into Options. Returns false on a usage error, which has
    // already been reported on stderr.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace unihir::cli
