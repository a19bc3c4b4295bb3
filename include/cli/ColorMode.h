#pragma once

namespace unihir::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace unihir::cli
