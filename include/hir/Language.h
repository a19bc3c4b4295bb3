/**
 * @file
 * @brief Origin language tag carried by every node and type.
 */
#pragma once

namespace unihir::hir {
    enum class Language {
        Python, // dynamic source
        C,      // systems source (including CPython object handles)
        Rust    // target
    };

    inline const char *to_string(const Language element) {
        switch (element) {
            case Language::Python: return "Python";
            case Language::C: return "C";
            case Language::Rust: return "Rust";
            default: return "unknown";
        }
    }
} // namespace unihir::hir
