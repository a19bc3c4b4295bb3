/**
 * @file
 * @brief Known Python/C operation equivalences.
 */
#pragma once

namespace unihir::hir {
    enum class UnificationPattern {
        Len,
        Append,
        DictGet,
        Reverse,
        Clear,
        Pop,
        Insert,
        Extend,
        DictPop,
        DictClear,
        DictKeys,
        // Reserved for externally supplied pairs; has no built-in template.
        Custom
    };

    inline const char *to_string(const UnificationPattern element) {
        switch (element) {
            case UnificationPattern::Len: return "Len";
            case UnificationPattern::Append: return "Append";
            case UnificationPattern::DictGet: return "DictGet";
            case UnificationPattern::Reverse: return "Reverse";
            case UnificationPattern::Clear: return "Clear";
            case UnificationPattern::Pop: return "Pop";
            case UnificationPattern::Insert: return "Insert";
            case UnificationPattern::Extend: return "Extend";
            case UnificationPattern::DictPop: return "DictPop";
            case UnificationPattern::DictClear: return "DictClear";
            case UnificationPattern::DictKeys: return "DictKeys";
            case UnificationPattern::Custom: return "Custom";
            default: return "unknown";
        }
    }
} // namespace unihir::hir
