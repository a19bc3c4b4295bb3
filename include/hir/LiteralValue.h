/**
 * @file
 * @brief Literal payload shared by the Python, C and unified graphs.
 */
#pragma once

#include <cstdint>
#include <string>

namespace unihir::hir {

struct LiteralValue {
  enum class Kind { Int, Float, Str, Bool, None };

  Kind kind{Kind::None};
  int64_t intValue{0};
  double floatValue{0.0};
  std::string strValue{};
  bool boolValue{false};

  static LiteralValue ofInt(int64_t v) { LiteralValue l; l.kind = Kind::Int; l.intValue = v; return l; }
  static LiteralValue ofFloat(double v) { LiteralValue l; l.kind = Kind::Float; l.floatValue = v; return l; }
  static LiteralValue ofStr(std::string v) { LiteralValue l; l.kind = Kind::Str; l.strValue = std::move(v); return l; }
  static LiteralValue ofBool(bool v) { LiteralValue l; l.kind = Kind::Bool; l.boolValue = v; return l; }
  static LiteralValue none() { return LiteralValue{}; }

  bool operator==(const LiteralValue& other) const;
  bool operator!=(const LiteralValue& other) const { return !(*this == other); }
};

// Python-flavored rendering (used by printers and diagnostics).
std::string to_string(const LiteralValue& value);

} // namespace unihir::hir
