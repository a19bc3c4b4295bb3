#include "hir/LiteralValue.h"

#include <sstream>
#include <string>

namespace unihir::hir {

bool LiteralValue::operator==(const LiteralValue& other) const {
  if (kind != other.kind) { return false; }
  switch (kind) {
    case Kind::Int: return intValue == other.intValue;
    case Kind::Float: return floatValue == other.floatValue;
    case Kind::Str: return strValue == other.strValue;
    case Kind::Bool: return boolValue == other.boolValue;
    case Kind::None: return true;
    default: return false;
  }
}

std::string to_string(const LiteralValue& value) {
  switch (value.kind) {
    case LiteralValue::Kind::Int: return std::to_string(value.intValue);
    case LiteralValue::Kind::Float: {
      std::ostringstream oss;
      oss << value.floatValue;
      return oss.str();
    }
    case LiteralValue::Kind::Str: return "\"" + value.strValue + "\"";
    case LiteralValue::Kind::Bool: return value.boolValue ? "True" : "False";
    case LiteralValue::Kind::None: return "None";
    default: return "?";
  }
}

} // namespace unihir::hir
