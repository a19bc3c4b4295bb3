/***
 * Name: unihir::hir::Type
 * Purpose: Tagged union over the Python, C and Rust type domains.
 * Inputs:
 *   - Built through the named constructors (Type::pyList, Type::cPointer, ...).
 * Outputs:
 *   - Structural equality, compatibility queries and per-language rendering.
 * Theory of Operation:
 *   A single struct carries the kind tag plus the few payload fields any
 *   kind needs: nested parameter types (element, key/value, pointee, inner),
 *   a name for classes/structs/custom types, and integer width/signedness
 *   or reference mutability. Which fields are meaningful is decided by kind.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hir/Language.h"

namespace unihir::hir {

enum class TypeKind {
  Unknown,
  // Python
  PyInt, PyFloat, PyStr, PyBool, PyNone, PyList, PyDict, PyClass,
  // C
  CVoid, CChar, CInt, CLong, CSizeT, CFloat, CDouble, CPointer, CStruct,
  CPyObject, CPyListObject, CPyDictObject, CPySsizeT,
  // Rust
  RsInt, RsFloat, RsBool, RsString, RsVec, RsHashMap, RsOption, RsReference, RsRc, RsUnit, RsCustom
};

enum class IntWidth { I8, I16, I32, I64, ISize };

struct Type {
  TypeKind kind{TypeKind::Unknown};
  std::vector<Type> params{};
  std::string name{};
  IntWidth width{IntWidth::I32};
  int floatBits{64};
  bool isSigned{true};
  bool isMutable{false};

  bool isUnknown() const { return kind == TypeKind::Unknown; }
  // Unknown belongs to no domain.
  std::optional<Language> language() const;

  static Type unknown() { return Type{}; }

  static Type pyInt() { return of(TypeKind::PyInt); }
  static Type pyFloat() { return of(TypeKind::PyFloat); }
  static Type pyStr() { return of(TypeKind::PyStr); }
  static Type pyBool() { return of(TypeKind::PyBool); }
  static Type pyNone() { return of(TypeKind::PyNone); }
  static Type pyList(Type element);
  static Type pyDict(Type key, Type value);
  static Type pyClass(std::string className);

  static Type cVoid() { return of(TypeKind::CVoid); }
  static Type cChar() { return of(TypeKind::CChar); }
  static Type cInt() { return of(TypeKind::CInt); }
  static Type cLong() { return of(TypeKind::CLong); }
  static Type cSizeT() { return of(TypeKind::CSizeT); }
  static Type cFloat() { return of(TypeKind::CFloat); }
  static Type cDouble() { return of(TypeKind::CDouble); }
  static Type cPointer(Type pointee);
  static Type cStruct(std::string structName);
  static Type cPyObject() { return of(TypeKind::CPyObject); }
  static Type cPyListObject() { return of(TypeKind::CPyListObject); }
  static Type cPyDictObject() { return of(TypeKind::CPyDictObject); }
  static Type cPySsizeT() { return of(TypeKind::CPySsizeT); }

  static Type rsInt(IntWidth w, bool isSigned);
  static Type rsFloat(int bits);
  static Type rsBool() { return of(TypeKind::RsBool); }
  static Type rsString() { return of(TypeKind::RsString); }
  static Type rsVec(Type element);
  static Type rsHashMap(Type key, Type value);
  static Type rsOption(Type inner);
  static Type rsReference(Type inner, bool isMutable);
  static Type rsRc(Type inner);
  static Type rsUnit() { return of(TypeKind::RsUnit); }
  static Type rsCustom(std::string typeName);

 private:
  static Type of(TypeKind k) { Type t; t.kind = k; return t; }
};

bool operator==(const Type& lhs, const Type& rhs);
inline bool operator!=(const Type& lhs, const Type& rhs) { return !(lhs == rhs); }

// Whether a value of type `from` may be treated as `to` during argument
// conversion. Deterministic; the cross-domain rules are directional.
bool isCompatible(const Type& from, const Type& to);

std::string to_string(const Type& type);

} // namespace unihir::hir
