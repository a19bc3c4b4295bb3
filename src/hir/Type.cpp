/***
 * Name: unihir::hir::Type (impl)
 * Purpose: Named constructors, equality, compatibility and rendering.
 */
#include "hir/Type.h"

#include <cstddef>
#include <string>
#include <utility>

namespace unihir::hir {

namespace {
Type withParams(TypeKind kind, std::vector<Type> params) {
  Type t;
  t.kind = kind;
  t.params = std::move(params);
  return t;
}

Type withName(TypeKind kind, std::string name) {
  Type t;
  t.kind = kind;
  t.name = std::move(name);
  return t;
}

const char* widthSuffix(const IntWidth w) {
  switch (w) {
    case IntWidth::I8: return "8";
    case IntWidth::I16: return "16";
    case IntWidth::I32: return "32";
    case IntWidth::I64: return "64";
    case IntWidth::ISize: return "size";
    default: return "32";
  }
}

std::string param(const Type& type, const size_t index) {
  if (index >= type.params.size()) { return "?"; }
  return to_string(type.params[index]);
}
} // namespace

std::optional<Language> Type::language() const {
  switch (kind) {
    case TypeKind::Unknown: return std::nullopt;
    case TypeKind::PyInt: case TypeKind::PyFloat: case TypeKind::PyStr: case TypeKind::PyBool:
    case TypeKind::PyNone: case TypeKind::PyList: case TypeKind::PyDict: case TypeKind::PyClass:
      return Language::Python;
    case TypeKind::CVoid: case TypeKind::CChar: case TypeKind::CInt: case TypeKind::CLong:
    case TypeKind::CSizeT: case TypeKind::CFloat: case TypeKind::CDouble: case TypeKind::CPointer:
    case TypeKind::CStruct: case TypeKind::CPyObject: case TypeKind::CPyListObject:
    case TypeKind::CPyDictObject: case TypeKind::CPySsizeT:
      return Language::C;
    default:
      return Language::Rust;
  }
}

Type Type::pyList(Type element) { return withParams(TypeKind::PyList, {std::move(element)}); }
Type Type::pyDict(Type key, Type value) { return withParams(TypeKind::PyDict, {std::move(key), std::move(value)}); }
Type Type::pyClass(std::string className) { return withName(TypeKind::PyClass, std::move(className)); }
Type Type::cPointer(Type pointee) { return withParams(TypeKind::CPointer, {std::move(pointee)}); }
Type Type::cStruct(std::string structName) { return withName(TypeKind::CStruct, std::move(structName)); }

Type Type::rsInt(const IntWidth w, const bool isSigned) {
  Type t;
  t.kind = TypeKind::RsInt;
  t.width = w;
  t.isSigned = isSigned;
  return t;
}

Type Type::rsFloat(const int bits) {
  Type t;
  t.kind = TypeKind::RsFloat;
  t.floatBits = bits;
  return t;
}

Type Type::rsVec(Type element) { return withParams(TypeKind::RsVec, {std::move(element)}); }
Type Type::rsHashMap(Type key, Type value) { return withParams(TypeKind::RsHashMap, {std::move(key), std::move(value)}); }
Type Type::rsOption(Type inner) { return withParams(TypeKind::RsOption, {std::move(inner)}); }

Type Type::rsReference(Type inner, const bool isMutable) {
  Type t = withParams(TypeKind::RsReference, {std::move(inner)});
  t.isMutable = isMutable;
  return t;
}

Type Type::rsRc(Type inner) { return withParams(TypeKind::RsRc, {std::move(inner)}); }
Type Type::rsCustom(std::string typeName) { return withName(TypeKind::RsCustom, std::move(typeName)); }

bool operator==(const Type& lhs, const Type& rhs) {
  if (lhs.kind != rhs.kind) { return false; }
  switch (lhs.kind) {
    case TypeKind::RsInt:
      return lhs.width == rhs.width && lhs.isSigned == rhs.isSigned;
    case TypeKind::RsFloat:
      return lhs.floatBits == rhs.floatBits;
    case TypeKind::RsReference:
      return lhs.isMutable == rhs.isMutable && lhs.params == rhs.params;
    case TypeKind::PyClass: case TypeKind::CStruct: case TypeKind::RsCustom:
      return lhs.name == rhs.name;
    default:
      return lhs.params == rhs.params;
  }
}

bool isCompatible(const Type& from, const Type& to) {
  if (from.isUnknown() || to.isUnknown()) { return true; }
  if (from == to) { return true; }
  const bool toVec = to.kind == TypeKind::RsVec;
  const bool toMap = to.kind == TypeKind::RsHashMap;
  if (toVec && (from.kind == TypeKind::PyList || from.kind == TypeKind::CPyListObject)) { return true; }
  if (toMap && (from.kind == TypeKind::PyDict || from.kind == TypeKind::CPyDictObject)) { return true; }
  return false;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string to_string(const Type& type) {
  switch (type.kind) {
    case TypeKind::Unknown: return "?";
    case TypeKind::PyInt: return "int";
    case TypeKind::PyFloat: return "float";
    case TypeKind::PyStr: return "str";
    case TypeKind::PyBool: return "bool";
    case TypeKind::PyNone: return "None";
    case TypeKind::PyList: return "list[" + param(type, 0) + "]";
    case TypeKind::PyDict: return "dict[" + param(type, 0) + ", " + param(type, 1) + "]";
    case TypeKind::PyClass: return type.name;
    case TypeKind::CVoid: return "void";
    case TypeKind::CChar: return "char";
    case TypeKind::CInt: return "int";
    case TypeKind::CLong: return "long";
    case TypeKind::CSizeT: return "size_t";
    case TypeKind::CFloat: return "float";
    case TypeKind::CDouble: return "double";
    case TypeKind::CPointer: return param(type, 0) + "*";
    case TypeKind::CStruct: return "struct " + type.name;
    case TypeKind::CPyObject: return "PyObject*";
    case TypeKind::CPyListObject: return "PyListObject*";
    case TypeKind::CPyDictObject: return "PyDictObject*";
    case TypeKind::CPySsizeT: return "Py_ssize_t";
    case TypeKind::RsInt: return std::string(type.isSigned ? "i" : "u") + widthSuffix(type.width);
    case TypeKind::RsFloat: return "f" + std::to_string(type.floatBits);
    case TypeKind::RsBool: return "bool";
    case TypeKind::RsString: return "String";
    case TypeKind::RsVec: return "Vec<" + param(type, 0) + ">";
    case TypeKind::RsHashMap: return "HashMap<" + param(type, 0) + ", " + param(type, 1) + ">";
    case TypeKind::RsOption: return "Option<" + param(type, 0) + ">";
    case TypeKind::RsReference: return std::string(type.isMutable ? "&mut " : "&") + param(type, 0);
    case TypeKind::RsRc: return "Rc<" + param(type, 0) + ">";
    case TypeKind::RsUnit: return "()";
    case TypeKind::RsCustom: return type.name;
    default: return "?";
  }
}

} // namespace unihir::hir
