/***
 * Name: unihir::unify::PatternRegistry (impl)
 * Purpose: Registry table and lookups.
 */
#include "unify/PatternRegistry.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace unihir::unify {

using hir::IntWidth;
using hir::Type;
using hir::UnificationPattern;

std::string PatternEntry::describe() const {
  return pythonName + "() + " + cName + "() -> " + rustOp + "()";
}

static std::vector<PatternEntry> buildTable() {
  const Type any = Type::unknown();
  return {
      {"len", "list_length", UnificationPattern::Len, "Vec::len", Type::rsInt(IntWidth::ISize, false), 1},
      {"append", "PyList_Append", UnificationPattern::Append, "Vec::push", Type::rsUnit(), 2},
      {"get", "PyDict_GetItem", UnificationPattern::DictGet, "HashMap::get", Type::rsOption(any), 2},
      {"reverse", "list_reverse", UnificationPattern::Reverse, "Vec::reverse", Type::rsUnit(), 1},
      {"clear", "list_clear", UnificationPattern::Clear, "Vec::clear", Type::rsUnit(), 1},
      {"pop", "list_pop", UnificationPattern::Pop, "Vec::pop", Type::rsOption(any), 1},
      {"insert", "list_insert", UnificationPattern::Insert, "Vec::insert", Type::rsUnit(), 3},
      {"extend", "list_extend", UnificationPattern::Extend, "Vec::extend", Type::rsUnit(), 2},
      {"dict_pop", "PyDict_DelItem", UnificationPattern::DictPop, "HashMap::remove", Type::rsOption(any), 2},
      {"dict_clear", "PyDict_Clear", UnificationPattern::DictClear, "HashMap::clear", Type::rsUnit(), 1},
      {"keys", "PyDict_Keys", UnificationPattern::DictKeys, "HashMap::keys", Type::rsCustom("Keys"), 1},
  };
}

const std::vector<PatternEntry>& PatternRegistry::all() {
  static const std::vector<PatternEntry> table = buildTable();
  return table;
}

const PatternEntry* PatternRegistry::find(const std::string_view pythonName, const std::string_view cName) {
  for (const auto& entry : all()) {
    if (entry.pythonName == pythonName && entry.cName == cName) { return &entry; }
  }
  return nullptr;
}

const PatternEntry* PatternRegistry::byPattern(const UnificationPattern pattern) {
  for (const auto& entry : all()) {
    if (entry.pattern == pattern) { return &entry; }
  }
  return nullptr;
}

static bool overlaps(const std::string_view registered, const std::string_view requested) {
  if (requested.empty()) { return false; }
  return registered.find(requested) != std::string_view::npos ||
         requested.find(registered) != std::string_view::npos;
}

std::vector<const PatternEntry*> PatternRegistry::suggestionsFor(const std::string_view pythonName,
                                                                 const std::string_view cName, const size_t limit) {
  std::vector<const PatternEntry*> out;
  for (const auto& entry : all()) {
    if (out.size() >= limit) { break; }
    if (overlaps(entry.pythonName, pythonName) || overlaps(entry.cName, cName)) { out.push_back(&entry); }
  }
  if (out.empty()) {
    const auto& table = all();
    const size_t n = std::min<size_t>({3, limit, table.size()});
    for (size_t i = 0; i < n; ++i) { out.push_back(&table[i]); }
  }
  return out;
}

} // namespace unihir::unify
