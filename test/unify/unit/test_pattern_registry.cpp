/***
 * Name: test_pattern_registry
 * Purpose: Validate the registry table, exact lookups and suggestions.
 */
#include <gtest/gtest.h>
#include "unify/PatternRegistry.h"

using namespace unihir;
using unify::PatternRegistry;

TEST(PatternRegistry, HasElevenEntriesInDeclarationOrder) {
  const auto& all = PatternRegistry::all();
  ASSERT_EQ(all.size(), 11u);
  EXPECT_EQ(all.front().pythonName, "len");
  EXPECT_EQ(all.front().cName, "list_length");
  EXPECT_EQ(all.back().pythonName, "keys");
  EXPECT_EQ(all.back().rustOp, "HashMap::keys");
}

TEST(PatternRegistry, ExactLookupOnly) {
  const auto* entry = PatternRegistry::find("append", "PyList_Append");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->pattern, hir::UnificationPattern::Append);
  EXPECT_EQ(entry->rustOp, "Vec::push");
  EXPECT_EQ(entry->minArgs, 2u);
  EXPECT_EQ(PatternRegistry::find("append", "list_length"), nullptr);
  EXPECT_EQ(PatternRegistry::find("Append", "PyList_Append"), nullptr);
}

TEST(PatternRegistry, ByPattern) {
  const auto* entry = PatternRegistry::byPattern(hir::UnificationPattern::DictKeys);
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->cName, "PyDict_Keys");
  EXPECT_EQ(PatternRegistry::byPattern(hir::UnificationPattern::Custom), nullptr);
}

TEST(PatternRegistry, Describe) {
  EXPECT_EQ(PatternRegistry::all().front().describe(), "len() + list_length() -> Vec::len()");
}

TEST(PatternRegistry, UnrelatedNamesFallBackToFirstThree) {
  const auto s = PatternRegistry::suggestionsFor("frobnicate", "do_frob");
  ASSERT_EQ(s.size(), 3u);
  EXPECT_EQ(s[0]->pythonName, "len");
  EXPECT_EQ(s[1]->pythonName, "append");
  EXPECT_EQ(s[2]->pythonName, "get");
}

TEST(PatternRegistry, OverlappingNamesAreSuggested) {
  const auto s = PatternRegistry::suggestionsFor("append", "PyList");
  ASSERT_FALSE(s.empty());
  EXPECT_EQ(s[0]->pythonName, "append");
}

TEST(PatternRegistry, SuggestionsAreCapped) {
  // "list_" is contained in every list_* C name.
  const auto s = PatternRegistry::suggestionsFor("zzz", "list_");
  EXPECT_EQ(s.size(), 5u);
  const auto two = PatternRegistry::suggestionsFor("zzz", "list_", 2);
  EXPECT_EQ(two.size(), 2u);
}

TEST(PatternRegistry, EmptyNamesNeverMatch) {
  const auto s = PatternRegistry::suggestionsFor("", "");
  EXPECT_EQ(s.size(), 3u);
}
