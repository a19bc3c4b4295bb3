/***
 * Name: test_hir_tree_queries
 * Purpose: Exercise clone, structural equality, lookup and tree geometry.
 */
#include <gtest/gtest.h>
#include "hir/Equality.h"
#include "hir/Nodes.h"

using namespace unihir;

static std::unique_ptr<hir::Call> makeLenCall() {
  auto call = std::make_unique<hir::Call>(hir::NodeId{1}, hir::Language::Python, hir::Language::Rust, "Vec::len");
  call->args.push_back(std::make_unique<hir::Variable>(hir::NodeId{2}, "xs", hir::Type::unknown(), hir::Language::Python));
  call->crossMapping = hir::CrossMapping(hir::NodeId{7}, hir::NodeId{3}, hir::UnificationPattern::Len);
  return call;
}

TEST(HirTree, CloneIsStructurallyEqual) {
  auto call = makeLenCall();
  auto copy = call->clone();
  EXPECT_TRUE(hir::equals(*call, *copy));
}

TEST(HirTree, BoundaryStateTakesPartInEquality) {
  auto call = makeLenCall();
  auto copy = call->clone();
  auto& copied = static_cast<hir::Call&>(*copy);
  ASSERT_TRUE(copied.crossMapping->eliminateBoundary());
  EXPECT_FALSE(hir::equals(*call, *copy));
  EXPECT_FALSE(call->crossMapping->boundaryEliminated());
}

TEST(HirTree, CloneKeepsDroppedReceiverMark) {
  auto call = makeLenCall();
  call->receiverDropped = true;
  auto copy = call->clone();
  EXPECT_TRUE(static_cast<const hir::Call&>(*copy).receiverDropped);
  EXPECT_TRUE(hir::equals(*call, *copy));
  EXPECT_FALSE(hir::equals(*call, *makeLenCall()));
}

TEST(HirTree, EliminateBoundaryReportsOnlyTheTransition) {
  hir::CrossMapping cm(hir::NodeId{1}, hir::NodeId{2}, hir::UnificationPattern::Pop);
  EXPECT_TRUE(cm.eliminateBoundary());
  EXPECT_FALSE(cm.eliminateBoundary());
  EXPECT_TRUE(cm.boundaryEliminated());
}

TEST(HirTree, FindByIdAndGeometry) {
  hir::Module mod(hir::NodeId{10}, "m", hir::Language::Python);
  auto fn = std::make_unique<hir::Function>(hir::NodeId{11}, "f", hir::Language::Python);
  fn->body.push_back(makeLenCall());
  mod.declarations.push_back(std::move(fn));

  const auto* found = hir::findById(mod, hir::NodeId{2});
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->kind, hir::NodeKind::Variable);
  EXPECT_EQ(hir::findById(mod, hir::NodeId{99}), nullptr);
  EXPECT_EQ(hir::countNodes(mod), 4u);
  EXPECT_EQ(hir::maxDepth(mod), 4u);
}
