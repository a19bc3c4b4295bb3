/***
 * Name: test_hir_printer
 * Purpose: Textual rendering of unified HIR used by inspect and logs.
 */
#include <gtest/gtest.h>
#include "hir/Nodes.h"
#include "observability/HirPrinter.h"

using namespace unihir;

TEST(HirPrinter, CallWithMappingAndReceiver) {
  hir::Call call(hir::NodeId{1}, hir::Language::Python, hir::Language::Rust, "Vec::len");
  call.inferredType = hir::Type::rsInt(hir::IntWidth::ISize, false);
  call.crossMapping = hir::CrossMapping(hir::NodeId{3}, hir::NodeId{4}, hir::UnificationPattern::Len);
  call.args.push_back(
      std::make_unique<hir::Variable>(hir::NodeId{2}, "my_list", hir::Type::unknown(), hir::Language::Python));

  obs::HirPrinter printer;
  EXPECT_EQ(printer.print(call),
            "Call Vec::len #1 [Python -> Rust] : usize\n"
            "  CrossMapping python=#3 c=#4 pattern=Len boundary=present\n"
            "  Variable my_list #2 : ?\n");

  (void)call.crossMapping->eliminateBoundary();
  EXPECT_NE(printer.print(call).find("boundary=eliminated"), std::string::npos);
}

TEST(HirPrinter, MappingWithoutCSide) {
  hir::Call call(hir::NodeId{7}, hir::Language::Python, hir::Language::Rust, "Vec::push");
  call.crossMapping = hir::CrossMapping(hir::NodeId{8}, std::nullopt, hir::UnificationPattern::Append);
  obs::HirPrinter printer;
  EXPECT_NE(printer.print(call).find("CrossMapping python=#8 c=- pattern=Append"), std::string::npos);
}
