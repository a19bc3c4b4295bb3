#pragma once

namespace unihir::hir {

struct Module; struct Function; struct Call; struct Variable; struct Literal;

// Virtual visitor interface for unified HIR traversal.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const Module&) = 0;
  virtual void visit(const Function&) = 0;
  virtual void visit(const Call&) = 0;
  virtual void visit(const Variable&) = 0;
  virtual void visit(const Literal&) = 0;
};

} // namespace unihir::hir
