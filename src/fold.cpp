#include "fold.hpp"
#include <cstdint>
#include <llvm/Support/MathExtras.h>

namespace shade {

namespace {

bool is_zero_literal(const Expr& e) {
  if (e.kind == Expr::Kind::DecimalLiteral) return e.decimal_val == 0.0f;
  if (e.kind == Expr::Kind::IntLiteral) return e.int_val == 0;
  return false;
}

}  // namespace

void ConstantFolder::add_error(SourceLoc loc, const std::string& msg) {
  Diagnostic d;
  d.kind = ErrorKind::Folding;
  d.loc = loc;
  d.message = msg;
  errors_.push_back(std::move(d));
}

bool ConstantFolder::fold_program(Program& p) {
  size_t errors_before = errors_.size();
  for (auto& f : p.functions) {
    if (!f) continue;
    for (auto& s : f->body) {
      if (s && s->value) fold_expr(s->value);
    }
  }
  return errors_.size() == errors_before;
}

bool ConstantFolder::fold_expr(std::unique_ptr<Expr>& e) {
  if (!e) return true;
  switch (e->kind) {
    case Expr::Kind::Binary:
      return fold_binary(e);
    case Expr::Kind::Unary:
      return fold_unary(e);
    case Expr::Kind::Call: {
      bool ok = true;
      for (auto& a : e->args)
        if (!fold_expr(a)) ok = false;
      return ok;
    }
    default:
      return true;
  }
}

bool ConstantFolder::fold_binary(std::unique_ptr<Expr>& e) {
  bool lhs_ok = fold_expr(e->lhs);
  bool rhs_ok = fold_expr(e->rhs);
  if (!lhs_ok || !rhs_ok || !e->lhs || !e->rhs) return false;

  if (e->op == TokenKind::Slash && is_zero_literal(*e->rhs)) {
    add_error(e->rhs->loc, "division by constant zero");
    return false;
  }

  const Expr& L = *e->lhs;
  const Expr& R = *e->rhs;
  if (!L.is_literal() || L.kind != R.kind) return true;

  if (L.kind == Expr::Kind::DecimalLiteral) {
    float a = L.decimal_val;
    float b = R.decimal_val;
    float v = 0;
    switch (e->op) {
      case TokenKind::Plus: v = a + b; break;
      case TokenKind::Minus: v = a - b; break;
      case TokenKind::Star: v = a * b; break;
      case TokenKind::Slash: v = a / b; break;
      default: return true;
    }
    e = make_decimal(v, e->loc);
    ++folded_count_;
    return true;
  }

  int64_t a = L.int_val;
  int64_t b = R.int_val;
  int64_t v = 0;
  bool overflow = false;
  switch (e->op) {
    case TokenKind::Plus: overflow = llvm::AddOverflow(a, b, v) != 0; break;
    case TokenKind::Minus: overflow = llvm::SubOverflow(a, b, v) != 0; break;
    case TokenKind::Star: overflow = llvm::MulOverflow(a, b, v) != 0; break;
    case TokenKind::Slash:
      overflow = a == INT64_MIN && b == -1;
      if (!overflow) v = a / b;
      break;
    default: return true;
  }
  if (overflow) {
    add_error(e->loc, "integer overflow in constant expression");
    return false;
  }
  SourceLoc loc = e->loc;
  e = std::make_unique<Expr>();
  e->kind = Expr::Kind::IntLiteral;
  e->loc = loc;
  e->int_val = v;
  ++folded_count_;
  return true;
}

bool ConstantFolder::fold_unary(std::unique_ptr<Expr>& e) {
  if (!fold_expr(e->operand)) return false;
  if (!e->operand || !e->operand->is_literal()) return true;
  if (e->op == TokenKind::Plus) {
    e = std::move(e->operand);
    ++folded_count_;
    return true;
  }
  if (e->op != TokenKind::Minus) return true;
  Expr& v = *e->operand;
  if (v.kind == Expr::Kind::DecimalLiteral) {
    v.decimal_val = -v.decimal_val;
  } else {
    if (v.int_val == INT64_MIN) {
      add_error(e->loc, "integer overflow in constant expression");
      return false;
    }
    v.int_val = -v.int_val;
  }
  v.loc = e->loc;
  e = std::move(e->operand);
  ++folded_count_;
  return true;
}

}  // namespace shade
