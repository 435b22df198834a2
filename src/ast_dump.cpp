#include "ast_dump.hpp"

namespace shade {

static void indent(std::ostream& out, int n) {
  for (int i = 0; i < n; ++i) out << "  ";
}

static const char* op_text(TokenKind op) {
  switch (op) {
    case TokenKind::Plus: return "+";
    case TokenKind::Minus: return "-";
    case TokenKind::Star: return "*";
    case TokenKind::Slash: return "/";
    case TokenKind::Exclaim: return "!";
    default: return "?";
  }
}

void dump_expr(std::ostream& out, const Expr& e, int indent_level) {
  indent(out, indent_level);
  switch (e.kind) {
    case Expr::Kind::IntLiteral:
      out << "IntLiteral(" << e.int_val << ")\n";
      break;
    case Expr::Kind::DecimalLiteral:
      out << "DecimalLiteral(" << e.decimal_val << ")\n";
      break;
    case Expr::Kind::Ident:
      out << "Ident(" << e.ident << ")\n";
      break;
    case Expr::Kind::Binary:
      out << "Binary(" << op_text(e.op) << ")\n";
      if (e.lhs) dump_expr(out, *e.lhs, indent_level + 1);
      if (e.rhs) dump_expr(out, *e.rhs, indent_level + 1);
      break;
    case Expr::Kind::Unary:
      out << "Unary(" << op_text(e.op) << ")\n";
      if (e.operand) dump_expr(out, *e.operand, indent_level + 1);
      break;
    case Expr::Kind::Call:
      out << "Call(" << e.ident << ")\n";
      for (const auto& a : e.args)
        if (a) dump_expr(out, *a, indent_level + 1);
      break;
    case Expr::Kind::Invalid:
      out << "Invalid\n";
      break;
  }
}

void dump_stmt(std::ostream& out, const Stmt& s, int indent_level) {
  indent(out, indent_level);
  switch (s.kind) {
    case Stmt::Kind::Assign:
      out << "Assign(" << s.target << ")\n";
      break;
    case Stmt::Kind::Return:
      out << "Return\n";
      break;
    case Stmt::Kind::Invalid:
      out << "Invalid\n";
      return;
  }
  if (s.value) dump_expr(out, *s.value, indent_level + 1);
}

void dump_function(std::ostream& out, const Function& f, int indent_level) {
  indent(out, indent_level);
  out << "Function(" << f.name << ")\n";
  for (const auto& s : f.body)
    if (s) dump_stmt(out, *s, indent_level + 1);
}

void dump_program(std::ostream& out, const Program& p) {
  out << "Program " << p.path << "\n";
  for (const auto& param : p.in_params)
    out << "  In(" << param.name << ": " << type_kind_name(param.type) << ")\n";
  for (const auto& param : p.out_params)
    out << "  Out(" << param.name << ": " << type_kind_name(param.type) << ")\n";
  for (const auto& f : p.functions)
    if (f) dump_function(out, *f, 1);
}

}  // namespace shade
