#pragma once

#include "ast.hpp"
#include "diagnostics.hpp"
#include "lexer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace shade {

class Parser {
 public:
  explicit Parser(std::string source, std::string path = "");

  std::unique_ptr<Program> parse_program();
  bool has_errors() const { return !errors_.empty(); }
  const Diagnostics& errors() const { return errors_; }
  const std::string& path() const { return path_; }

 private:
  void advance();
  bool expect(TokenKind k);
  bool check(TokenKind k) const;
  void add_error(const std::string& msg);
  void expected(const char* what);
  void synchronize();

  bool parse_param(std::vector<ParamDecl>& out);
  std::unique_ptr<Function> parse_function();
  std::unique_ptr<Stmt> parse_statement();
  std::unique_ptr<Stmt> parse_return();
  std::unique_ptr<Stmt> parse_assignment();

  std::unique_ptr<Expr> parse_expr(int prec = 0);
  std::unique_ptr<Expr> parse_unary();
  std::unique_ptr<Expr> parse_primary();
  std::unique_ptr<Expr> parse_call(std::string callee, SourceLoc loc);
  int precedence(TokenKind op);

  std::string source_;
  std::string path_;
  Lexer lexer_;
  Token current_;
  Diagnostics errors_;
};

}  // namespace shade
