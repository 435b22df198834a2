#include "parser.hpp"
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace shade {

Parser::Parser(std::string source, std::string path)
    : source_(std::move(source)), path_(std::move(path)), lexer_(source_) {
  advance();
}

void Parser::advance() {
  current_ = lexer_.next();
}

bool Parser::expect(TokenKind k) {
  if (current_.kind == k) {
    advance();
    return true;
  }
  return false;
}

bool Parser::check(TokenKind k) const {
  return current_.kind == k;
}

void Parser::add_error(const std::string& msg) {
  Diagnostic d;
  d.kind = ErrorKind::Syntax;
  d.loc = current_.loc;
  d.message = msg;
  errors_.push_back(std::move(d));
}

void Parser::expected(const char* what) {
  std::string msg = "expected ";
  msg += what;
  msg += ", found ";
  msg += token_kind_name(current_.kind);
  add_error(msg);
}

// Skip to just past the next ';' or up to a '}' / top-level keyword.
void Parser::synchronize() {
  while (!check(TokenKind::EndOfFile)) {
    if (expect(TokenKind::Semicolon)) return;
    if (current_.is_one_of(TokenKind::RBrace, TokenKind::KwFn, TokenKind::KwIn,
                           TokenKind::KwOut))
      return;
    advance();
  }
}

int Parser::precedence(TokenKind op) {
  switch (op) {
    case TokenKind::Plus:
    case TokenKind::Minus: return 1;
    case TokenKind::Star:
    case TokenKind::Slash: return 2;
    default: return 0;
  }
}

std::unique_ptr<Program> Parser::parse_program() {
  auto program = std::make_unique<Program>();
  program->path = path_;

  while (!check(TokenKind::EndOfFile)) {
    if (check(TokenKind::KwIn)) {
      advance();
      if (!parse_param(program->in_params)) synchronize();
      continue;
    }
    if (check(TokenKind::KwOut)) {
      advance();
      if (!parse_param(program->out_params)) synchronize();
      continue;
    }
    if (check(TokenKind::KwFn)) {
      auto fn = parse_function();
      if (fn) program->functions.push_back(std::move(fn));
      continue;
    }
    expected("'in', 'out' or 'fn'");
    advance();
    synchronize();
  }
  return program;
}

// in NAME: TYPE;   (the leading keyword is already consumed)
bool Parser::parse_param(std::vector<ParamDecl>& out) {
  ParamDecl p;
  p.loc = current_.loc;
  if (!check(TokenKind::Identifier)) {
    expected("parameter name");
    return false;
  }
  p.name = std::string(current_.text);
  advance();
  if (!expect(TokenKind::Colon)) {
    expected("':' after parameter name");
    return false;
  }
  if (!check(TokenKind::Identifier)) {
    expected("type name");
    return false;
  }
  auto type = type_kind_from_name(current_.text);
  if (!type) {
    add_error("unknown type '" + std::string(current_.text) + "'");
    return false;
  }
  p.type = *type;
  advance();
  if (!expect(TokenKind::Semicolon)) {
    expected("';' after parameter");
    return false;
  }
  out.push_back(std::move(p));
  return true;
}

std::unique_ptr<Function> Parser::parse_function() {
  if (!expect(TokenKind::KwFn)) return nullptr;
  auto fn = std::make_unique<Function>();
  fn->loc = current_.loc;
  if (!check(TokenKind::Identifier)) {
    expected("function name");
    synchronize();
    return nullptr;
  }
  fn->name = std::string(current_.text);
  advance();
  if (!expect(TokenKind::LParen)) expected("'(' after function name");
  if (!expect(TokenKind::RParen)) expected("')'");
  if (!expect(TokenKind::LBrace)) {
    expected("'{' to open function body");
    synchronize();
    return nullptr;
  }
  while (!check(TokenKind::RBrace) && !check(TokenKind::EndOfFile)) {
    auto s = parse_statement();
    if (s) fn->body.push_back(std::move(s));
    else synchronize();
  }
  if (!expect(TokenKind::RBrace)) expected("'}' to close function body");
  return fn;
}

std::unique_ptr<Stmt> Parser::parse_statement() {
  if (check(TokenKind::KwReturn)) return parse_return();
  if (check(TokenKind::Identifier)) return parse_assignment();
  expected("statement");
  if (!check(TokenKind::RBrace)) advance();
  return nullptr;
}

std::unique_ptr<Stmt> Parser::parse_return() {
  auto s = std::make_unique<Stmt>();
  s->kind = Stmt::Kind::Return;
  s->loc = current_.loc;
  advance();  // return
  if (!check(TokenKind::Semicolon)) {
    s->value = parse_expr();
    if (!s->value) return nullptr;
  }
  if (!expect(TokenKind::Semicolon)) {
    expected("';' after return");
    return nullptr;
  }
  return s;
}

std::unique_ptr<Stmt> Parser::parse_assignment() {
  auto s = std::make_unique<Stmt>();
  s->kind = Stmt::Kind::Assign;
  s->loc = current_.loc;
  s->target = std::string(current_.text);
  advance();
  if (!expect(TokenKind::Eq)) {
    expected("'=' in assignment");
    return nullptr;
  }
  s->value = parse_expr();
  if (!s->value) return nullptr;
  if (!expect(TokenKind::Semicolon)) {
    expected("';' after assignment");
    return nullptr;
  }
  return s;
}

std::unique_ptr<Expr> Parser::parse_expr(int prec) {
  auto lhs = parse_unary();
  if (!lhs) return nullptr;

  while (true) {
    TokenKind op = current_.kind;
    int p = precedence(op);
    if (p == 0 || p <= prec) break;
    advance();
    auto rhs = parse_expr(p);
    if (!rhs) return nullptr;
    auto bin = std::make_unique<Expr>();
    bin->kind = Expr::Kind::Binary;
    bin->loc = lhs->loc;
    bin->lhs = std::move(lhs);
    bin->op = op;
    bin->rhs = std::move(rhs);
    lhs = std::move(bin);
  }
  return lhs;
}

std::unique_ptr<Expr> Parser::parse_unary() {
  if (current_.is_one_of(TokenKind::Minus, TokenKind::Plus, TokenKind::Exclaim)) {
    auto e = std::make_unique<Expr>();
    e->kind = Expr::Kind::Unary;
    e->loc = current_.loc;
    e->op = current_.kind;
    advance();
    e->operand = parse_unary();
    if (!e->operand) return nullptr;
    return e;
  }
  return parse_primary();
}

std::unique_ptr<Expr> Parser::parse_primary() {
  SourceLoc loc = current_.loc;
  if (check(TokenKind::IntLiteral)) {
    auto e = std::make_unique<Expr>();
    e->kind = Expr::Kind::IntLiteral;
    e->loc = loc;
    const char* first = current_.text.data();
    const char* last = first + current_.text.size();
    auto res = std::from_chars(first, last, e->int_val);
    if (res.ec != std::errc() || res.ptr != last) {
      add_error("integer literal '" + std::string(current_.text) + "' out of range");
      return nullptr;
    }
    advance();
    return e;
  }
  if (check(TokenKind::FloatLiteral)) {
    std::string text(current_.text);
    errno = 0;
    float v = std::strtof(text.c_str(), nullptr);
    if (errno == ERANGE && std::isinf(v)) {
      add_error("decimal literal '" + text + "' out of range");
      return nullptr;
    }
    advance();
    return make_decimal(v, loc);
  }
  if (check(TokenKind::LParen)) {
    advance();
    auto e = parse_expr();
    if (!e) return nullptr;
    if (!expect(TokenKind::RParen)) {
      expected("')'");
      return nullptr;
    }
    return e;
  }
  if (check(TokenKind::Identifier)) {
    std::string name(current_.text);
    advance();
    if (check(TokenKind::LParen)) return parse_call(std::move(name), loc);
    return make_ident(std::move(name), loc);
  }
  expected("expression");
  return nullptr;
}

std::unique_ptr<Expr> Parser::parse_call(std::string callee, SourceLoc loc) {
  advance();  // (
  auto e = std::make_unique<Expr>();
  e->kind = Expr::Kind::Call;
  e->loc = loc;
  e->ident = std::move(callee);
  if (!check(TokenKind::RParen)) {
    while (true) {
      auto arg = parse_expr();
      if (!arg) return nullptr;
      e->args.push_back(std::move(arg));
      if (!expect(TokenKind::Comma)) break;
    }
  }
  if (!expect(TokenKind::RParen)) {
    expected("')' after call arguments");
    return nullptr;
  }
  return e;
}

}  // namespace shade
