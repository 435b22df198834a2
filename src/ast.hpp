#pragma once

#include "lexer.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace shade {

// Expressions
struct Expr {
  SourceLoc loc;
  enum class Kind {
    Invalid,
    IntLiteral,
    DecimalLiteral,
    Ident,
    Binary,   // lhs op rhs
    Unary,    // op operand
    Call,     // ident(args)
  };
  Kind kind = Kind::Invalid;
  int64_t int_val = 0;
  float decimal_val = 0;

  std::string ident;  // Ident, Call callee

  std::unique_ptr<Expr> lhs;
  std::unique_ptr<Expr> rhs;
  TokenKind op = TokenKind::EndOfFile;

  std::unique_ptr<Expr> operand;  // unary
  std::vector<std::unique_ptr<Expr>> args;  // call

  bool is_literal() const {
    return kind == Kind::IntLiteral || kind == Kind::DecimalLiteral;
  }
};

// Statements
struct Stmt {
  SourceLoc loc;
  enum class Kind {
    Invalid,
    Assign,  // target = value;
    Return,  // return value; (value may be absent)
  };
  Kind kind = Kind::Invalid;
  std::string target;
  std::unique_ptr<Expr> value;
};

struct ParamDecl {
  SourceLoc loc;
  std::string name;
  TypeKind type = TypeKind::Invalid;
};

struct Function {
  SourceLoc loc;
  std::string name;
  std::vector<std::unique_ptr<Stmt>> body;
};

struct Program {
  std::string path;
  std::vector<ParamDecl> in_params;
  std::vector<ParamDecl> out_params;
  std::vector<std::unique_ptr<Function>> functions;

  const Function* find_function(const std::string& name) const {
    for (const auto& f : functions)
      if (f && f->name == name) return f.get();
    return nullptr;
  }
};

// Helpers
inline std::unique_ptr<Expr> make_decimal(float v, SourceLoc loc = {}) {
  auto e = std::make_unique<Expr>();
  e->kind = Expr::Kind::DecimalLiteral;
  e->loc = loc;
  e->decimal_val = v;
  return e;
}

inline std::unique_ptr<Expr> make_ident(std::string name, SourceLoc loc = {}) {
  auto e = std::make_unique<Expr>();
  e->kind = Expr::Kind::Ident;
  e->loc = loc;
  e->ident = std::move(name);
  return e;
}

}  // namespace shade
