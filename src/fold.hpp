#pragma once

#include "ast.hpp"
#include "diagnostics.hpp"
#include <memory>

namespace shade {

// Constant folding. Rewrites the tree in place, replacing literal-only
// subexpressions with their value. A division by a zero constant is a
// folding error and the tree must not be handed to code generation.
class ConstantFolder {
 public:
  bool fold_program(Program& p);
  bool fold_expr(std::unique_ptr<Expr>& e);

  const Diagnostics& errors() const { return errors_; }
  size_t folded_count() const { return folded_count_; }

 private:
  bool fold_binary(std::unique_ptr<Expr>& e);
  bool fold_unary(std::unique_ptr<Expr>& e);
  void add_error(SourceLoc loc, const std::string& msg);

  Diagnostics errors_;
  size_t folded_count_ = 0;
};

}  // namespace shade
