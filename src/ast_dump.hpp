#pragma once

#include "ast.hpp"
#include <ostream>

namespace shade {

void dump_expr(std::ostream& out, const Expr& e, int indent = 0);
void dump_stmt(std::ostream& out, const Stmt& s, int indent = 0);
void dump_function(std::ostream& out, const Function& f, int indent = 0);
void dump_program(std::ostream& out, const Program& p);

}  // namespace shade
