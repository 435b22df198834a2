#pragma once

#include "ast.hpp"
#include "diagnostics.hpp"
#include <string>
#include <unordered_map>

namespace shade {

// Front-end validation run before folding and code generation. The symbol
// allocator trusts its input, so name uniqueness is enforced here.
struct SemaContext {
  Program* program = nullptr;
  Diagnostics errors;

  void add_error(SourceLoc loc, const std::string& name, const std::string& msg);
  bool check_param(const ParamDecl& p, std::unordered_map<std::string, SourceLoc>& seen);
  bool check_function(const Function& f);
  bool check_program(Program& p);
};

}  // namespace shade
