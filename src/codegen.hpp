#pragma once

#include "ast.hpp"
#include "builtins.hpp"
#include "bytecode.hpp"
#include "diagnostics.hpp"
#include "symbols.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace shade {

// Lowers a checked, folded Program to a BcProgram. Functions are generated
// in declaration order; each one's address is the stream length when its
// generation begins. Return types are worked out before any body is
// lowered, so a call's static type does not depend on declaration order.
// Calls to functions declared later are patched once every function has an
// address.
class CodeGen {
 public:
  CodeGen(const BuiltinRegistry& builtins, IdSequence& ids);

  bool run(const Program& program);

  const BcProgram& program() const { return out_; }
  BcProgram take_program() { return std::move(out_); }
  const Diagnostics& errors() const { return errors_; }

 private:
  struct FunctionState {
    FuncMeta* meta = nullptr;
    bool has_return = false;
  };

  struct CallFixup {
    size_t word_index = 0;
    std::string callee;
    TypeKind assumed = TypeKind::Invalid;  // static type the call was lowered with
    SourceLoc loc;
  };

  using TypeMap = std::unordered_map<std::string, TypeKind>;

  void infer_return_types();
  TypeKind infer_function(const Function& f);
  TypeKind infer_expr(const Expr& e, const TypeMap& locals);

  bool gen_function(const Function& f);
  bool gen_stmt(const Stmt& s, FunctionState& fs);
  bool gen_assign(const Stmt& s, FunctionState& fs);
  bool gen_return(const Stmt& s, FunctionState& fs);
  bool gen_expr(const Expr& e, FunctionState& fs, TypeKind* out_type);
  bool gen_binary(const Expr& e, FunctionState& fs, TypeKind* out_type);
  bool gen_unary(const Expr& e, FunctionState& fs, TypeKind* out_type);
  bool gen_call(const Expr& e, FunctionState& fs, TypeKind* out_type);
  bool gen_builtin_call(const Expr& e, FunctionState& fs, TypeKind* out_type);
  bool gen_ident(const Expr& e, FunctionState& fs, TypeKind* out_type);

  bool emit_arith(BuiltinOp op, TypeKind lhs, TypeKind rhs, SourceLoc loc,
                  TypeKind* out_type);
  bool emit(BcOp op, uint32_t imm, SourceLoc loc);
  void emit_const(float v);
  bool patch_calls();

  void add_error(ErrorKind kind, SourceLoc loc, const std::string& name,
                 const std::string& msg);

  const BuiltinRegistry& builtins_;
  IdSequence& ids_;
  const Program* ast_ = nullptr;
  BcProgram out_;
  std::vector<CallFixup> fixups_;
  TypeMap return_types_;  // Invalid while a function is being inferred or when unknowable
  Diagnostics errors_;
};

}  // namespace shade
