#include "codegen.hpp"
#include <limits>

namespace shade {

namespace {

constexpr uint32_t kMaxImm = std::numeric_limits<uint16_t>::max();

BuiltinOp binary_builtin_op(TokenKind op) {
  switch (op) {
    case TokenKind::Plus: return BuiltinOp::Add;
    case TokenKind::Minus: return BuiltinOp::Sub;
    case TokenKind::Star: return BuiltinOp::Mul;
    case TokenKind::Slash: return BuiltinOp::Div;
    default: return BuiltinOp::None;
  }
}

BcOp float_opcode(BuiltinOp op) {
  switch (op) {
    case BuiltinOp::Add: return BcOp::AddF32;
    case BuiltinOp::Sub: return BcOp::SubF32;
    case BuiltinOp::Mul: return BcOp::MulF32;
    default: return BcOp::DivF32;
  }
}

bool is_value_type(TypeKind t) {
  return t == TypeKind::F32 || t == TypeKind::Vec3;
}

}  // namespace

CodeGen::CodeGen(const BuiltinRegistry& builtins, IdSequence& ids)
    : builtins_(builtins), ids_(ids) {}

void CodeGen::add_error(ErrorKind kind, SourceLoc loc, const std::string& name,
                        const std::string& msg) {
  Diagnostic d;
  d.kind = kind;
  d.loc = loc;
  d.name = name;
  d.message = msg;
  errors_.push_back(std::move(d));
}

bool CodeGen::emit(BcOp op, uint32_t imm, SourceLoc loc) {
  if (imm > kMaxImm) {
    add_error(ErrorKind::LimitExceeded, loc, "",
              std::string("operand ") + std::to_string(imm) + " of " + bc_op_name(op) +
                  " does not fit in 16 bits");
    return false;
  }
  out_.code.push_back(BcWord::with_imm(op, static_cast<uint16_t>(imm)));
  return true;
}

void CodeGen::emit_const(float v) {
  out_.code.push_back(BcWord::plain(BcOp::ConstF32));
  out_.code.push_back(BcWord::from_float(v));
}

bool CodeGen::run(const Program& program) {
  ast_ = &program;
  out_ = BcProgram{};
  fixups_.clear();
  errors_.clear();

  allocate_globals(program, out_.global_symbols);
  out_.static_section_size = out_.global_symbols.size_bytes();
  out_.min_stack_size = out_.static_section_size + kStackWorkingMargin;
  if (out_.static_section_size > kMaxImm + 1) {
    add_error(ErrorKind::LimitExceeded, {}, "",
              "static section of " + std::to_string(out_.static_section_size) +
                  " bytes is not addressable with 16-bit offsets");
    return false;
  }

  infer_return_types();
  for (const auto& f : program.functions) {
    if (f && !gen_function(*f)) return false;
  }
  return patch_calls();
}

void CodeGen::infer_return_types() {
  return_types_.clear();
  for (const auto& f : ast_->functions) {
    if (f && return_types_.find(f->name) == return_types_.end()) infer_function(*f);
  }
}

// Mirrors the typing rules of the gen_* functions without emitting code.
// A call cycle leaves the functions on it Invalid.
TypeKind CodeGen::infer_function(const Function& f) {
  auto it = return_types_.find(f.name);
  if (it != return_types_.end()) return it->second;
  return_types_[f.name] = TypeKind::Invalid;

  TypeMap locals;
  TypeKind result = TypeKind::Void;
  for (const auto& s : f.body) {
    if (!s) continue;
    if (s->kind == Stmt::Kind::Return) {
      result = s->value ? infer_expr(*s->value, locals) : TypeKind::Void;
      break;
    }
    if (s->kind == Stmt::Kind::Assign && s->value && !out_.global_symbols.find(s->target) &&
        locals.find(s->target) == locals.end()) {
      locals[s->target] = infer_expr(*s->value, locals);
    }
  }
  return_types_[f.name] = result;
  return result;
}

TypeKind CodeGen::infer_expr(const Expr& e, const TypeMap& locals) {
  switch (e.kind) {
    case Expr::Kind::DecimalLiteral:
      return TypeKind::F32;
    case Expr::Kind::Ident: {
      auto local = locals.find(e.ident);
      if (local != locals.end()) return local->second;
      const SymbolMeta* global = out_.global_symbols.find(e.ident);
      return global ? global->type : TypeKind::Invalid;
    }
    case Expr::Kind::Binary:
    case Expr::Kind::Unary: {
      BuiltinOp op = BuiltinOp::Mul;
      TypeKind lhs = TypeKind::Invalid;
      TypeKind rhs = TypeKind::F32;
      if (e.kind == Expr::Kind::Binary) {
        if (!e.lhs || !e.rhs) return TypeKind::Invalid;
        op = binary_builtin_op(e.op);
        lhs = infer_expr(*e.lhs, locals);
        rhs = infer_expr(*e.rhs, locals);
      } else {
        if (e.op != TokenKind::Minus || !e.operand) return TypeKind::Invalid;
        lhs = infer_expr(*e.operand, locals);
      }
      if (lhs == TypeKind::F32 && rhs == TypeKind::F32) return TypeKind::F32;
      auto handle = builtins_.find_operator(op, {lhs, rhs});
      return handle ? builtins_.at(*handle).result : TypeKind::Invalid;
    }
    case Expr::Kind::Call: {
      if (const Function* callee = ast_->find_function(e.ident))
        return e.args.empty() ? infer_function(*callee) : TypeKind::Invalid;
      std::vector<TypeKind> arg_types;
      for (const auto& a : e.args) arg_types.push_back(a ? infer_expr(*a, locals) : TypeKind::Invalid);
      auto handle = builtins_.find(e.ident, arg_types);
      return handle ? builtins_.at(*handle).result : TypeKind::Invalid;
    }
    case Expr::Kind::IntLiteral:
    case Expr::Kind::Invalid:
      break;
  }
  return TypeKind::Invalid;
}

bool CodeGen::gen_function(const Function& f) {
  if (out_.code.size() > kMaxImm) {
    add_error(ErrorKind::LimitExceeded, f.loc, f.name,
              "function '" + f.name + "' starts beyond the addressable code range");
    return false;
  }
  FuncMeta meta;
  meta.id = ids_.next();
  meta.address = static_cast<uint32_t>(out_.code.size());
  auto inserted = out_.functions.emplace(f.name, std::move(meta));
  if (!inserted.second) {
    add_error(ErrorKind::Semantic, f.loc, f.name, "duplicate function '" + f.name + "'");
    return false;
  }

  FunctionState fs;
  fs.meta = &inserted.first->second;

  for (const auto& s : f.body) {
    if (!s) continue;
    size_t mark = out_.code.size();
    size_t fixup_mark = fixups_.size();
    if (!gen_stmt(*s, fs)) {
      out_.code.resize(mark);
      fixups_.resize(fixup_mark);
      return false;
    }
  }

  if (!fs.has_return) {
    out_.code.push_back(BcWord::plain(BcOp::Void));
    if (!emit(BcOp::Ret, fs.meta->symbols.size_bytes(), f.loc)) return false;
  }
  fs.meta->frame_size = fs.meta->symbols.size_bytes();
  if (fs.meta->return_type == TypeKind::Invalid) fs.meta->return_type = TypeKind::Void;
  return true;
}

bool CodeGen::gen_stmt(const Stmt& s, FunctionState& fs) {
  switch (s.kind) {
    case Stmt::Kind::Assign:
      return gen_assign(s, fs);
    case Stmt::Kind::Return:
      return gen_return(s, fs);
    case Stmt::Kind::Invalid:
      break;
  }
  add_error(ErrorKind::UnsupportedExpression, s.loc, "", "invalid statement");
  return false;
}

bool CodeGen::gen_assign(const Stmt& s, FunctionState& fs) {
  if (!s.value) {
    add_error(ErrorKind::UnsupportedExpression, s.loc, s.target,
              "assignment to '" + s.target + "' has no value");
    return false;
  }
  TypeKind t = TypeKind::Invalid;
  if (!gen_expr(*s.value, fs, &t)) return false;
  if (!is_value_type(t)) {
    add_error(ErrorKind::UnsupportedExpression, s.loc, s.target,
              std::string("cannot assign a ") + type_kind_name(t) + " value to '" +
                  s.target + "'");
    return false;
  }

  const SymbolMeta* global = out_.global_symbols.find(s.target);
  const SymbolMeta* local = global ? nullptr : fs.meta->symbols.find(s.target);
  const SymbolMeta* existing = global ? global : local;
  if (existing && existing->type != t) {
    add_error(ErrorKind::UnsupportedExpression, s.loc, s.target,
              std::string("cannot assign a ") + type_kind_name(t) + " value to '" +
                  s.target + "' of type " + type_kind_name(existing->type));
    return false;
  }
  if (global) return emit(BcOp::StoreGlobal, global->offset, s.loc);
  if (!local) local = &fs.meta->symbols.add(s.target, t);
  return emit(BcOp::StoreLocal, local->offset, s.loc);
}

bool CodeGen::gen_return(const Stmt& s, FunctionState& fs) {
  TypeKind t = TypeKind::Void;
  if (s.value) {
    if (!gen_expr(*s.value, fs, &t)) return false;
  } else {
    out_.code.push_back(BcWord::plain(BcOp::Void));
  }
  if (fs.meta->return_type == TypeKind::Invalid) fs.meta->return_type = t;
  fs.has_return = true;
  return emit(BcOp::Ret, fs.meta->symbols.size_bytes(), s.loc);
}

bool CodeGen::gen_expr(const Expr& e, FunctionState& fs, TypeKind* out_type) {
  switch (e.kind) {
    case Expr::Kind::Binary:
      return gen_binary(e, fs, out_type);
    case Expr::Kind::Unary:
      return gen_unary(e, fs, out_type);
    case Expr::Kind::Call:
      return gen_call(e, fs, out_type);
    case Expr::Kind::DecimalLiteral:
      emit_const(e.decimal_val);
      *out_type = TypeKind::F32;
      return true;
    case Expr::Kind::IntLiteral:
      add_error(ErrorKind::UnsupportedExpression, e.loc, "",
                "integer literal " + std::to_string(e.int_val) +
                    " is not supported; write it as a decimal (" +
                    std::to_string(e.int_val) + ".0)");
      return false;
    case Expr::Kind::Ident:
      return gen_ident(e, fs, out_type);
    case Expr::Kind::Invalid:
      break;
  }
  add_error(ErrorKind::UnsupportedExpression, e.loc, "", "invalid expression");
  return false;
}

bool CodeGen::gen_binary(const Expr& e, FunctionState& fs, TypeKind* out_type) {
  BuiltinOp op = binary_builtin_op(e.op);
  if (op == BuiltinOp::None || !e.lhs || !e.rhs) {
    add_error(ErrorKind::UnsupportedExpression, e.loc, "",
              std::string("binary operator ") + token_kind_name(e.op) + " is not supported");
    return false;
  }
  TypeKind lhs = TypeKind::Invalid;
  TypeKind rhs = TypeKind::Invalid;
  if (!gen_expr(*e.lhs, fs, &lhs)) return false;
  if (!gen_expr(*e.rhs, fs, &rhs)) return false;
  return emit_arith(op, lhs, rhs, e.loc, out_type);
}

// Negation is multiplication by -1, so vectors negate through the same
// operator resolution as any other product.
bool CodeGen::gen_unary(const Expr& e, FunctionState& fs, TypeKind* out_type) {
  if (e.op != TokenKind::Minus || !e.operand) {
    add_error(ErrorKind::UnsupportedExpression, e.loc, "",
              std::string("unary operator ") + token_kind_name(e.op) + " is not supported");
    return false;
  }
  TypeKind t = TypeKind::Invalid;
  if (!gen_expr(*e.operand, fs, &t)) return false;
  emit_const(-1.0f);
  return emit_arith(BuiltinOp::Mul, t, TypeKind::F32, e.loc, out_type);
}

bool CodeGen::emit_arith(BuiltinOp op, TypeKind lhs, TypeKind rhs, SourceLoc loc,
                         TypeKind* out_type) {
  if (lhs == TypeKind::F32 && rhs == TypeKind::F32) {
    out_.code.push_back(BcWord::plain(float_opcode(op)));
    *out_type = TypeKind::F32;
    return true;
  }
  auto handle = builtins_.find_operator(op, {lhs, rhs});
  if (!handle) {
    add_error(ErrorKind::UnsupportedExpression, loc, "",
              std::string("no operator ") + builtin_op_symbol(op) + " for " +
                  format_signature({lhs, rhs}));
    return false;
  }
  *out_type = builtins_.at(*handle).result;
  return emit(BcOp::CallNative, *handle, loc);
}

bool CodeGen::gen_call(const Expr& e, FunctionState& fs, TypeKind* out_type) {
  const Function* callee = ast_->find_function(e.ident);
  if (!callee) return gen_builtin_call(e, fs, out_type);

  // User functions take no parameters; arguments have nowhere to go.
  if (!e.args.empty()) {
    add_error(ErrorKind::UnsupportedExpression, e.loc, e.ident,
              "function '" + e.ident + "' takes no arguments but " +
                  std::to_string(e.args.size()) + " were given");
    return false;
  }

  const FuncMeta* meta = out_.find_function(e.ident);
  if (meta && meta->return_type != TypeKind::Invalid) {
    *out_type = meta->return_type;
    return emit(BcOp::Call, meta->address, e.loc);
  }

  // Declared later, or the current function before its first return. The
  // address is patched and the type checked once every body is lowered;
  // f32 stands in only where inference found a call cycle.
  auto inferred = return_types_.find(e.ident);
  TypeKind t = inferred != return_types_.end() ? inferred->second : TypeKind::Invalid;
  if (t == TypeKind::Invalid) t = TypeKind::F32;
  CallFixup fixup;
  fixup.word_index = out_.code.size();
  fixup.callee = e.ident;
  fixup.assumed = t;
  fixup.loc = e.loc;
  fixups_.push_back(std::move(fixup));
  out_.code.push_back(BcWord::plain(BcOp::Call));
  *out_type = t;
  return true;
}

// Arguments are pushed left to right; the native pops its arity and pushes
// its result.
bool CodeGen::gen_builtin_call(const Expr& e, FunctionState& fs, TypeKind* out_type) {
  if (!builtins_.has_name(e.ident)) {
    add_error(ErrorKind::UnresolvedFunction, e.loc, e.ident,
              "unknown function '" + e.ident + "'");
    return false;
  }
  std::vector<TypeKind> arg_types;
  for (const auto& a : e.args) {
    TypeKind t = TypeKind::Invalid;
    if (!a || !gen_expr(*a, fs, &t)) return false;
    arg_types.push_back(t);
  }
  auto handle = builtins_.find(e.ident, arg_types);
  if (!handle) {
    add_error(ErrorKind::UnresolvedFunction, e.loc, e.ident,
              "no overload of '" + e.ident + "' takes " + format_signature(arg_types));
    return false;
  }
  *out_type = builtins_.at(*handle).result;
  return emit(BcOp::CallNative, *handle, e.loc);
}

bool CodeGen::gen_ident(const Expr& e, FunctionState& fs, TypeKind* out_type) {
  if (const SymbolMeta* local = fs.meta->symbols.find(e.ident)) {
    *out_type = local->type;
    return emit(BcOp::LoadLocal, local->offset, e.loc);
  }
  if (const SymbolMeta* global = out_.global_symbols.find(e.ident)) {
    *out_type = global->type;
    return emit(BcOp::LoadGlobal, global->offset, e.loc);
  }
  add_error(ErrorKind::UnresolvedSymbol, e.loc, e.ident, "unknown symbol '" + e.ident + "'");
  return false;
}

bool CodeGen::patch_calls() {
  for (const auto& fixup : fixups_) {
    const FuncMeta* meta = out_.find_function(fixup.callee);
    if (!meta) {
      add_error(ErrorKind::UnresolvedFunction, fixup.loc, fixup.callee,
                "function '" + fixup.callee + "' was never generated");
      return false;
    }
    if (meta->return_type != fixup.assumed) {
      add_error(ErrorKind::UnsupportedExpression, fixup.loc, fixup.callee,
                std::string("call to '") + fixup.callee + "' was lowered as " +
                    type_kind_name(fixup.assumed) + " but the function returns " +
                    type_kind_name(meta->return_type));
      return false;
    }
    if (meta->address > kMaxImm) {
      add_error(ErrorKind::LimitExceeded, fixup.loc, fixup.callee,
                "address of '" + fixup.callee + "' does not fit in 16 bits");
      return false;
    }
    out_.code[fixup.word_index] =
        BcWord::with_imm(BcOp::Call, static_cast<uint16_t>(meta->address));
  }
  fixups_.clear();
  return true;
}

}  // namespace shade
