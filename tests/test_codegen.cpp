#include <gtest/gtest.h>
#include "codegen.hpp"
#include "compiler.hpp"
#include "fold.hpp"
#include "parser.hpp"
#include "sema.hpp"
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <vector>

using shade::BcOp;
using shade::BcWord;

namespace {

struct Generated {
  std::unique_ptr<shade::Program> ast;
  shade::IdSequence ids;
  shade::BuiltinRegistry builtins = shade::BuiltinRegistry::with_defaults();
  std::unique_ptr<shade::CodeGen> cg;
  bool ok = false;
};

// Parse, check, fold and generate; the CodeGen is kept so tests can inspect
// its state after a failure.
std::unique_ptr<Generated> generate(const std::string& source) {
  auto g = std::make_unique<Generated>();
  shade::Parser p(source, "<test>");
  g->ast = p.parse_program();
  EXPECT_FALSE(p.has_errors()) << (p.errors().empty() ? "" : p.errors()[0].str());
  shade::SemaContext sema;
  EXPECT_TRUE(sema.check_program(*g->ast));
  shade::ConstantFolder folder;
  EXPECT_TRUE(folder.fold_program(*g->ast));
  g->cg = std::make_unique<shade::CodeGen>(g->builtins, g->ids);
  g->ok = g->cg->run(*g->ast);
  return g;
}

std::vector<BcWord> words(std::initializer_list<BcWord> list) {
  return std::vector<BcWord>(list);
}

BcWord op(BcOp o) { return BcWord::plain(o); }
BcWord op(BcOp o, uint16_t imm) { return BcWord::with_imm(o, imm); }
BcWord f32(float v) { return BcWord::from_float(v); }

}  // namespace

TEST(CodeGen, GlobalLayoutAndStackSize) {
  auto g = generate("in a: f32; in n: vec3; out o: f32;");
  ASSERT_TRUE(g->ok);
  const shade::BcProgram& p = g->cg->program();
  ASSERT_TRUE(p.global_symbols.find("a"));
  EXPECT_EQ(p.global_symbols.find("a")->offset, 0u);
  EXPECT_EQ(p.global_symbols.find("n")->offset, 4u);
  EXPECT_EQ(p.global_symbols.find("o")->offset, 8u);
  EXPECT_TRUE(p.global_symbols.find("o")->is_static);
  EXPECT_EQ(p.static_section_size, 12u);
  EXPECT_EQ(p.min_stack_size, 12u + 1024u);
  EXPECT_TRUE(p.code.empty());
}

TEST(CodeGen, OutParametersFollowInParameters) {
  auto g = generate("out o: f32; in a: f32;");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().global_symbols.find("a")->offset, 0u);
  EXPECT_EQ(g->cg->program().global_symbols.find("o")->offset, 4u);
}

TEST(CodeGen, LocalsGetSequentialOffsets) {
  auto g = generate("fn f() { x = 1.0; y = 2.0; x = 3.0; return y; }");
  ASSERT_TRUE(g->ok);
  const shade::FuncMeta* f = g->cg->program().find_function("f");
  ASSERT_TRUE(f);
  EXPECT_EQ(f->symbols.find("x")->offset, 0u);
  EXPECT_EQ(f->symbols.find("y")->offset, 4u);
  EXPECT_FALSE(f->symbols.find("y")->is_static);
  EXPECT_EQ(f->frame_size, 8u);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::ConstF32), f32(1.0f), op(BcOp::StoreLocal, 0),
                   op(BcOp::ConstF32), f32(2.0f), op(BcOp::StoreLocal, 4),
                   op(BcOp::ConstF32), f32(3.0f), op(BcOp::StoreLocal, 0),
                   op(BcOp::LoadLocal, 4), op(BcOp::Ret, 8)}));
}

TEST(CodeGen, DecimalLiteralEncoding) {
  auto g = generate("fn f() { return 3.5; }");
  ASSERT_TRUE(g->ok);
  const auto& code = g->cg->program().code;
  ASSERT_EQ(code.size(), 3u);
  EXPECT_EQ(code[0], op(BcOp::ConstF32));
  EXPECT_EQ(code[1].bits(), 0x40600000u);
  EXPECT_EQ(code[1].as_float(), 3.5f);
  EXPECT_EQ(code[2], op(BcOp::Ret, 0));
  EXPECT_EQ(g->cg->program().find_function("f")->return_type, shade::TypeKind::F32);
}

TEST(CodeGen, ImplicitReturn) {
  auto g = generate("fn f() { x = 1.0; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::ConstF32), f32(1.0f), op(BcOp::StoreLocal, 0), op(BcOp::Void),
                   op(BcOp::Ret, 4)}));
  const shade::FuncMeta* f = g->cg->program().find_function("f");
  EXPECT_EQ(f->frame_size, 4u);
  EXPECT_EQ(f->return_type, shade::TypeKind::Void);
}

TEST(CodeGen, BareReturnPushesVoid) {
  auto g = generate("fn f() { return; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code, words({op(BcOp::Void), op(BcOp::Ret, 0)}));
}

TEST(CodeGen, OperandOrder) {
  auto g = generate("in a: f32; in b: f32; fn f() { return a - b; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::LoadGlobal, 0), op(BcOp::LoadGlobal, 4), op(BcOp::SubF32),
                   op(BcOp::Ret, 0)}));
}

TEST(CodeGen, AssignToOutParameter) {
  auto g = generate("in a: f32; out o: f32; fn f() { o = a / 2.0; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::LoadGlobal, 0), op(BcOp::ConstF32), f32(2.0f), op(BcOp::DivF32),
                   op(BcOp::StoreGlobal, 4), op(BcOp::Void), op(BcOp::Ret, 0)}));
  EXPECT_EQ(g->cg->program().find_function("f")->frame_size, 0u);
}

TEST(CodeGen, AssignToGlobalDoesNotCreateLocal) {
  auto g = generate("out o: f32; fn f() { o = 1.0; return o; }");
  ASSERT_TRUE(g->ok);
  EXPECT_TRUE(g->cg->program().find_function("f")->symbols.empty());
}

TEST(CodeGen, UnresolvedSymbolRollsBackStatement) {
  auto g = generate("fn main() { x = 1.0; y = missing * 2.0; }");
  EXPECT_FALSE(g->ok);
  ASSERT_EQ(g->cg->errors().size(), 1u);
  EXPECT_EQ(g->cg->errors()[0].kind, shade::ErrorKind::UnresolvedSymbol);
  EXPECT_EQ(g->cg->errors()[0].name, "missing");
  EXPECT_EQ(g->cg->errors()[0].message, "unknown symbol 'missing'");
  EXPECT_EQ(g->cg->program().code.size(), 3u);
}

TEST(CodeGen, FunctionAddressesAndIds) {
  auto g = generate("fn a() { return 1.0; } fn b() { return; }");
  ASSERT_TRUE(g->ok);
  const shade::FuncMeta* a = g->cg->program().find_function("a");
  const shade::FuncMeta* b = g->cg->program().find_function("b");
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->address, 0u);
  EXPECT_EQ(b->address, 3u);
  EXPECT_EQ(a->id, 0u);
  EXPECT_EQ(b->id, 1u);
  EXPECT_EQ(g->ids.next(), 2u);
}

TEST(CodeGen, BackwardCall) {
  auto g = generate("fn a() { return 2.0; } fn b() { return a() * 2.0; }");
  ASSERT_TRUE(g->ok);
  const auto& code = g->cg->program().code;
  ASSERT_GE(code.size(), 4u);
  EXPECT_EQ(code[3], op(BcOp::Call, 0));
}

TEST(CodeGen, ForwardCallIsPatched) {
  auto g = generate("fn a() { return b(); } fn b() { return 2.0; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::Call, 2), op(BcOp::Ret, 0), op(BcOp::ConstF32), f32(2.0f),
                   op(BcOp::Ret, 0)}));
}

TEST(CodeGen, ForwardCallToVoidFunction) {
  auto later = generate("fn f() { x = v(); } fn v() { return; }");
  EXPECT_FALSE(later->ok);
  EXPECT_TRUE(shade::has_error_kind(later->cg->errors(), shade::ErrorKind::UnsupportedExpression));

  auto earlier = generate("fn v() { return; } fn f() { x = v(); }");
  EXPECT_FALSE(earlier->ok);
  EXPECT_TRUE(shade::has_error_kind(earlier->cg->errors(), shade::ErrorKind::UnsupportedExpression));
}

TEST(CodeGen, ForwardCallReturningVector) {
  auto g = generate(
      "fn f() { v = g(); return dot(v, v); }\n"
      "fn g() { return Vec3(1.0, 2.0, 3.0); }");
  ASSERT_TRUE(g->ok) << (g->cg->errors().empty() ? "" : g->cg->errors()[0].str());
  const shade::FuncMeta* f = g->cg->program().find_function("f");
  const shade::FuncMeta* callee = g->cg->program().find_function("g");
  ASSERT_TRUE(f && callee);
  EXPECT_EQ(f->symbols.find("v")->type, shade::TypeKind::Vec3);
  EXPECT_EQ(f->return_type, shade::TypeKind::F32);
  EXPECT_EQ(g->cg->program().code[0], op(BcOp::Call, static_cast<uint16_t>(callee->address)));
}

TEST(CodeGen, ForwardCallInferredThroughLocals) {
  auto g = generate(
      "in n: vec3;\n"
      "fn f() { return h() + n; }\n"
      "fn h() { s = 2.0; w = n * s; return w; }");
  ASSERT_TRUE(g->ok) << (g->cg->errors().empty() ? "" : g->cg->errors()[0].str());
  EXPECT_EQ(g->cg->program().find_function("f")->return_type, shade::TypeKind::Vec3);
}

TEST(CodeGen, CallCycleTypeMismatch) {
  // Inside the cycle the call to b is lowered as f32, but b returns a vec3.
  auto g = generate(
      "fn a() { return b(); }\n"
      "fn b() { x = a(); return Vec3(x, x, x); }");
  EXPECT_FALSE(g->ok);
  ASSERT_EQ(g->cg->errors().size(), 1u);
  EXPECT_EQ(g->cg->errors()[0].kind, shade::ErrorKind::UnsupportedExpression);
  EXPECT_EQ(g->cg->errors()[0].name, "b");
}

TEST(CodeGen, MutualRecursion) {
  auto g = generate("fn a() { return b(); } fn b() { return a() * 2.0; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code[0],
            op(BcOp::Call, static_cast<uint16_t>(g->cg->program().find_function("b")->address)));
}

TEST(CodeGen, RecursiveCall) {
  auto g = generate("fn loop() { return loop(); }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code[0], op(BcOp::Call, 0));
}

TEST(CodeGen, BuiltinCalls) {
  auto g = generate("fn f() { v = Vec3(1.0, 2.0, 3.0); return dot(v, v); }");
  ASSERT_TRUE(g->ok);
  const shade::BuiltinRegistry& r = g->builtins;
  auto vec3 = r.find("Vec3", {shade::TypeKind::F32, shade::TypeKind::F32, shade::TypeKind::F32});
  auto dot = r.find("dot", {shade::TypeKind::Vec3, shade::TypeKind::Vec3});
  ASSERT_TRUE(vec3 && dot);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::ConstF32), f32(1.0f), op(BcOp::ConstF32), f32(2.0f),
                   op(BcOp::ConstF32), f32(3.0f), op(BcOp::CallNative, *vec3),
                   op(BcOp::StoreLocal, 0), op(BcOp::LoadLocal, 0), op(BcOp::LoadLocal, 0),
                   op(BcOp::CallNative, *dot), op(BcOp::Ret, 4)}));
  const shade::FuncMeta* f = g->cg->program().find_function("f");
  EXPECT_EQ(f->symbols.find("v")->type, shade::TypeKind::Vec3);
  EXPECT_EQ(f->return_type, shade::TypeKind::F32);
}

TEST(CodeGen, VectorOperatorsUseNatives) {
  auto g = generate("in n: vec3; in s: f32; fn f() { return n * s + n; }");
  ASSERT_TRUE(g->ok);
  const shade::BuiltinRegistry& r = g->builtins;
  auto mul = r.find_operator(shade::BuiltinOp::Mul, {shade::TypeKind::Vec3, shade::TypeKind::F32});
  auto add = r.find_operator(shade::BuiltinOp::Add, {shade::TypeKind::Vec3, shade::TypeKind::Vec3});
  ASSERT_TRUE(mul && add);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::LoadGlobal, 0), op(BcOp::LoadGlobal, 4), op(BcOp::CallNative, *mul),
                   op(BcOp::LoadGlobal, 0), op(BcOp::CallNative, *add), op(BcOp::Ret, 0)}));
  EXPECT_EQ(g->cg->program().find_function("f")->return_type, shade::TypeKind::Vec3);
}

TEST(CodeGen, UnaryMinusMultipliesByMinusOne) {
  auto g = generate("in a: f32; fn f() { return -a; }");
  ASSERT_TRUE(g->ok);
  EXPECT_EQ(g->cg->program().code,
            words({op(BcOp::LoadGlobal, 0), op(BcOp::ConstF32), f32(-1.0f), op(BcOp::MulF32),
                   op(BcOp::Ret, 0)}));
}

TEST(CodeGen, UnaryMinusOnVector) {
  auto g = generate("in n: vec3; fn f() { return -n; }");
  ASSERT_TRUE(g->ok);
  auto mul = g->builtins.find_operator(shade::BuiltinOp::Mul,
                                       {shade::TypeKind::Vec3, shade::TypeKind::F32});
  ASSERT_TRUE(mul);
  EXPECT_EQ(g->cg->program().code[3], op(BcOp::CallNative, *mul));
}

TEST(CodeGen, UnsupportedUnaryNot) {
  auto g = generate("in a: f32; fn f() { return !a; }");
  EXPECT_FALSE(g->ok);
  EXPECT_TRUE(shade::has_error_kind(g->cg->errors(), shade::ErrorKind::UnsupportedExpression));
}

TEST(CodeGen, IntegerLiteralIsUnsupported) {
  auto g = generate("fn f() { return 2; }");
  EXPECT_FALSE(g->ok);
  ASSERT_FALSE(g->cg->errors().empty());
  EXPECT_EQ(g->cg->errors()[0].kind, shade::ErrorKind::UnsupportedExpression);
}

TEST(CodeGen, UserFunctionWithArguments) {
  auto g = generate("fn g() { return 1.0; } fn f() { return g(1.0); }");
  EXPECT_FALSE(g->ok);
  ASSERT_FALSE(g->cg->errors().empty());
  EXPECT_EQ(g->cg->errors()[0].kind, shade::ErrorKind::UnsupportedExpression);
  EXPECT_EQ(g->cg->errors()[0].name, "g");
}

TEST(CodeGen, UnknownFunction) {
  auto g = generate("fn f() { return cross(1.0); }");
  EXPECT_FALSE(g->ok);
  ASSERT_EQ(g->cg->errors().size(), 1u);
  EXPECT_EQ(g->cg->errors()[0].kind, shade::ErrorKind::UnresolvedFunction);
  EXPECT_EQ(g->cg->errors()[0].name, "cross");
}

TEST(CodeGen, NoMatchingOverload) {
  auto g = generate("fn f() { return dot(1.0, 2.0); }");
  EXPECT_FALSE(g->ok);
  ASSERT_EQ(g->cg->errors().size(), 1u);
  EXPECT_EQ(g->cg->errors()[0].kind, shade::ErrorKind::UnresolvedFunction);
  EXPECT_NE(g->cg->errors()[0].message.find("(f32, f32)"), std::string::npos);
}

TEST(CodeGen, NoVectorOperator) {
  auto g = generate("in n: vec3; fn f() { return n - n; }");
  EXPECT_FALSE(g->ok);
  EXPECT_TRUE(shade::has_error_kind(g->cg->errors(), shade::ErrorKind::UnsupportedExpression));
}

TEST(CodeGen, AssignmentTypeMismatch) {
  auto g = generate("out n: vec3; fn f() { n = 1.0; }");
  EXPECT_FALSE(g->ok);
  ASSERT_EQ(g->cg->errors().size(), 1u);
  EXPECT_EQ(g->cg->errors()[0].name, "n");
}

TEST(CodeGen, VoidValueCannotBeStored) {
  auto g = generate("fn v() { return; } fn f() { x = v(); }");
  EXPECT_FALSE(g->ok);
  EXPECT_TRUE(shade::has_error_kind(g->cg->errors(), shade::ErrorKind::UnsupportedExpression));
}

TEST(CodeGen, StaticSectionTooLarge) {
  shade::Program program;
  for (int i = 0; i < 16385; ++i) {
    shade::ParamDecl p;
    p.name = "p" + std::to_string(i);
    p.type = shade::TypeKind::F32;
    program.in_params.push_back(p);
  }
  auto builtins = shade::BuiltinRegistry::with_defaults();
  shade::IdSequence ids;
  shade::CodeGen cg(builtins, ids);
  EXPECT_FALSE(cg.run(program));
  EXPECT_TRUE(shade::has_error_kind(cg.errors(), shade::ErrorKind::LimitExceeded));
}

TEST(Compiler, CompileSource) {
  shade::Compiler compiler;
  auto bc = compiler.compile_source("in a: f32; out b: f32; fn main() { b = a * 2.0; }",
                                    "<test>");
  ASSERT_TRUE(bc);
  EXPECT_FALSE(compiler.has_errors());
  EXPECT_TRUE(bc->find_function("main"));
  EXPECT_EQ(bc->static_section_size, 8u);
}

TEST(Compiler, FoldingRunsBeforeCodegen) {
  shade::Compiler compiler;
  auto bc = compiler.compile_source("fn f() { return 0.5 + 0.5; }", "<test>");
  ASSERT_TRUE(bc);
  ASSERT_EQ(bc->code.size(), 3u);
  EXPECT_EQ(bc->code[1].as_float(), 1.0f);
}

TEST(Compiler, NoFoldKeepsArithmetic) {
  shade::CompileOptions opts;
  opts.fold_constants = false;
  shade::Compiler compiler(opts);
  auto bc = compiler.compile_source("fn f() { return 4.0 / 0.0; }", "<test>");
  ASSERT_TRUE(bc);
  EXPECT_EQ(bc->code[4], op(BcOp::DivF32));
}

TEST(Compiler, FoldingErrorAbortsCompilation) {
  shade::Compiler compiler;
  auto bc = compiler.compile_source("out r: f32; fn main() { r = 4.0 / (1.0 - 1.0); }",
                                    "div.shade");
  EXPECT_FALSE(bc);
  EXPECT_TRUE(shade::has_error_kind(compiler.diagnostics(), shade::ErrorKind::Folding));
}

TEST(Compiler, DiagnosticsCarryPath) {
  shade::Compiler compiler;
  EXPECT_FALSE(compiler.compile_source("fn main() {\n  return nope;\n}", "x.shade"));
  std::string out;
  llvm::raw_string_ostream os(out);
  compiler.print_diagnostics(os);
  os.flush();
  EXPECT_EQ(out, "x.shade:2:10: unresolved symbol: unknown symbol 'nope'\n");
}

TEST(Compiler, VerboseLog) {
  std::string log;
  llvm::raw_string_ostream os(log);
  shade::CompileOptions opts;
  opts.log = &os;
  shade::Compiler compiler(opts);
  ASSERT_TRUE(compiler.compile_source("fn f() { return 1.0; }", "<test>"));
  os.flush();
  EXPECT_NE(log.find("shadec: parsed 0 in, 0 out, 1 function(s)"), std::string::npos);
  EXPECT_NE(log.find("shadec: generated 3 word(s)"), std::string::npos);
}

TEST(Compiler, SessionResetsBetweenCompiles) {
  shade::Compiler compiler;
  EXPECT_FALSE(compiler.compile_source("fn f() { return nope; }", "<test>"));
  EXPECT_TRUE(compiler.has_errors());

  auto bc = compiler.compile_source("fn f() { return 1.0; } fn g() { return; }", "<test>");
  ASSERT_TRUE(bc);
  EXPECT_FALSE(compiler.has_errors());
  EXPECT_EQ(bc->find_function("f")->id, 0u);
  EXPECT_EQ(bc->find_function("g")->id, 1u);

  bc = compiler.compile_source("fn h() { return; }", "<test>");
  ASSERT_TRUE(bc);
  EXPECT_EQ(bc->find_function("h")->id, 0u);
}

TEST(Compiler, CustomRegistry) {
  shade::BuiltinRegistry registry;
  shade::NativeEntry half;
  half.name = "half";
  half.params = {shade::TypeKind::F32};
  half.result = shade::TypeKind::F32;
  ASSERT_TRUE(registry.add(half));
  shade::Compiler compiler({}, &registry);
  auto bc = compiler.compile_source("fn f() { return half(1.0); }", "<test>");
  ASSERT_TRUE(bc);
  EXPECT_EQ(bc->code[2], op(BcOp::CallNative, 0));
  EXPECT_FALSE(compiler.compile_source("fn g() { return dot(1.0); }", "<test>"));
}
