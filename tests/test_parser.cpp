#include <gtest/gtest.h>
#include "parser.hpp"
#include "ast.hpp"
#include <string>

namespace {

std::unique_ptr<shade::Program> parse_ok(const std::string& source) {
  shade::Parser p(source, "<test>");
  std::unique_ptr<shade::Program> program = p.parse_program();
  EXPECT_FALSE(p.has_errors()) << "Parse errors: "
                               << (p.errors().empty() ? "" : p.errors()[0].str());
  return program;
}

}  // namespace

TEST(Parser, EmptyFile) {
  auto p = parse_ok("");
  ASSERT_TRUE(p);
  EXPECT_TRUE(p->in_params.empty());
  EXPECT_TRUE(p->out_params.empty());
  EXPECT_TRUE(p->functions.empty());
}

TEST(Parser, Parameters) {
  auto p = parse_ok("in a: f32; out b: vec3; in c: vec3;");
  ASSERT_TRUE(p);
  ASSERT_EQ(p->in_params.size(), 2u);
  ASSERT_EQ(p->out_params.size(), 1u);
  EXPECT_EQ(p->in_params[0].name, "a");
  EXPECT_EQ(p->in_params[0].type, shade::TypeKind::F32);
  EXPECT_EQ(p->in_params[1].name, "c");
  EXPECT_EQ(p->in_params[1].type, shade::TypeKind::Vec3);
  EXPECT_EQ(p->out_params[0].name, "b");
}

TEST(Parser, FunctionWithStatements) {
  auto p = parse_ok("fn main() { x = 1.0; return x; }");
  ASSERT_TRUE(p);
  ASSERT_EQ(p->functions.size(), 1u);
  const shade::Function& f = *p->functions[0];
  EXPECT_EQ(f.name, "main");
  ASSERT_EQ(f.body.size(), 2u);
  EXPECT_EQ(f.body[0]->kind, shade::Stmt::Kind::Assign);
  EXPECT_EQ(f.body[0]->target, "x");
  ASSERT_TRUE(f.body[0]->value);
  EXPECT_EQ(f.body[0]->value->kind, shade::Expr::Kind::DecimalLiteral);
  EXPECT_FLOAT_EQ(f.body[0]->value->decimal_val, 1.0f);
  EXPECT_EQ(f.body[1]->kind, shade::Stmt::Kind::Return);
  ASSERT_TRUE(f.body[1]->value);
  EXPECT_EQ(f.body[1]->value->kind, shade::Expr::Kind::Ident);
}

TEST(Parser, BareReturn) {
  auto p = parse_ok("fn f() { return; }");
  ASSERT_TRUE(p);
  ASSERT_EQ(p->functions[0]->body.size(), 1u);
  EXPECT_EQ(p->functions[0]->body[0]->kind, shade::Stmt::Kind::Return);
  EXPECT_FALSE(p->functions[0]->body[0]->value);
}

TEST(Parser, Precedence) {
  auto p = parse_ok("fn f() { return a + b * c; }");
  ASSERT_TRUE(p);
  const shade::Expr& e = *p->functions[0]->body[0]->value;
  ASSERT_EQ(e.kind, shade::Expr::Kind::Binary);
  EXPECT_EQ(e.op, shade::TokenKind::Plus);
  ASSERT_TRUE(e.rhs);
  EXPECT_EQ(e.rhs->kind, shade::Expr::Kind::Binary);
  EXPECT_EQ(e.rhs->op, shade::TokenKind::Star);
}

TEST(Parser, LeftAssociative) {
  auto p = parse_ok("fn f() { return a - b - c; }");
  ASSERT_TRUE(p);
  const shade::Expr& e = *p->functions[0]->body[0]->value;
  ASSERT_EQ(e.kind, shade::Expr::Kind::Binary);
  ASSERT_EQ(e.lhs->kind, shade::Expr::Kind::Binary);
  EXPECT_EQ(e.lhs->lhs->ident, "a");
  EXPECT_EQ(e.rhs->ident, "c");
}

TEST(Parser, Parentheses) {
  auto p = parse_ok("fn f() { return (a + b) * c; }");
  ASSERT_TRUE(p);
  const shade::Expr& e = *p->functions[0]->body[0]->value;
  EXPECT_EQ(e.op, shade::TokenKind::Star);
  EXPECT_EQ(e.lhs->op, shade::TokenKind::Plus);
}

TEST(Parser, UnaryOperators) {
  auto p = parse_ok("fn f() { return -a * !b; }");
  ASSERT_TRUE(p);
  const shade::Expr& e = *p->functions[0]->body[0]->value;
  ASSERT_EQ(e.kind, shade::Expr::Kind::Binary);
  ASSERT_EQ(e.lhs->kind, shade::Expr::Kind::Unary);
  EXPECT_EQ(e.lhs->op, shade::TokenKind::Minus);
  ASSERT_EQ(e.rhs->kind, shade::Expr::Kind::Unary);
  EXPECT_EQ(e.rhs->op, shade::TokenKind::Exclaim);
}

TEST(Parser, CallWithArguments) {
  auto p = parse_ok("fn f() { v = Vec3(1.0, 2.0, x); return g(); }");
  ASSERT_TRUE(p);
  const shade::Expr& call = *p->functions[0]->body[0]->value;
  ASSERT_EQ(call.kind, shade::Expr::Kind::Call);
  EXPECT_EQ(call.ident, "Vec3");
  ASSERT_EQ(call.args.size(), 3u);
  EXPECT_EQ(call.args[2]->kind, shade::Expr::Kind::Ident);
  const shade::Expr& empty = *p->functions[0]->body[1]->value;
  EXPECT_EQ(empty.kind, shade::Expr::Kind::Call);
  EXPECT_TRUE(empty.args.empty());
}

TEST(Parser, IntegerAndDecimalLiterals) {
  auto p = parse_ok("fn f() { a = 2; b = 2.0; }");
  ASSERT_TRUE(p);
  EXPECT_EQ(p->functions[0]->body[0]->value->kind, shade::Expr::Kind::IntLiteral);
  EXPECT_EQ(p->functions[0]->body[0]->value->int_val, 2);
  EXPECT_EQ(p->functions[0]->body[1]->value->kind, shade::Expr::Kind::DecimalLiteral);
}

TEST(Parser, UnknownTypeIsAnError) {
  shade::Parser p("in a: mat4;", "<test>");
  p.parse_program();
  ASSERT_TRUE(p.has_errors());
  EXPECT_EQ(p.errors()[0].kind, shade::ErrorKind::Syntax);
  EXPECT_NE(p.errors()[0].message.find("unknown type 'mat4'"), std::string::npos);
}

TEST(Parser, MissingSemicolonReportsLocation) {
  shade::Parser p("fn f() {\n  x = 1.0\n}", "<test>");
  p.parse_program();
  ASSERT_TRUE(p.has_errors());
  EXPECT_EQ(p.errors()[0].loc.line, 3u);
  EXPECT_NE(p.errors()[0].message.find("';'"), std::string::npos);
}

TEST(Parser, RecoversAndReportsSeveralErrors) {
  shade::Parser p("fn f() { x = ; y = 1.0; z = * 2.0; }\nfn g() { return 1.0; }", "<test>");
  auto program = p.parse_program();
  EXPECT_GE(p.errors().size(), 2u);
  ASSERT_TRUE(program);
  EXPECT_TRUE(program->find_function("g"));
}

TEST(Parser, GarbageAtTopLevel) {
  shade::Parser p("x = 1.0;", "<test>");
  p.parse_program();
  ASSERT_TRUE(p.has_errors());
  EXPECT_NE(p.errors()[0].message.find("'in', 'out' or 'fn'"), std::string::npos);
}
