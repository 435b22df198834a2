#include <gtest/gtest.h>
#include "parser.hpp"
#include "sema.hpp"
#include <string>

namespace {

bool parse_and_sema_ok(const std::string& source) {
  shade::Parser p(source, "<test>");
  std::unique_ptr<shade::Program> program = p.parse_program();
  if (p.has_errors() || !program) return false;
  shade::SemaContext sema;
  return sema.check_program(*program);
}

void expect_sema_error_containing(const std::string& source, const std::string& substring) {
  shade::Parser p(source, "<test>");
  std::unique_ptr<shade::Program> program = p.parse_program();
  ASSERT_FALSE(p.has_errors());
  ASSERT_TRUE(program);
  shade::SemaContext sema;
  EXPECT_FALSE(sema.check_program(*program));
  ASSERT_FALSE(sema.errors.empty()) << "Expected sema error containing \"" << substring << "\"";
  bool found = false;
  for (const auto& err : sema.errors) {
    EXPECT_EQ(err.kind, shade::ErrorKind::Semantic);
    if (err.message.find(substring) != std::string::npos) { found = true; break; }
  }
  EXPECT_TRUE(found) << "No error contained \"" << substring << "\". First: "
                     << sema.errors[0].message;
}

}  // namespace

TEST(Sema, ValidProgram) {
  EXPECT_TRUE(parse_and_sema_ok(
      "in a: f32; out b: f32;\n"
      "fn main() { b = a; return b; }\n"
      "fn other() { return 1.0; }"));
}

TEST(Sema, DuplicateInParameter) {
  expect_sema_error_containing("in a: f32; in a: vec3;", "duplicate parameter 'a'");
}

TEST(Sema, InAndOutShareNamespace) {
  expect_sema_error_containing("in a: f32; out a: f32;", "duplicate parameter 'a'");
}

TEST(Sema, DuplicateFunction) {
  expect_sema_error_containing("fn f() { return 1.0; } fn f() { return 2.0; }",
                               "duplicate function 'f'");
}

TEST(Sema, ErrorNamesTheOffender) {
  shade::Parser p("in a: f32;\nin a: f32;", "<test>");
  auto program = p.parse_program();
  shade::SemaContext sema;
  ASSERT_FALSE(sema.check_program(*program));
  ASSERT_EQ(sema.errors.size(), 1u);
  EXPECT_EQ(sema.errors[0].name, "a");
  EXPECT_EQ(sema.errors[0].loc.line, 2u);
}

TEST(Sema, ParameterWithoutStorableType) {
  shade::Program program;
  shade::ParamDecl bad;
  bad.name = "nothing";
  bad.type = shade::TypeKind::Void;
  program.in_params.push_back(bad);
  shade::SemaContext sema;
  EXPECT_FALSE(sema.check_program(program));
}
