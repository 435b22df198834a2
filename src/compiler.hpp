#pragma once

#include "ast.hpp"
#include "builtins.hpp"
#include "bytecode.hpp"
#include "diagnostics.hpp"
#include "symbols.hpp"
#include <memory>
#include <optional>
#include <string>

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace shade {

struct CompileOptions {
  bool fold_constants = true;
  llvm::raw_ostream* log = nullptr;  // pipeline progress, when set
};

// One compilation session: owns its builtin table view, id sequence and
// diagnostics. Any error aborts the whole compilation. parse() and compile()
// start from empty diagnostics, and each compile() numbers functions from 0.
class Compiler {
 public:
  explicit Compiler(CompileOptions options = {}, const BuiltinRegistry* builtins = nullptr);
  Compiler(const Compiler&) = delete;
  Compiler& operator=(const Compiler&) = delete;

  // Parse and check source text. Returns null on any front-end error.
  std::unique_ptr<Program> parse(std::string source, std::string path);

  // Check and fold in place; everything compile() does before codegen.
  bool prepare(Program& program);

  // prepare() followed by code generation.
  std::optional<BcProgram> compile(Program& program);

  std::optional<BcProgram> compile_source(std::string source, std::string path);

  const Diagnostics& diagnostics() const { return diags_; }
  bool has_errors() const { return !diags_.empty(); }
  void print_diagnostics(llvm::raw_ostream& os) const;

  const BuiltinRegistry& builtins() const { return *builtins_; }

 private:
  void log(const std::string& msg) const;

  CompileOptions options_;
  BuiltinRegistry default_builtins_;
  const BuiltinRegistry* builtins_ = nullptr;
  IdSequence ids_;
  Diagnostics diags_;
  std::string path_;
};

}  // namespace shade
