#include "compiler.hpp"
#include "codegen.hpp"
#include "fold.hpp"
#include "parser.hpp"
#include "sema.hpp"
#include <llvm/Support/raw_ostream.h>

namespace shade {

Compiler::Compiler(CompileOptions options, const BuiltinRegistry* builtins)
    : options_(options), default_builtins_(BuiltinRegistry::with_defaults()) {
  builtins_ = builtins ? builtins : &default_builtins_;
}

void Compiler::log(const std::string& msg) const {
  if (options_.log) *options_.log << "shadec: " << msg << "\n";
}

void Compiler::print_diagnostics(llvm::raw_ostream& os) const {
  for (const auto& d : diags_) os << d.str(path_) << "\n";
}

std::unique_ptr<Program> Compiler::parse(std::string source, std::string path) {
  diags_.clear();
  path_ = path;
  Parser parser(std::move(source), std::move(path));
  std::unique_ptr<Program> program = parser.parse_program();
  if (parser.has_errors()) {
    diags_.insert(diags_.end(), parser.errors().begin(), parser.errors().end());
    return nullptr;
  }
  log("parsed " + std::to_string(program->in_params.size()) + " in, " +
      std::to_string(program->out_params.size()) + " out, " +
      std::to_string(program->functions.size()) + " function(s)");
  return program;
}

bool Compiler::prepare(Program& program) {
  if (!program.path.empty()) path_ = program.path;

  SemaContext sema;
  if (!sema.check_program(program)) {
    diags_.insert(diags_.end(), sema.errors.begin(), sema.errors.end());
    return false;
  }

  if (options_.fold_constants) {
    ConstantFolder folder;
    if (!folder.fold_program(program)) {
      diags_.insert(diags_.end(), folder.errors().begin(), folder.errors().end());
      return false;
    }
    log("folded " + std::to_string(folder.folded_count()) + " constant expression(s)");
  }
  return true;
}

std::optional<BcProgram> Compiler::compile(Program& program) {
  diags_.clear();
  ids_ = IdSequence();
  if (!prepare(program)) return std::nullopt;

  CodeGen cg(*builtins_, ids_);
  if (!cg.run(program)) {
    diags_.insert(diags_.end(), cg.errors().begin(), cg.errors().end());
    return std::nullopt;
  }
  BcProgram out = cg.take_program();
  log("generated " + std::to_string(out.code.size()) + " word(s), static section " +
      std::to_string(out.static_section_size) + " bytes, min stack " +
      std::to_string(out.min_stack_size));
  return out;
}

std::optional<BcProgram> Compiler::compile_source(std::string source, std::string path) {
  std::unique_ptr<Program> program = parse(std::move(source), std::move(path));
  if (!program) return std::nullopt;
  return compile(*program);
}

}  // namespace shade
