#include "ast_dump.hpp"
#include "build_config.hpp"
#include "bytecode_file.hpp"
#include "compiler.hpp"
#include "disasm.hpp"
#include <fstream>
#include <iostream>
#include <llvm/Support/raw_ostream.h>
#include <sstream>
#include <string>
#include <vector>

static bool read_file(const std::string& path, std::string& out) {
  std::ifstream f(path);
  if (!f) return false;
  std::stringstream buf;
  buf << f.rdbuf();
  out = buf.str();
  return true;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  shade::BuildOptions opts;
  std::string err;
  if (!shade::parse_command_line(args, opts, &err)) {
    llvm::errs() << "shadec: " << err << "\n" << shade::usage_text();
    return 1;
  }
  if (opts.show_help) {
    llvm::outs() << shade::usage_text();
    return 0;
  }

  std::string source;
  if (!read_file(opts.input_path, source)) {
    llvm::errs() << "shadec: could not read " << opts.input_path << "\n";
    return 1;
  }

  shade::CompileOptions copts;
  copts.fold_constants = opts.fold_constants;
  if (opts.verbose) copts.log = &llvm::errs();
  shade::Compiler compiler(copts);

  std::unique_ptr<shade::Program> program = compiler.parse(std::move(source), opts.input_path);
  if (!program) {
    compiler.print_diagnostics(llvm::errs());
    return 1;
  }

  if (opts.dump_ast) {
    if (!compiler.prepare(*program)) {
      compiler.print_diagnostics(llvm::errs());
      return 1;
    }
    shade::dump_program(std::cout, *program);
    return 0;
  }

  std::optional<shade::BcProgram> bc = compiler.compile(*program);
  if (!bc) {
    compiler.print_diagnostics(llvm::errs());
    llvm::errs() << "shadec: compilation failed\n";
    return 1;
  }

  if (opts.disasm && !shade::disassemble(*bc, llvm::outs(), &compiler.builtins())) {
    llvm::errs() << "shadec: generated code contains undecodable words\n";
    return 1;
  }

  std::string out_path =
      opts.output_path.empty() ? shade::default_output_path(opts.input_path) : opts.output_path;
  if (!shade::write_bytecode_file(*bc, out_path, &err)) {
    llvm::errs() << "shadec: " << err << "\n";
    return 1;
  }
  if (opts.verbose) llvm::errs() << "shadec: wrote " << out_path << "\n";
  return 0;
}
