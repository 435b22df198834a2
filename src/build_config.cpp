#include "build_config.hpp"

namespace shade {

bool parse_command_line(const std::vector<std::string>& args, BuildOptions& out,
                        std::string* err) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--dump-ast" || arg == "-d") {
      out.dump_ast = true;
    } else if (arg == "--disasm" || arg == "-S") {
      out.disasm = true;
    } else if (arg == "--no-fold") {
      out.fold_constants = false;
    } else if (arg == "--verbose" || arg == "-v") {
      out.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      out.show_help = true;
    } else if (arg == "-o") {
      if (i + 1 >= args.size()) {
        if (err) *err = "-o requires a file name";
        return false;
      }
      out.output_path = args[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      if (err) *err = "unknown option '" + arg + "'";
      return false;
    } else if (!out.input_path.empty()) {
      if (err) *err = "more than one input file";
      return false;
    } else {
      out.input_path = arg;
    }
  }
  if (out.input_path.empty() && !out.show_help) {
    if (err) *err = "no input file";
    return false;
  }
  return true;
}

std::string default_output_path(const std::string& input_path) {
  std::string::size_type slash = input_path.find_last_of("/\\");
  std::string::size_type dot = input_path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
    return input_path + ".shbc";
  return input_path.substr(0, dot) + ".shbc";
}

const char* usage_text() {
  return "Usage: shadec [options] <file.shade>\n"
         "  -o <file>         Write bytecode to <file> (default: <input>.shbc)\n"
         "  --dump-ast, -d    Dump the syntax tree after folding and exit\n"
         "  --disasm, -S      Print the disassembled bytecode\n"
         "  --no-fold         Skip constant folding\n"
         "  --verbose, -v     Log pipeline stages to stderr\n"
         "  --help, -h        Show this help\n";
}

}  // namespace shade
