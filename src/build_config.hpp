#pragma once

#include <string>
#include <vector>

namespace shade {

struct BuildOptions {
  std::string input_path;
  std::string output_path;  // empty: derived from the input path
  bool dump_ast = false;
  bool disasm = false;
  bool fold_constants = true;
  bool verbose = false;
  bool show_help = false;
};

// Returns false and sets *err on a malformed command line.
bool parse_command_line(const std::vector<std::string>& args, BuildOptions& out,
                        std::string* err);

// foo/bar.shade -> foo/bar.shbc
std::string default_output_path(const std::string& input_path);

const char* usage_text();

}  // namespace shade
