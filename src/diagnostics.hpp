#pragma once

#include "lexer.hpp"
#include <string>
#include <vector>

namespace shade {

enum class ErrorKind {
  Syntax,
  Semantic,
  Folding,
  UnresolvedSymbol,
  UnresolvedFunction,
  UnsupportedExpression,
  LimitExceeded,
};

const char* error_kind_name(ErrorKind k);

struct Diagnostic {
  ErrorKind kind = ErrorKind::Syntax;
  SourceLoc loc;
  std::string name;  // offending symbol or function, when there is one
  std::string message;

  // path:line:column: kind: message
  std::string str(const std::string& path = "") const;
};

using Diagnostics = std::vector<Diagnostic>;

bool has_error_kind(const Diagnostics& diags, ErrorKind kind);

}  // namespace shade
