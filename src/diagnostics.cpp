#include "diagnostics.hpp"
#include <sstream>

namespace shade {

const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::Syntax: return "syntax error";
    case ErrorKind::Semantic: return "error";
    case ErrorKind::Folding: return "folding error";
    case ErrorKind::UnresolvedSymbol: return "unresolved symbol";
    case ErrorKind::UnresolvedFunction: return "unresolved function";
    case ErrorKind::UnsupportedExpression: return "unsupported expression";
    case ErrorKind::LimitExceeded: return "limit exceeded";
  }
  return "error";
}

std::string Diagnostic::str(const std::string& path) const {
  std::ostringstream os;
  if (!path.empty()) os << path << ":";
  os << loc.line << ":" << loc.column << ": " << error_kind_name(kind) << ": "
     << message;
  return os.str();
}

bool has_error_kind(const Diagnostics& diags, ErrorKind kind) {
  for (const auto& d : diags)
    if (d.kind == kind) return true;
  return false;
}

}  // namespace shade
