#include "sema.hpp"
#include <sstream>

namespace shade {

namespace {

std::string loc_str(SourceLoc loc) {
  std::ostringstream os;
  os << loc.line << ":" << loc.column;
  return os.str();
}

}  // namespace

void SemaContext::add_error(SourceLoc loc, const std::string& name, const std::string& msg) {
  Diagnostic d;
  d.kind = ErrorKind::Semantic;
  d.loc = loc;
  d.name = name;
  d.message = msg;
  errors.push_back(std::move(d));
}

bool SemaContext::check_param(const ParamDecl& p,
                              std::unordered_map<std::string, SourceLoc>& seen) {
  bool ok = true;
  if (p.type != TypeKind::F32 && p.type != TypeKind::Vec3) {
    add_error(p.loc, p.name, "parameter '" + p.name + "' has no storable type");
    ok = false;
  }
  auto inserted = seen.emplace(p.name, p.loc);
  if (!inserted.second) {
    add_error(p.loc, p.name,
              "duplicate parameter '" + p.name + "' (first declared at " +
                  loc_str(inserted.first->second) + ")");
    ok = false;
  }
  return ok;
}

bool SemaContext::check_function(const Function& f) {
  bool ok = true;
  for (const auto& s : f.body) {
    if (!s) continue;
    if (s->kind == Stmt::Kind::Assign && (s->target.empty() || !s->value)) {
      add_error(s->loc, s->target, "malformed assignment in '" + f.name + "'");
      ok = false;
    }
    if (s->kind == Stmt::Kind::Invalid) {
      add_error(s->loc, "", "invalid statement in '" + f.name + "'");
      ok = false;
    }
  }
  return ok;
}

bool SemaContext::check_program(Program& p) {
  program = &p;
  size_t errors_before = errors.size();

  // In and out parameters share the static section, so they share one namespace.
  std::unordered_map<std::string, SourceLoc> globals;
  for (const auto& param : p.in_params) check_param(param, globals);
  for (const auto& param : p.out_params) check_param(param, globals);

  std::unordered_map<std::string, SourceLoc> functions;
  for (const auto& f : p.functions) {
    if (!f) continue;
    auto inserted = functions.emplace(f->name, f->loc);
    if (!inserted.second) {
      add_error(f->loc, f->name,
                "duplicate function '" + f->name + "' (first defined at " +
                    loc_str(inserted.first->second) + ")");
    }
    check_function(*f);
  }
  return errors.size() == errors_before;
}

}  // namespace shade
