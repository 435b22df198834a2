#include "builtins.hpp"
#include <cmath>
#include <limits>

namespace shade {

namespace {

void vec3_construct(const float* a, float* r) {
  r[0] = a[0];
  r[1] = a[1];
  r[2] = a[2];
}

void vec3_normalize(const float* a, float* r) {
  float len = std::sqrt(a[0] * a[0] + a[1] * a[1] + a[2] * a[2]);
  r[0] = a[0] / len;
  r[1] = a[1] / len;
  r[2] = a[2] / len;
}

void vec3_dot(const float* a, float* r) {
  r[0] = a[0] * a[3] + a[1] * a[4] + a[2] * a[5];
}

void mul_f32_vec3(const float* a, float* r) {
  r[0] = a[1] * a[0];
  r[1] = a[2] * a[0];
  r[2] = a[3] * a[0];
}

void mul_vec3_f32(const float* a, float* r) {
  r[0] = a[0] * a[3];
  r[1] = a[1] * a[3];
  r[2] = a[2] * a[3];
}

void add_vec3_vec3(const float* a, float* r) {
  r[0] = a[0] + a[3];
  r[1] = a[1] + a[4];
  r[2] = a[2] + a[5];
}

void neg_f32(const float* a, float* r) {
  r[0] = -a[0];
}

NativeEntry named(std::string name, std::vector<TypeKind> params, TypeKind result, NativeFn fn) {
  NativeEntry e;
  e.name = std::move(name);
  e.params = std::move(params);
  e.result = result;
  e.fn = fn;
  return e;
}

NativeEntry op(BuiltinOp o, std::vector<TypeKind> params, TypeKind result, NativeFn fn) {
  NativeEntry e;
  e.op = o;
  e.params = std::move(params);
  e.result = result;
  e.fn = fn;
  return e;
}

}  // namespace

const char* builtin_op_symbol(BuiltinOp op) {
  switch (op) {
    case BuiltinOp::None: return "";
    case BuiltinOp::Add: return "+";
    case BuiltinOp::Sub: return "-";
    case BuiltinOp::Mul: return "*";
    case BuiltinOp::Div: return "/";
    case BuiltinOp::Neg: return "-";
  }
  return "";
}

std::string format_signature(const std::vector<TypeKind>& types) {
  std::string s = "(";
  for (size_t i = 0; i < types.size(); ++i) {
    if (i) s += ", ";
    s += type_kind_name(types[i]);
  }
  s += ")";
  return s;
}

uint32_t NativeEntry::arg_slots() const {
  uint32_t n = 0;
  for (TypeKind t : params) n += type_slot_count(t);
  return n;
}

std::string NativeEntry::signature() const {
  std::string s = op == BuiltinOp::None ? name : std::string("operator") + builtin_op_symbol(op);
  return s + format_signature(params) + " -> " + type_kind_name(result);
}

BuiltinRegistry BuiltinRegistry::with_defaults() {
  using T = TypeKind;
  BuiltinRegistry r;
  r.add(named("Vec3", {T::F32, T::F32, T::F32}, T::Vec3, vec3_construct));
  r.add(named("normalize", {T::Vec3}, T::Vec3, vec3_normalize));
  r.add(named("dot", {T::Vec3, T::Vec3}, T::F32, vec3_dot));
  r.add(op(BuiltinOp::Mul, {T::F32, T::Vec3}, T::Vec3, mul_f32_vec3));
  r.add(op(BuiltinOp::Mul, {T::Vec3, T::F32}, T::Vec3, mul_vec3_f32));
  r.add(op(BuiltinOp::Add, {T::Vec3, T::Vec3}, T::Vec3, add_vec3_vec3));
  r.add(op(BuiltinOp::Neg, {T::F32}, T::F32, neg_f32));
  return r;
}

std::optional<NativeHandle> BuiltinRegistry::add(NativeEntry entry) {
  if (entries_.size() > std::numeric_limits<NativeHandle>::max()) return std::nullopt;
  Key key(entry.op, entry.op == BuiltinOp::None ? entry.name : std::string(), entry.params);
  auto handle = static_cast<NativeHandle>(entries_.size());
  if (!index_.emplace(std::move(key), handle).second) return std::nullopt;
  entries_.push_back(std::move(entry));
  return handle;
}

std::optional<NativeHandle> BuiltinRegistry::find(const std::string& name,
                                                  const std::vector<TypeKind>& args) const {
  auto it = index_.find(Key(BuiltinOp::None, name, args));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::optional<NativeHandle> BuiltinRegistry::find_operator(
    BuiltinOp op, const std::vector<TypeKind>& args) const {
  if (op == BuiltinOp::None) return std::nullopt;
  auto it = index_.find(Key(op, std::string(), args));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

bool BuiltinRegistry::has_name(const std::string& name) const {
  for (const auto& e : entries_)
    if (e.op == BuiltinOp::None && e.name == name) return true;
  return false;
}

bool BuiltinRegistry::invoke(NativeHandle h, const float* args, float* result) const {
  if (h >= entries_.size() || !entries_[h].fn) return false;
  entries_[h].fn(args, result);
  return true;
}

}  // namespace shade
