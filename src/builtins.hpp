#pragma once

#include "types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace shade {

enum class BuiltinOp : uint8_t {
  None,  // named function
  Add,
  Sub,
  Mul,
  Div,
  Neg,
};

const char* builtin_op_symbol(BuiltinOp op);

// Natives read their arguments as consecutive floats (a vec3 is three) and
// write their result the same way.
using NativeFn = void (*)(const float* args, float* result);

using NativeHandle = uint16_t;

struct NativeEntry {
  std::string name;  // empty for operators
  BuiltinOp op = BuiltinOp::None;
  std::vector<TypeKind> params;
  TypeKind result = TypeKind::Void;
  NativeFn fn = nullptr;

  uint32_t arg_slots() const;
  std::string signature() const;
};

// Native functions and operator overloads, looked up by name or operator
// plus the static types of the operands.
class BuiltinRegistry {
 public:
  static BuiltinRegistry with_defaults();

  // nullopt if an entry with the same key already exists.
  std::optional<NativeHandle> add(NativeEntry entry);

  std::optional<NativeHandle> find(const std::string& name,
                                   const std::vector<TypeKind>& args) const;
  std::optional<NativeHandle> find_operator(BuiltinOp op,
                                            const std::vector<TypeKind>& args) const;
  bool has_name(const std::string& name) const;

  const NativeEntry& at(NativeHandle h) const { return entries_.at(h); }
  size_t size() const { return entries_.size(); }

  // false if the handle is unknown or has no implementation.
  bool invoke(NativeHandle h, const float* args, float* result) const;

 private:
  using Key = std::tuple<BuiltinOp, std::string, std::vector<TypeKind>>;

  std::vector<NativeEntry> entries_;
  std::map<Key, NativeHandle> index_;
};

std::string format_signature(const std::vector<TypeKind>& types);

}  // namespace shade
