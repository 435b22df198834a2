#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace shade {

enum class TypeKind : uint8_t {
  Invalid,
  F32,
  Vec3,
  Void,
};

const char* type_kind_name(TypeKind k);
std::optional<TypeKind> type_kind_from_name(std::string_view name);

// Number of 32-bit float slots a value of this type occupies on the
// evaluation stack (a vec3 is three consecutive floats).
uint32_t type_slot_count(TypeKind k);

}  // namespace shade
