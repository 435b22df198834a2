#include "types.hpp"

namespace shade {

const char* type_kind_name(TypeKind k) {
  switch (k) {
    case TypeKind::Invalid: return "<invalid>";
    case TypeKind::F32: return "f32";
    case TypeKind::Vec3: return "vec3";
    case TypeKind::Void: return "void";
  }
  return "<invalid>";
}

std::optional<TypeKind> type_kind_from_name(std::string_view name) {
  if (name == "f32") return TypeKind::F32;
  if (name == "vec3") return TypeKind::Vec3;
  return std::nullopt;
}

uint32_t type_slot_count(TypeKind k) {
  switch (k) {
    case TypeKind::F32: return 1;
    case TypeKind::Vec3: return 3;
    case TypeKind::Void:
    case TypeKind::Invalid:
      return 0;
  }
  return 0;
}

}  // namespace shade
