#pragma once

#include "ast.hpp"
#include "types.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shade {

// Every named value occupies one 32-bit slot, whatever its declared type.
constexpr uint32_t kSlotSize = 4;

struct SymbolMeta {
  uint32_t offset = 0;  // bytes from the start of the static section or frame
  bool is_static = false;
  TypeKind type = TypeKind::Invalid;
};

// Append-only name -> slot table. Offsets are handed out in insertion order
// and never change; the table does not check for duplicate names.
class SymbolTable {
 public:
  explicit SymbolTable(bool is_static = false) : is_static_(is_static) {}

  const SymbolMeta& add(const std::string& name, TypeKind type);
  const SymbolMeta* find(const std::string& name) const;

  bool empty() const { return symbols_.empty(); }
  size_t count() const { return symbols_.size(); }
  uint32_t size_bytes() const { return next_offset_; }

  std::vector<std::pair<std::string, SymbolMeta>> by_offset() const;

 private:
  bool is_static_ = false;
  uint32_t next_offset_ = 0;
  std::unordered_map<std::string, SymbolMeta> symbols_;
};

struct FuncMeta {
  uint32_t id = 0;       // declaration ordinal within the compilation
  uint32_t address = 0;  // index of the first instruction word
  uint32_t frame_size = 0;
  TypeKind return_type = TypeKind::Invalid;  // Invalid until a return is lowered
  SymbolTable symbols;   // locals
};

// Per-compilation counter for unique ids.
class IdSequence {
 public:
  uint32_t next() { return next_++; }

 private:
  uint32_t next_ = 0;
};

// Lays out the static section: in-parameters, then out-parameters, each in
// declaration order.
void allocate_globals(const Program& program, SymbolTable& globals);

}  // namespace shade
