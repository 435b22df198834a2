#include "symbols.hpp"
#include <algorithm>

namespace shade {

const SymbolMeta& SymbolTable::add(const std::string& name, TypeKind type) {
  SymbolMeta meta;
  meta.offset = next_offset_;
  meta.is_static = is_static_;
  meta.type = type;
  next_offset_ += kSlotSize;
  auto& slot = symbols_[name];
  slot = meta;
  return slot;
}

const SymbolMeta* SymbolTable::find(const std::string& name) const {
  auto it = symbols_.find(name);
  if (it != symbols_.end()) return &it->second;
  return nullptr;
}

std::vector<std::pair<std::string, SymbolMeta>> SymbolTable::by_offset() const {
  std::vector<std::pair<std::string, SymbolMeta>> out(symbols_.begin(), symbols_.end());
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.second.offset < b.second.offset;
  });
  return out;
}

void allocate_globals(const Program& program, SymbolTable& globals) {
  for (const auto& p : program.in_params) globals.add(p.name, p.type);
  for (const auto& p : program.out_params) globals.add(p.name, p.type);
}

}  // namespace shade
