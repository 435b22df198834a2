#pragma once

#include "bytecode.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace shade {

// .shbc layout, every field a 32-bit word in host byte order:
//   magic, version, static_section_size, min_stack_size,
//   global count, { offset, type, name length, name bytes padded to 4 }...,
//   function count, { id, address, frame size, return type,
//                     name length, name bytes padded to 4 }...,
//   code length, code words.
constexpr uint32_t kBytecodeMagic = 0x53484243;  // "SHBC"
constexpr uint32_t kBytecodeVersion = 1;

void write_bytecode(const BcProgram& program, llvm::raw_ostream& os);
bool write_bytecode_file(const BcProgram& program, const std::string& path,
                         std::string* err);

std::optional<BcProgram> parse_bytecode(std::string_view data, std::string* err);
std::optional<BcProgram> read_bytecode_file(const std::string& path, std::string* err);

}  // namespace shade
