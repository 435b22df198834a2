#pragma once

#include "symbols.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shade {

// Opcode tags. The numeric values are part of the VM contract.
enum class BcOp : uint16_t {
  AddI32,
  SubI32,
  MulI32,
  DivI32,

  AddF32,
  SubF32,
  MulF32,
  DivF32,

  ConstF32,    // followed by one raw word: IEEE-754 single bit pattern
  Void,        // push the empty value
  StoreLocal,  // imm = frame offset
  LoadLocal,
  StoreGlobal,  // imm = static section offset
  LoadGlobal,

  Ret,   // imm = frame size to reclaim
  Call,  // imm = callee entry address
  Jmp,
  JmpIf,

  CallNative,  // imm = builtin registry handle
};

constexpr uint16_t kBcOpCount = static_cast<uint16_t>(BcOp::CallNative) + 1;

// Minimum stack beyond the static section the VM must provide.
constexpr uint32_t kStackWorkingMargin = 1024;

const char* bc_op_name(BcOp op);

// Raw operand words following an instruction word with this opcode.
uint32_t trailing_words(BcOp op);

struct BcInstr {
  BcOp op = BcOp::Void;
  uint16_t imm = 0;
};

// One 32-bit cell of the instruction stream: opcode in bits 0-15,
// immediate in bits 16-31, or a raw operand word.
class BcWord {
 public:
  BcWord() = default;

  static BcWord plain(BcOp op);
  static BcWord with_imm(BcOp op, uint16_t imm);
  static BcWord raw(uint32_t bits);
  static BcWord from_float(float f);

  uint32_t bits() const { return bits_; }
  uint16_t tag() const { return static_cast<uint16_t>(bits_ & 0xFFFFu); }
  uint16_t imm() const { return static_cast<uint16_t>(bits_ >> 16); }
  float as_float() const;

  bool operator==(const BcWord& other) const { return bits_ == other.bits_; }
  bool operator!=(const BcWord& other) const { return bits_ != other.bits_; }

 private:
  explicit BcWord(uint32_t bits) : bits_(bits) {}
  uint32_t bits_ = 0;
};

// Splits an instruction word; nullopt if the tag is not a known opcode.
std::optional<BcInstr> decode_instr(BcWord w);

struct BcProgram {
  std::vector<BcWord> code;
  SymbolTable global_symbols{true};
  std::unordered_map<std::string, FuncMeta> functions;
  uint32_t static_section_size = 0;
  uint32_t min_stack_size = 0;

  const FuncMeta* find_function(const std::string& name) const {
    auto it = functions.find(name);
    return it != functions.end() ? &it->second : nullptr;
  }

  // Function names in ascending address order.
  std::vector<std::string> functions_by_address() const;
};

}  // namespace shade
