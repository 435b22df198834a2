#include "bytecode.hpp"
#include <algorithm>
#include <llvm/ADT/bit.h>

namespace shade {

const char* bc_op_name(BcOp op) {
  switch (op) {
    case BcOp::AddI32: return "add.i32";
    case BcOp::SubI32: return "sub.i32";
    case BcOp::MulI32: return "mul.i32";
    case BcOp::DivI32: return "div.i32";
    case BcOp::AddF32: return "add.f32";
    case BcOp::SubF32: return "sub.f32";
    case BcOp::MulF32: return "mul.f32";
    case BcOp::DivF32: return "div.f32";
    case BcOp::ConstF32: return "const.f32";
    case BcOp::Void: return "void";
    case BcOp::StoreLocal: return "store.local";
    case BcOp::LoadLocal: return "load.local";
    case BcOp::StoreGlobal: return "store.global";
    case BcOp::LoadGlobal: return "load.global";
    case BcOp::Ret: return "ret";
    case BcOp::Call: return "call";
    case BcOp::Jmp: return "jmp";
    case BcOp::JmpIf: return "jmp.if";
    case BcOp::CallNative: return "call.native";
  }
  return "?";
}

uint32_t trailing_words(BcOp op) {
  return op == BcOp::ConstF32 ? 1 : 0;
}

BcWord BcWord::plain(BcOp op) {
  return BcWord(static_cast<uint32_t>(op));
}

BcWord BcWord::with_imm(BcOp op, uint16_t imm) {
  return BcWord(static_cast<uint32_t>(op) | (static_cast<uint32_t>(imm) << 16));
}

BcWord BcWord::raw(uint32_t bits) {
  return BcWord(bits);
}

BcWord BcWord::from_float(float f) {
  return BcWord(llvm::bit_cast<uint32_t>(f));
}

float BcWord::as_float() const {
  return llvm::bit_cast<float>(bits_);
}

std::optional<BcInstr> decode_instr(BcWord w) {
  if (w.tag() >= kBcOpCount) return std::nullopt;
  BcInstr instr;
  instr.op = static_cast<BcOp>(w.tag());
  instr.imm = w.imm();
  return instr;
}

std::vector<std::string> BcProgram::functions_by_address() const {
  std::vector<std::string> names;
  names.reserve(functions.size());
  for (const auto& kv : functions) names.push_back(kv.first);
  std::sort(names.begin(), names.end(), [this](const std::string& a, const std::string& b) {
    const FuncMeta& fa = functions.at(a);
    const FuncMeta& fb = functions.at(b);
    if (fa.address != fb.address) return fa.address < fb.address;
    return fa.id < fb.id;
  });
  return names;
}

}  // namespace shade
