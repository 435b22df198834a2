#include "disasm.hpp"
#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>
#include <map>

namespace shade {

bool disassemble(const BcProgram& program, llvm::raw_ostream& os,
                 const BuiltinRegistry* builtins) {
  os << "; static section " << program.static_section_size << " bytes, min stack "
     << program.min_stack_size << "\n";
  for (const auto& kv : program.global_symbols.by_offset()) {
    os << "; global " << kv.first << " @" << kv.second.offset << " "
       << type_kind_name(kv.second.type) << "\n";
  }

  std::map<uint32_t, std::string> labels;
  for (const std::string& name : program.functions_by_address()) {
    const FuncMeta& f = program.functions.at(name);
    labels.emplace(f.address, name);
  }

  bool ok = true;
  const auto& code = program.code;
  for (size_t i = 0; i < code.size(); ++i) {
    auto label = labels.find(static_cast<uint32_t>(i));
    if (label != labels.end()) {
      const FuncMeta& f = program.functions.at(label->second);
      os << "\n" << label->second << ":  ; id " << f.id << ", frame " << f.frame_size
         << ", returns " << type_kind_name(f.return_type) << "\n";
    }

    os << llvm::format("%04zu  ", i);
    auto instr = decode_instr(code[i]);
    if (!instr) {
      os << llvm::format(".word 0x%08x", code[i].bits()) << "  ; invalid opcode\n";
      ok = false;
      continue;
    }
    os << bc_op_name(instr->op);
    switch (instr->op) {
      case BcOp::ConstF32:
        if (i + 1 >= code.size()) {
          os << "  ; missing operand word\n";
          ok = false;
          continue;
        }
        ++i;
        os << " " << llvm::format("%g", code[i].as_float());
        break;
      case BcOp::StoreLocal:
      case BcOp::LoadLocal:
      case BcOp::StoreGlobal:
      case BcOp::LoadGlobal:
      case BcOp::Ret:
      case BcOp::Jmp:
      case BcOp::JmpIf:
        os << " " << instr->imm;
        break;
      case BcOp::Call: {
        os << " " << instr->imm;
        auto target = labels.find(instr->imm);
        if (target != labels.end()) os << "  ; " << target->second;
        break;
      }
      case BcOp::CallNative:
        os << " " << instr->imm;
        if (builtins && instr->imm < builtins->size())
          os << "  ; " << builtins->at(instr->imm).signature();
        break;
      default:
        break;
    }
    os << "\n";
  }
  return ok;
}

}  // namespace shade
