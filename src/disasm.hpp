#pragma once

#include "builtins.hpp"
#include "bytecode.hpp"

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace shade {

// Text listing of a compiled program. Returns false if the stream holds a
// word that does not decode or a truncated constant; the listing still
// covers the whole stream.
bool disassemble(const BcProgram& program, llvm::raw_ostream& os,
                 const BuiltinRegistry* builtins = nullptr);

}  // namespace shade
