#include "bytecode_file.hpp"
#include <llvm/Support/EndianStream.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SwapByteOrder.h>
#include <llvm/Support/raw_ostream.h>
#include <vector>

namespace shade {

namespace {

using llvm::support::native;

void write_name(llvm::support::endian::Writer& w, const std::string& name) {
  w.write<uint32_t>(static_cast<uint32_t>(name.size()));
  w.OS << name;
  for (size_t pad = (4 - name.size() % 4) % 4; pad > 0; --pad) w.OS << '\0';
}

class WordReader {
 public:
  WordReader(std::string_view data, std::string* err) : data_(data), err_(err) {}

  bool read(uint32_t& out, const char* what) {
    if (pos_ + 4 > data_.size()) return fail(std::string("truncated input reading ") + what);
    out = llvm::support::endian::read32(data_.data() + pos_, native);
    pos_ += 4;
    return true;
  }

  bool read_name(std::string& out) {
    uint32_t len = 0;
    if (!read(len, "name length")) return false;
    size_t padded = (static_cast<size_t>(len) + 3) / 4 * 4;
    if (pos_ + padded > data_.size()) return fail("truncated input reading name");
    out.assign(data_.data() + pos_, len);
    pos_ += padded;
    return true;
  }

  bool read_type(TypeKind& out) {
    uint32_t raw = 0;
    if (!read(raw, "type")) return false;
    if (raw > static_cast<uint32_t>(TypeKind::Void)) return fail("unknown type tag " + std::to_string(raw));
    out = static_cast<TypeKind>(raw);
    return true;
  }

  bool at_end() const { return pos_ == data_.size(); }
  size_t remaining() const { return data_.size() - pos_; }

  // Rejects a count whose records could not fit in the rest of the input.
  bool check_count(uint32_t count, size_t min_record_bytes, const char* what) {
    if (count > remaining() / min_record_bytes)
      return fail(std::string("truncated input reading ") + what);
    return true;
  }

  bool fail(const std::string& msg) {
    if (err_) *err_ = msg;
    return false;
  }

 private:
  std::string_view data_;
  std::string* err_;
  size_t pos_ = 0;
};

}  // namespace

void write_bytecode(const BcProgram& program, llvm::raw_ostream& os) {
  llvm::support::endian::Writer w(os, native);
  w.write<uint32_t>(kBytecodeMagic);
  w.write<uint32_t>(kBytecodeVersion);
  w.write<uint32_t>(program.static_section_size);
  w.write<uint32_t>(program.min_stack_size);

  w.write<uint32_t>(static_cast<uint32_t>(program.global_symbols.count()));
  for (const auto& kv : program.global_symbols.by_offset()) {
    w.write<uint32_t>(kv.second.offset);
    w.write<uint32_t>(static_cast<uint32_t>(kv.second.type));
    write_name(w, kv.first);
  }

  auto names = program.functions_by_address();
  w.write<uint32_t>(static_cast<uint32_t>(names.size()));
  for (const std::string& name : names) {
    const FuncMeta& f = program.functions.at(name);
    w.write<uint32_t>(f.id);
    w.write<uint32_t>(f.address);
    w.write<uint32_t>(f.frame_size);
    w.write<uint32_t>(static_cast<uint32_t>(f.return_type));
    write_name(w, name);
  }

  w.write<uint32_t>(static_cast<uint32_t>(program.code.size()));
  for (const BcWord& word : program.code) w.write<uint32_t>(word.bits());
}

bool write_bytecode_file(const BcProgram& program, const std::string& path,
                         std::string* err) {
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
  if (ec) {
    if (err) *err = "could not open " + path + ": " + ec.message();
    return false;
  }
  write_bytecode(program, os);
  os.close();
  if (os.has_error()) {
    if (err) *err = "could not write " + path + ": " + os.error().message();
    os.clear_error();
    return false;
  }
  return true;
}

std::optional<BcProgram> parse_bytecode(std::string_view data, std::string* err) {
  WordReader r(data, err);
  uint32_t magic = 0;
  uint32_t version = 0;
  if (!r.read(magic, "magic")) return std::nullopt;
  if (magic == llvm::sys::getSwappedBytes(kBytecodeMagic)) {
    r.fail("byte order mismatch: file was written on a host of the other endianness");
    return std::nullopt;
  }
  if (magic != kBytecodeMagic) {
    r.fail("not a shade bytecode file");
    return std::nullopt;
  }
  if (!r.read(version, "version")) return std::nullopt;
  if (version != kBytecodeVersion) {
    r.fail("unsupported bytecode version " + std::to_string(version));
    return std::nullopt;
  }

  BcProgram program;
  if (!r.read(program.static_section_size, "static section size")) return std::nullopt;
  if (!r.read(program.min_stack_size, "min stack size")) return std::nullopt;

  uint32_t count = 0;
  if (!r.read(count, "global count") || !r.check_count(count, 12, "globals"))
    return std::nullopt;
  for (uint32_t i = 0; i < count; ++i) {
    uint32_t offset = 0;
    TypeKind type = TypeKind::Invalid;
    std::string name;
    if (!r.read(offset, "global offset") || !r.read_type(type) || !r.read_name(name))
      return std::nullopt;
    // Globals are stored in offset order, so re-adding them reproduces the layout.
    if (program.global_symbols.add(name, type).offset != offset) {
      r.fail("global '" + name + "' is not at its allocated offset");
      return std::nullopt;
    }
  }
  if (program.global_symbols.size_bytes() != program.static_section_size) {
    r.fail("global table does not match the static section size");
    return std::nullopt;
  }

  if (!r.read(count, "function count") || !r.check_count(count, 20, "functions"))
    return std::nullopt;
  for (uint32_t i = 0; i < count; ++i) {
    FuncMeta f;
    std::string name;
    if (!r.read(f.id, "function id") || !r.read(f.address, "function address") ||
        !r.read(f.frame_size, "frame size") || !r.read_type(f.return_type) ||
        !r.read_name(name))
      return std::nullopt;
    if (!program.functions.emplace(name, std::move(f)).second) {
      r.fail("duplicate function '" + name + "'");
      return std::nullopt;
    }
  }

  if (!r.read(count, "code length") || !r.check_count(count, 4, "code"))
    return std::nullopt;
  program.code.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    uint32_t bits = 0;
    if (!r.read(bits, "code")) return std::nullopt;
    program.code.push_back(BcWord::raw(bits));
  }
  if (!r.at_end()) {
    r.fail("trailing data after code section");
    return std::nullopt;
  }
  for (const auto& kv : program.functions) {
    if (kv.second.address >= program.code.size()) {
      r.fail("function '" + kv.first + "' starts outside the code section");
      return std::nullopt;
    }
  }
  return program;
}

std::optional<BcProgram> read_bytecode_file(const std::string& path, std::string* err) {
  auto buf = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                         /*RequiresNullTerminator=*/false);
  if (!buf) {
    if (err) *err = "could not read " + path + ": " + buf.getError().message();
    return std::nullopt;
  }
  llvm::StringRef data = (*buf)->getBuffer();
  return parse_bytecode(std::string_view(data.data(), data.size()), err);
}

}  // namespace shade
