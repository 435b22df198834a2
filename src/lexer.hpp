#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shade {

struct SourceLoc {
  uint32_t line = 1;
  uint32_t column = 1;
  uint32_t offset = 0;
};

enum class TokenKind {
  EndOfFile,
  Invalid,

  // Literals
  IntLiteral,
  FloatLiteral,

  // Identifiers and keywords
  Identifier,
  KwIn,
  KwOut,
  KwFn,
  KwReturn,

  // Single-char
  Semicolon,
  Comma,
  Colon,
  Eq,
  Plus,
  Minus,
  Star,
  Slash,
  Exclaim,

  // Brackets
  LParen,
  RParen,
  LBrace,
  RBrace,
};

const char* token_kind_name(TokenKind k);

struct Token {
  TokenKind kind = TokenKind::EndOfFile;
  SourceLoc loc;
  std::string_view text;  // view into source

  bool is_one_of(TokenKind a, TokenKind b) const {
    return kind == a || kind == b;
  }
  template <typename... Ts>
  bool is_one_of(TokenKind a, TokenKind b, Ts... rest) const {
    return kind == a || is_one_of(b, rest...);
  }
};

class Lexer {
 public:
  explicit Lexer(std::string_view source);

  Token next();

 private:
  char peek_char() const;
  char peek_char(size_t offset) const;
  char consume();
  void skip_line_comment();
  void skip_block_comment();  // supports nesting
  Token lex_number();
  Token lex_identifier_or_keyword();

  std::string_view source_;
  size_t pos_ = 0;
  SourceLoc loc_;
  Token current_;
};

}  // namespace shade
