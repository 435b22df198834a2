#include "lexer.hpp"
#include <cctype>
#include <unordered_map>

namespace shade {

namespace {

const std::unordered_map<std::string_view, TokenKind> keywords = {
    {"in", TokenKind::KwIn},
    {"out", TokenKind::KwOut},
    {"fn", TokenKind::KwFn},
    {"return", TokenKind::KwReturn},
};

bool is_ident_start(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) {
  return is_ident_start(c) || (c >= '0' && c <= '9');
}

}  // namespace

const char* token_kind_name(TokenKind k) {
  switch (k) {
    case TokenKind::EndOfFile: return "end of file";
    case TokenKind::Invalid: return "invalid token";
    case TokenKind::IntLiteral: return "integer literal";
    case TokenKind::FloatLiteral: return "decimal literal";
    case TokenKind::Identifier: return "identifier";
    case TokenKind::KwIn: return "'in'";
    case TokenKind::KwOut: return "'out'";
    case TokenKind::KwFn: return "'fn'";
    case TokenKind::KwReturn: return "'return'";
    case TokenKind::Semicolon: return "';'";
    case TokenKind::Comma: return "','";
    case TokenKind::Colon: return "':'";
    case TokenKind::Eq: return "'='";
    case TokenKind::Plus: return "'+'";
    case TokenKind::Minus: return "'-'";
    case TokenKind::Star: return "'*'";
    case TokenKind::Slash: return "'/'";
    case TokenKind::Exclaim: return "'!'";
    case TokenKind::LParen: return "'('";
    case TokenKind::RParen: return "')'";
    case TokenKind::LBrace: return "'{'";
    case TokenKind::RBrace: return "'}'";
  }
  return "token";
}

Lexer::Lexer(std::string_view source) : source_(source) {
  current_.loc = loc_;
  // First token is obtained by first call to next()
}

char Lexer::peek_char() const {
  return peek_char(0);
}

char Lexer::peek_char(size_t offset) const {
  if (pos_ + offset >= source_.size()) return '\0';
  return source_[pos_ + offset];
}

char Lexer::consume() {
  if (pos_ >= source_.size()) return '\0';
  char c = source_[pos_++];
  if (c == '\n') {
    loc_.line++;
    loc_.column = 1;
  } else {
    loc_.column++;
  }
  loc_.offset = static_cast<uint32_t>(pos_);
  return c;
}

void Lexer::skip_line_comment() {
  while (peek_char() && peek_char() != '\n') consume();
}

void Lexer::skip_block_comment() {
  int depth = 1;
  while (depth > 0 && peek_char()) {
    if (peek_char() == '/' && peek_char(1) == '*') {
      consume(), consume();
      depth++;
    } else if (peek_char() == '*' && peek_char(1) == '/') {
      consume(), consume();
      depth--;
    } else {
      consume();
    }
  }
}

Token Lexer::lex_number() {
  SourceLoc start = loc_;
  size_t start_pos = pos_;
  bool is_float = false;
  while (std::isdigit(static_cast<unsigned char>(peek_char()))) consume();
  if (peek_char() == '.' && std::isdigit(static_cast<unsigned char>(peek_char(1)))) {
    consume();
    is_float = true;
    while (std::isdigit(static_cast<unsigned char>(peek_char()))) consume();
  }
  if (peek_char() == 'e' || peek_char() == 'E') {
    size_t digits_at = (peek_char(1) == '+' || peek_char(1) == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek_char(digits_at)))) {
      for (size_t i = 0; i < digits_at; ++i) consume();
      while (std::isdigit(static_cast<unsigned char>(peek_char()))) consume();
      is_float = true;
    }
  }
  Token t;
  t.kind = is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral;
  t.loc = start;
  t.text = source_.substr(start_pos, pos_ - start_pos);
  return t;
}

Token Lexer::lex_identifier_or_keyword() {
  SourceLoc start = loc_;
  size_t start_pos = pos_;
  while (is_ident_char(peek_char())) consume();
  std::string_view text = source_.substr(start_pos, pos_ - start_pos);
  auto it = keywords.find(text);
  Token t;
  t.kind = it != keywords.end() ? it->second : TokenKind::Identifier;
  t.loc = start;
  t.text = text;
  return t;
}

Token Lexer::next() {
  while (true) {
    size_t token_start = pos_;
    current_.loc = loc_;

    char c = peek_char();
    if (!c) {
      current_.kind = TokenKind::EndOfFile;
      current_.text = {};
      return current_;
    }

    if (c == '/') {
      if (peek_char(1) == '/') {
        consume(), consume();
        skip_line_comment();
        continue;
      }
      if (peek_char(1) == '*') {
        consume(), consume();
        skip_block_comment();
        continue;
      }
    }

    if (std::isspace(static_cast<unsigned char>(c))) {
      consume();
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
      current_ = lex_number();
      return current_;
    }

    if (is_ident_start(c)) {
      current_ = lex_identifier_or_keyword();
      return current_;
    }

    consume();
    current_.text = source_.substr(token_start, 1);

    switch (c) {
      case ';': current_.kind = TokenKind::Semicolon; return current_;
      case ',': current_.kind = TokenKind::Comma; return current_;
      case ':': current_.kind = TokenKind::Colon; return current_;
      case '=': current_.kind = TokenKind::Eq; return current_;
      case '+': current_.kind = TokenKind::Plus; return current_;
      case '-': current_.kind = TokenKind::Minus; return current_;
      case '*': current_.kind = TokenKind::Star; return current_;
      case '/': current_.kind = TokenKind::Slash; return current_;
      case '!': current_.kind = TokenKind::Exclaim; return current_;
      case '(': current_.kind = TokenKind::LParen; return current_;
      case ')': current_.kind = TokenKind::RParen; return current_;
      case '{': current_.kind = TokenKind::LBrace; return current_;
      case '}': current_.kind = TokenKind::RBrace; return current_;
      default:
        current_.kind = TokenKind::Invalid;
        return current_;
    }
  }
}

}  // namespace shade
