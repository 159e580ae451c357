#include "weld/frontend/lexer.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace weld::frontend {

namespace {

auto IsIdentStart(char c) -> bool {
  auto u = static_cast<unsigned char>(c);
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
         c == '$' || c == '\\' || u >= 0x80;
}

auto IsIdentPart(char c) -> bool {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}

auto IsDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

// Keywords after which an expression (and therefore a regex) may start.
constexpr std::array<std::string_view, 16> kExpressionKeywords = {
    "return", "typeof", "instanceof", "in",    "of",   "new",
    "delete", "void",   "throw",      "case",  "do",   "else",
    "yield",  "await",  "extends",    "export",
};

// Longest first.
constexpr std::array<std::string_view, 51> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=",
    "||=",  "??=", "=>",  "==",  "!=",  "<=",  ">=",  "&&",  "||",
    "??",   "?.",  "++",  "--",  "+=",  "-=",  "*=",  "/=",  "%=",
    "&=",   "|=",  "^=",  "**",  "<<",  ">>",  "{",   "}",   "(",
    ")",    "[",   "]",   ";",   ",",   "<",   ">",   "+",   "-",
    "*",    "/",   "%",   "&",   "|",   "^",
};

constexpr std::array<std::string_view, 8> kSingleCharPunctuators = {
    "!", "~", "?", ":", "=", ".", "@", "#",
};

}  // namespace

auto Lexer::Tokenize() -> Result<std::vector<Token>> {
  std::vector<Token> tokens;
  // Hashbang line.
  if (source_.starts_with("#!")) {
    while (!AtEnd() && Peek() != '\n') {
      ++pos_;
    }
  }
  while (true) {
    auto token = Next();
    if (!token) {
      return std::unexpected(std::move(token.error()));
    }
    tokens.push_back(*token);
    if (token->kind == TokenKind::kEof) {
      return tokens;
    }
    previous_ = *token;
    has_previous_ = true;
  }
}

auto Lexer::Error(std::string_view message) const -> Diagnostic {
  return Diagnostic::Error(
      "", fmt::format("{} (line {})", message, token_line_ + 1));
}

auto Lexer::MakeToken(TokenKind kind, uint32_t begin) -> Token {
  return Token{
      .kind = kind,
      .begin = begin,
      .end = pos_,
      .line = token_line_,
      .newline_before = false,
      .text = source_.substr(begin, pos_ - begin),
  };
}

auto Lexer::SkipTrivia() -> Result<bool> {
  bool newline = false;
  while (!AtEnd()) {
    char c = Peek();
    if (c == '\n') {
      newline = true;
      ++line_;
      ++pos_;
    } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
      ++pos_;
    } else if (c == '/' && Peek(1) == '/') {
      while (!AtEnd() && Peek() != '\n') {
        ++pos_;
      }
    } else if (c == '/' && Peek(1) == '*') {
      token_line_ = line_;
      pos_ += 2;
      while (true) {
        if (AtEnd()) {
          return std::unexpected(Error("unterminated comment"));
        }
        if (Peek() == '*' && Peek(1) == '/') {
          pos_ += 2;
          break;
        }
        if (Peek() == '\n') {
          newline = true;
          ++line_;
        }
        ++pos_;
      }
    } else {
      break;
    }
  }
  return newline;
}

auto Lexer::Next() -> Result<Token> {
  auto newline = SkipTrivia();
  if (!newline) {
    return std::unexpected(std::move(newline.error()));
  }
  token_line_ = line_;
  uint32_t begin = pos_;

  Result<Token> token;
  if (AtEnd()) {
    token = MakeToken(TokenKind::kEof, begin);
  } else {
    char c = Peek();
    if (IsIdentStart(c) || (c == '#' && IsIdentStart(Peek(1)))) {
      token = ScanIdentifier();
    } else if (IsDigit(c) || (c == '.' && IsDigit(Peek(1)))) {
      token = ScanNumber();
    } else if (c == '"' || c == '\'') {
      token = ScanString();
    } else if (c == '`') {
      ++pos_;
      token = ScanTemplate(begin);
    } else if (
        c == '}' && !brace_stack_.empty() && brace_stack_.back()) {
      brace_stack_.pop_back();
      ++pos_;
      token = ScanTemplate(begin);
    } else if (c == '/' && RegexAllowed()) {
      token = ScanRegex();
    } else {
      token = ScanPunctuator();
    }
  }
  if (token) {
    token->newline_before = *newline;
  }
  return token;
}

auto Lexer::ScanIdentifier() -> Token {
  uint32_t begin = pos_;
  if (Peek() == '#') {
    ++pos_;
  }
  while (!AtEnd() && IsIdentPart(Peek())) {
    // \uXXXX escapes inside identifiers are kept as-is.
    if (Peek() == '\\') {
      pos_ += 2;
      continue;
    }
    ++pos_;
  }
  return MakeToken(TokenKind::kIdentifier, begin);
}

auto Lexer::ScanNumber() -> Token {
  uint32_t begin = pos_;
  bool hex = Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X');
  while (!AtEnd()) {
    char c = Peek();
    if (IsIdentPart(c) || c == '.') {
      ++pos_;
    } else if (
        (c == '+' || c == '-') && !hex &&
        (source_[pos_ - 1] == 'e' || source_[pos_ - 1] == 'E')) {
      ++pos_;
    } else {
      break;
    }
  }
  return MakeToken(TokenKind::kNumber, begin);
}

auto Lexer::ScanString() -> Result<Token> {
  uint32_t begin = pos_;
  char quote = Peek();
  ++pos_;
  while (true) {
    if (AtEnd() || Peek() == '\n') {
      return std::unexpected(Error("unterminated string literal"));
    }
    char c = Peek();
    if (c == '\\') {
      if (Peek(1) == '\n') {
        ++line_;
      }
      pos_ += 2;
      continue;
    }
    ++pos_;
    if (c == quote) {
      return MakeToken(TokenKind::kString, begin);
    }
  }
}

// Continues after the opening '`' or the '}' closing a substitution.
auto Lexer::ScanTemplate(uint32_t begin) -> Result<Token> {
  bool opened_by_backtick = source_[begin] == '`';
  while (true) {
    if (AtEnd()) {
      return std::unexpected(Error("unterminated template literal"));
    }
    char c = Peek();
    if (c == '\\') {
      if (Peek(1) == '\n') {
        ++line_;
      }
      pos_ += 2;
      continue;
    }
    if (c == '\n') {
      ++line_;
    }
    if (c == '`') {
      ++pos_;
      return MakeToken(
          opened_by_backtick ? TokenKind::kTemplate : TokenKind::kTemplateTail,
          begin);
    }
    if (c == '$' && Peek(1) == '{') {
      pos_ += 2;
      brace_stack_.push_back(true);
      return MakeToken(
          opened_by_backtick ? TokenKind::kTemplateHead
                             : TokenKind::kTemplateMiddle,
          begin);
    }
    ++pos_;
  }
}

auto Lexer::ScanRegex() -> Result<Token> {
  uint32_t begin = pos_;
  ++pos_;
  bool in_class = false;
  while (true) {
    if (AtEnd() || Peek() == '\n') {
      return std::unexpected(Error("unterminated regular expression"));
    }
    char c = Peek();
    if (c == '\\') {
      pos_ += 2;
      continue;
    }
    ++pos_;
    if (c == '[') {
      in_class = true;
    } else if (c == ']') {
      in_class = false;
    } else if (c == '/' && !in_class) {
      break;
    }
  }
  while (!AtEnd() && IsIdentPart(Peek())) {
    ++pos_;
  }
  return MakeToken(TokenKind::kRegex, begin);
}

auto Lexer::ScanPunctuator() -> Token {
  uint32_t begin = pos_;
  std::string_view rest = source_.substr(pos_);
  std::string_view match;
  for (std::string_view punct : kPunctuators) {
    if (rest.starts_with(punct)) {
      match = punct;
      break;
    }
  }
  // `a?.5:b` is a conditional, not optional chaining.
  if (match == "?." && rest.size() > 2 && IsDigit(rest[2])) {
    match = {};
  }
  if (match.empty()) {
    for (std::string_view punct : kSingleCharPunctuators) {
      if (rest.starts_with(punct)) {
        match = punct;
        break;
      }
    }
  }
  if (match.empty()) {
    // Unknown character: one opaque byte. The scanner copies it through.
    match = rest.substr(0, 1);
  }
  pos_ += static_cast<uint32_t>(match.size());
  if (match == "{") {
    brace_stack_.push_back(false);
  } else if (match == "}" && !brace_stack_.empty()) {
    brace_stack_.pop_back();
  }
  return MakeToken(TokenKind::kPunctuator, begin);
}

auto Lexer::RegexAllowed() const -> bool {
  if (!has_previous_) {
    return true;
  }
  switch (previous_.kind) {
    case TokenKind::kEof:
      return true;
    case TokenKind::kIdentifier:
      for (std::string_view keyword : kExpressionKeywords) {
        if (previous_.text == keyword) {
          return true;
        }
      }
      return false;
    case TokenKind::kNumber:
    case TokenKind::kString:
    case TokenKind::kRegex:
    case TokenKind::kTemplate:
    case TokenKind::kTemplateTail:
      return false;
    case TokenKind::kTemplateHead:
    case TokenKind::kTemplateMiddle:
      return true;
    case TokenKind::kPunctuator:
      return previous_.text != ")" && previous_.text != "]" &&
             previous_.text != "++" && previous_.text != "--";
  }
  return true;
}

}  // namespace weld::frontend
