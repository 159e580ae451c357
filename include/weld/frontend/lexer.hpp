#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld::frontend {

enum class TokenKind : uint8_t {
  kEof,
  kIdentifier,  // Identifiers, keywords and #private names
  kPunctuator,
  kString,
  kNumber,
  kRegex,
  kTemplate,        // `...` without substitutions
  kTemplateHead,    // `...${
  kTemplateMiddle,  // }...${
  kTemplateTail,    // }...`
};

struct Token {
  TokenKind kind = TokenKind::kEof;
  uint32_t begin = 0;  // Byte offsets into the source
  uint32_t end = 0;
  uint32_t line = 0;  // 0-based line of `begin`
  bool newline_before = false;
  std::string_view text;

  [[nodiscard]] auto Is(TokenKind k, std::string_view t) const -> bool {
    return kind == k && text == t;
  }
  [[nodiscard]] auto IsPunct(std::string_view t) const -> bool {
    return Is(TokenKind::kPunctuator, t);
  }
  [[nodiscard]] auto IsIdent(std::string_view t) const -> bool {
    return Is(TokenKind::kIdentifier, t);
  }
};

// Tokenizer for the JavaScript subset the module scanner needs. Comments and
// whitespace are skipped; the gaps between tokens stay recoverable from the
// offsets. `/` is read as a regular expression or as division depending on
// the previous token.
class Lexer {
 public:
  explicit Lexer(std::string_view source) : source_(source) {
  }

  // The full token stream, always terminated by one kEof token.
  auto Tokenize() -> Result<std::vector<Token>>;

 private:
  auto Next() -> Result<Token>;
  auto SkipTrivia() -> Result<bool>;  // Returns whether a newline was seen
  auto ScanIdentifier() -> Token;
  auto ScanNumber() -> Token;
  auto ScanString() -> Result<Token>;
  auto ScanTemplate(uint32_t begin) -> Result<Token>;
  auto ScanRegex() -> Result<Token>;
  auto ScanPunctuator() -> Token;
  [[nodiscard]] auto RegexAllowed() const -> bool;
  auto MakeToken(TokenKind kind, uint32_t begin) -> Token;
  auto Error(std::string_view message) const -> Diagnostic;

  [[nodiscard]] auto Peek(uint32_t ahead = 0) const -> char {
    return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
  }
  [[nodiscard]] auto AtEnd() const -> bool {
    return pos_ >= source_.size();
  }

  std::string_view source_;
  uint32_t pos_ = 0;
  uint32_t line_ = 0;
  uint32_t token_line_ = 0;
  // One entry per open '{' or template substitution: true for `${`.
  std::vector<bool> brace_stack_;
  Token previous_;
  bool has_previous_ = false;
};

}  // namespace weld::frontend
