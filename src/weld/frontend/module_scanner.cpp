#include "weld/frontend/module_scanner.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "weld/common/path_utils.hpp"
#include "weld/frontend/lexer.hpp"

namespace weld::frontend {

namespace {

using graph::StatementKind;

// Inclusive token index range of one top-level statement.
struct Range {
  size_t first = 0;
  size_t last = 0;
};

constexpr std::array<std::string_view, 48> kKeywords = {
    "break",      "case",      "catch",   "class",     "const",  "continue",
    "debugger",   "default",   "delete",  "do",        "else",   "export",
    "extends",    "false",     "finally", "for",       "function", "if",
    "import",     "in",        "instanceof", "new",    "null",   "return",
    "super",      "switch",    "this",    "throw",     "true",   "try",
    "typeof",     "var",       "void",    "while",     "with",   "yield",
    "let",        "static",    "await",   "async",     "of",     "get",
    "set",        "implements", "interface", "package", "private", "protected",
};

// Keywords that cannot end a statement, so a newline after them never
// inserts a semicolon.
constexpr std::array<std::string_view, 20> kContinuationKeywords = {
    "else",   "do",         "try",     "finally", "new",    "typeof", "void",
    "delete", "in",         "of",      "instanceof", "extends", "case",
    "export", "import",     "default", "function", "class", "async",
    "await",
};

auto IsKeyword(std::string_view text) -> bool {
  return std::ranges::find(kKeywords, text) != kKeywords.end();
}

auto IsOpener(const Token& token) -> bool {
  return token.IsPunct("(") || token.IsPunct("[") || token.IsPunct("{") ||
         token.kind == TokenKind::kTemplateHead;
}

auto IsCloser(const Token& token) -> bool {
  return token.IsPunct(")") || token.IsPunct("]") || token.IsPunct("}") ||
         token.kind == TokenKind::kTemplateTail;
}

auto EndsExpression(const Token& token) -> bool {
  switch (token.kind) {
    case TokenKind::kIdentifier:
      return std::ranges::find(kContinuationKeywords, token.text) ==
             kContinuationKeywords.end();
    case TokenKind::kNumber:
    case TokenKind::kString:
    case TokenKind::kRegex:
    case TokenKind::kTemplate:
    case TokenKind::kTemplateTail:
      return true;
    case TokenKind::kPunctuator:
      return token.text == ")" || token.text == "]" || token.text == "}" ||
             token.text == "++" || token.text == "--";
    case TokenKind::kEof:
    case TokenKind::kTemplateHead:
    case TokenKind::kTemplateMiddle:
      return false;
  }
  return false;
}

auto StartsStatement(const Token& token) -> bool {
  switch (token.kind) {
    case TokenKind::kIdentifier:
      return token.text != "in" && token.text != "of" &&
             token.text != "instanceof" && token.text != "else" &&
             token.text != "catch" && token.text != "finally";
    case TokenKind::kNumber:
    case TokenKind::kString:
    case TokenKind::kTemplate:
    case TokenKind::kTemplateHead:
      return true;
    case TokenKind::kPunctuator:
      return token.text == "{" || token.text == "!" || token.text == "~" ||
             token.text == "++" || token.text == "--" || token.text == "@";
    case TokenKind::kEof:
    case TokenKind::kRegex:
    case TokenKind::kTemplateMiddle:
    case TokenKind::kTemplateTail:
      return false;
  }
  return false;
}

auto Unquote(std::string_view literal) -> std::string {
  if (literal.size() < 2) {
    return std::string(literal);
  }
  return std::string(literal.substr(1, literal.size() - 2));
}

// One top-level statement after classification, before its pieces are built.
struct PendingStatement {
  Range range;
  StatementKind kind = StatementKind::kPlain;
  // Tokens that declare a top-level binding.
  std::vector<size_t> binding_tokens;
  // Synthesized pieces placed before the range (`var m_default = `).
  std::vector<graph::Piece> prefix;
  bool append_semicolon = false;
  std::vector<uint32_t> declared;
};

class Scanner {
 public:
  Scanner(
      ModuleId id, std::string_view source, std::string_view path,
      std::vector<Token> tokens)
      : id_(id),
        source_(source),
        path_(path),
        name_(common::LegalIdentifierFromPath(path)),
        tokens_(std::move(tokens)) {
  }

  auto Run() -> Result<ScanResult> {
    result_.symbol_names.push_back(name_ + "_exports");

    auto ranges = SplitStatements();
    bool first = true;
    for (const Range& range : ranges) {
      if (first && IsUseStrictDirective(range)) {
        result_.ast.contains_use_strict = true;
        first = false;
        continue;
      }
      first = false;
      if (auto classified = Classify(range); !classified) {
        return std::unexpected(std::move(classified.error()));
      }
    }

    for (auto& [exported, local_name] : pending_exports_) {
      auto it = bindings_.find(local_name);
      if (it == bindings_.end()) {
        return std::unexpected(Diagnostic::Error(
            path_, fmt::format(
                       "\"{}\" is exported but not declared in this module",
                       local_name)));
      }
      result_.local_exports.push_back(
          graph::LocalExport{.exported = exported, .local = it->second});
    }

    for (auto& pending : statements_) {
      result_.ast.statements.push_back(BuildStatement(pending));
    }

    result_.exports_kind = ComputeExportsKind();
    return std::move(result_);
  }

 private:
  auto At(size_t i) const -> const Token& {
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
  }

  auto Malformed(std::string_view what, size_t at) const -> Diagnostic {
    return Diagnostic::Error(
        path_, fmt::format("malformed {} (line {})", what, At(at).line + 1));
  }

  // Top-level statements end at a depth-0 `;`, or at a newline where
  // automatic semicolon insertion would apply.
  auto SplitStatements() const -> std::vector<Range> {
    std::vector<Range> ranges;
    std::vector<size_t> openers;
    // Closing parens of `if (...)`-style headers; a newline after one does
    // not end the statement.
    std::vector<bool> header_close(tokens_.size(), false);
    size_t eof = tokens_.size() - 1;
    size_t start = 0;

    for (size_t i = 0; i < eof; ++i) {
      const Token& token = tokens_[i];
      if (i > start && openers.empty() && token.newline_before &&
          EndsExpression(tokens_[i - 1]) && !header_close[i - 1] &&
          StartsStatement(token)) {
        ranges.push_back(Range{.first = start, .last = i - 1});
        start = i;
      }
      if (IsOpener(token)) {
        openers.push_back(i);
      } else if (IsCloser(token) && !openers.empty()) {
        size_t opener = openers.back();
        openers.pop_back();
        if (token.IsPunct(")") && opener > 0) {
          const Token& keyword = tokens_[opener - 1];
          header_close[i] = keyword.IsIdent("if") || keyword.IsIdent("for") ||
                            keyword.IsIdent("while") ||
                            keyword.IsIdent("with");
        }
      }
      if (token.IsPunct(";") && openers.empty()) {
        if (i > start) {
          ranges.push_back(Range{.first = start, .last = i});
        }
        start = i + 1;
      }
    }
    if (start < eof) {
      ranges.push_back(Range{.first = start, .last = eof - 1});
    }
    return ranges;
  }

  auto IsUseStrictDirective(const Range& range) const -> bool {
    const Token& token = tokens_[range.first];
    if (token.kind != TokenKind::kString ||
        Unquote(token.text) != "use strict") {
      return false;
    }
    return range.first == range.last ||
           (range.last == range.first + 1 && tokens_[range.last].IsPunct(";"));
  }

  auto DeclareLocal(std::string_view name) -> uint32_t {
    auto it = bindings_.find(absl::string_view(name.data(), name.size()));
    if (it != bindings_.end()) {
      return it->second;
    }
    auto local = NewSymbol(std::string(name));
    bindings_.emplace(std::string(name), local);
    return local;
  }

  // A symbol the source cannot name directly.
  auto NewSymbol(std::string name) -> uint32_t {
    result_.symbol_names.push_back(std::move(name));
    return static_cast<uint32_t>(result_.symbol_names.size() - 1);
  }

  auto AddRecord(std::string request, graph::ImportKind kind)
      -> ImportRecordId {
    auto local =
        NewSymbol("import_" + common::LegalIdentifierFromPath(request));
    result_.import_records.emplace_back(
        std::move(request), kind, SymbolRef{.owner = id_, .symbol = local});
    return ImportRecordId{
        static_cast<uint32_t>(result_.import_records.size() - 1)};
  }

  static void MarkBinding(
      graph::RawImportRecord& record, std::string_view imported) {
    if (imported == "default") {
      record.contains_import_default = true;
    } else {
      record.contains_import_named = true;
    }
  }

  auto Classify(const Range& range) -> Result<void> {
    const Token& head = tokens_[range.first];
    if (range.first == range.last && head.IsPunct(";")) {
      return {};
    }
    const Token& next = At(range.first + 1);
    if (head.IsIdent("import") && !next.IsPunct("(") && !next.IsPunct(".")) {
      has_module_syntax_ = true;
      return ParseImport(range);
    }
    if (head.IsIdent("export")) {
      has_module_syntax_ = true;
      return ParseExport(range);
    }
    PendingStatement pending{.range = range};
    if (IsDeclarationStart(range.first)) {
      if (auto parsed = ParseDeclaration(range, pending); !parsed) {
        return std::unexpected(std::move(parsed.error()));
      }
    }
    statements_.push_back(std::move(pending));
    return {};
  }

  auto IsDeclarationStart(size_t i) const -> bool {
    const Token& token = At(i);
    const Token& next = At(i + 1);
    if (token.IsIdent("var") || token.IsIdent("const") ||
        token.IsIdent("function") || token.IsIdent("class")) {
      return true;
    }
    if (token.IsIdent("let")) {
      return next.kind == TokenKind::kIdentifier || next.IsPunct("[") ||
             next.IsPunct("{");
    }
    return token.IsIdent("async") && next.IsIdent("function") &&
           !next.newline_before;
  }

  auto ParseDeclaration(const Range& range, PendingStatement& pending)
      -> Result<void> {
    size_t i = range.first;
    const Token& keyword = tokens_[i];
    if (keyword.IsIdent("var") || keyword.IsIdent("let") ||
        keyword.IsIdent("const")) {
      pending.kind = StatementKind::kVariableDeclaration;
      ++i;
      while (true) {
        auto after = ParsePattern(i, range.last, pending.binding_tokens);
        if (!after) {
          return std::unexpected(Malformed("variable declaration", i));
        }
        i = *after;
        if (i <= range.last && tokens_[i].IsPunct("=")) {
          i = SkipExpression(i + 1, range.last);
        }
        if (i <= range.last && tokens_[i].IsPunct(",")) {
          ++i;
          continue;
        }
        break;
      }
    } else {
      if (keyword.IsIdent("async")) {
        ++i;
      }
      pending.kind = tokens_[i].IsIdent("class")
                         ? StatementKind::kClassDeclaration
                         : StatementKind::kFunctionDeclaration;
      ++i;
      if (At(i).IsPunct("*")) {
        ++i;
      }
      if (i > range.last || At(i).kind != TokenKind::kIdentifier) {
        return std::unexpected(Malformed("declaration", i));
      }
      pending.binding_tokens.push_back(i);
    }
    for (size_t token : pending.binding_tokens) {
      pending.declared.push_back(DeclareLocal(tokens_[token].text));
    }
    return {};
  }

  // Binding identifier, object pattern or array pattern starting at `i`.
  // Returns the index after it.
  auto ParsePattern(size_t i, size_t last, std::vector<size_t>& bindings) const
      -> std::optional<size_t> {
    if (i > last) {
      return std::nullopt;
    }
    const Token& token = tokens_[i];
    if (token.kind == TokenKind::kIdentifier) {
      bindings.push_back(i);
      return i + 1;
    }
    if (token.IsPunct("[")) {
      ++i;
      while (i <= last) {
        if (tokens_[i].IsPunct("]")) {
          return i + 1;
        }
        if (tokens_[i].IsPunct(",")) {
          ++i;
          continue;
        }
        if (tokens_[i].IsPunct("...")) {
          ++i;
        }
        auto after = ParsePattern(i, last, bindings);
        if (!after) {
          return std::nullopt;
        }
        i = *after;
        if (i <= last && tokens_[i].IsPunct("=")) {
          i = SkipExpression(i + 1, last);
        }
      }
      return std::nullopt;
    }
    if (token.IsPunct("{")) {
      ++i;
      while (i <= last) {
        if (tokens_[i].IsPunct("}")) {
          return i + 1;
        }
        if (tokens_[i].IsPunct(",")) {
          ++i;
          continue;
        }
        if (tokens_[i].IsPunct("...")) {
          auto after = ParsePattern(i + 1, last, bindings);
          if (!after) {
            return std::nullopt;
          }
          i = *after;
          continue;
        }
        size_t key = i;
        if (tokens_[i].IsPunct("[")) {
          i = SkipExpression(i + 1, last) + 1;
        } else {
          ++i;
        }
        if (i <= last && tokens_[i].IsPunct(":")) {
          auto after = ParsePattern(i + 1, last, bindings);
          if (!after) {
            return std::nullopt;
          }
          i = *after;
        } else if (tokens_[key].kind == TokenKind::kIdentifier) {
          bindings.push_back(key);
        } else {
          return std::nullopt;
        }
        if (i <= last && tokens_[i].IsPunct("=")) {
          i = SkipExpression(i + 1, last);
        }
      }
      return std::nullopt;
    }
    return std::nullopt;
  }

  // Index of the first depth-0 `,` or unmatched closer at or after `i`.
  auto SkipExpression(size_t i, size_t last) const -> size_t {
    int depth = 0;
    for (; i <= last; ++i) {
      const Token& token = tokens_[i];
      if (IsOpener(token)) {
        ++depth;
      } else if (IsCloser(token)) {
        if (depth == 0) {
          return i;
        }
        --depth;
      } else if (depth == 0 && (token.IsPunct(",") || token.IsPunct(";"))) {
        return i;
      }
    }
    return i;
  }

  // Parses `{ a, b as c, "d" as e }` starting at the `{`, leaving `i` after
  // the `}`. `second` equals `first` when there is no `as`.
  struct Specifier {
    std::string first;
    std::string second;
  };
  auto ParseSpecifiers(size_t& i, size_t last) const
      -> std::optional<std::vector<Specifier>> {
    std::vector<Specifier> specifiers;
    ++i;
    while (i <= last && !tokens_[i].IsPunct("}")) {
      const Token& name = tokens_[i];
      if (name.kind != TokenKind::kIdentifier &&
          name.kind != TokenKind::kString) {
        return std::nullopt;
      }
      // TypeScript inline `type` specifiers carry no runtime binding.
      if (name.IsIdent("type") && At(i + 1).kind == TokenKind::kIdentifier &&
          !At(i + 1).IsIdent("as")) {
        i += 2;
      } else {
        Specifier spec{
            .first = name.kind == TokenKind::kString ? Unquote(name.text)
                                                     : std::string(name.text),
            .second = {}};
        ++i;
        if (At(i).IsIdent("as")) {
          const Token& alias = At(i + 1);
          if (alias.kind != TokenKind::kIdentifier &&
              alias.kind != TokenKind::kString) {
            return std::nullopt;
          }
          spec.second = alias.kind == TokenKind::kString
                            ? Unquote(alias.text)
                            : std::string(alias.text);
          i += 2;
        } else {
          spec.second = spec.first;
        }
        specifiers.push_back(std::move(spec));
      }
      if (At(i).IsPunct(",")) {
        ++i;
      }
    }
    if (i > last) {
      return std::nullopt;
    }
    ++i;
    return specifiers;
  }

  auto ParseImport(const Range& range) -> Result<void> {
    size_t i = range.first + 1;
    if (At(i).kind == TokenKind::kString) {
      AddRecord(Unquote(At(i).text), graph::ImportKind::kImport);
      return {};
    }
    if (At(i).IsIdent("type") && !At(i + 1).IsPunct(",") &&
        !At(i + 1).IsIdent("from")) {
      return {};
    }

    std::optional<std::string> default_local;
    std::optional<std::string> namespace_local;
    std::vector<Specifier> named;
    if (At(i).kind == TokenKind::kIdentifier) {
      default_local = std::string(At(i).text);
      ++i;
      if (At(i).IsPunct(",")) {
        ++i;
      }
    }
    if (At(i).IsPunct("*")) {
      if (!At(i + 1).IsIdent("as") ||
          At(i + 2).kind != TokenKind::kIdentifier) {
        return std::unexpected(Malformed("import declaration", i));
      }
      namespace_local = std::string(At(i + 2).text);
      i += 3;
    } else if (At(i).IsPunct("{")) {
      auto specifiers = ParseSpecifiers(i, range.last);
      if (!specifiers) {
        return std::unexpected(Malformed("import declaration", i));
      }
      named = std::move(*specifiers);
    }
    if (!At(i).IsIdent("from") || At(i + 1).kind != TokenKind::kString) {
      return std::unexpected(Malformed("import declaration", i));
    }

    auto record =
        AddRecord(Unquote(At(i + 1).text), graph::ImportKind::kImport);
    auto& raw = result_.import_records[record.value];
    if (default_local) {
      raw.contains_import_default = true;
      result_.named_imports.push_back(
          graph::NamedImport{
              .local = DeclareLocal(*default_local),
              .record = record,
              .imported = "default"});
    }
    if (namespace_local) {
      raw.contains_import_star = true;
      result_.named_imports.push_back(
          graph::NamedImport{
              .local = DeclareLocal(*namespace_local),
              .record = record,
              .imported = "*"});
    }
    for (auto& spec : named) {
      MarkBinding(result_.import_records[record.value], spec.first);
      result_.named_imports.push_back(
          graph::NamedImport{
              .local = DeclareLocal(spec.second),
              .record = record,
              .imported = std::move(spec.first)});
    }
    return {};
  }

  auto ParseExport(const Range& range) -> Result<void> {
    size_t i = range.first + 1;
    const Token& token = At(i);

    if (token.IsPunct("*")) {
      std::optional<std::string> alias;
      ++i;
      if (At(i).IsIdent("as")) {
        const Token& name = At(i + 1);
        alias = name.kind == TokenKind::kString ? Unquote(name.text)
                                                : std::string(name.text);
        i += 2;
      }
      if (!At(i).IsIdent("from") || At(i + 1).kind != TokenKind::kString) {
        return std::unexpected(Malformed("export declaration", i));
      }
      auto record =
          AddRecord(Unquote(At(i + 1).text), graph::ImportKind::kImport);
      if (alias) {
        result_.import_records[record.value].contains_import_star = true;
        result_.re_exports.push_back(
            graph::ReExport{
                .exported = std::move(*alias),
                .record = record,
                .imported = "*"});
      } else {
        result_.star_exports.push_back(record);
      }
      return {};
    }

    if (token.IsPunct("{")) {
      auto specifiers = ParseSpecifiers(i, range.last);
      if (!specifiers) {
        return std::unexpected(Malformed("export declaration", i));
      }
      if (At(i).IsIdent("from")) {
        if (At(i + 1).kind != TokenKind::kString) {
          return std::unexpected(Malformed("export declaration", i));
        }
        auto record =
            AddRecord(Unquote(At(i + 1).text), graph::ImportKind::kImport);
        for (auto& spec : *specifiers) {
          MarkBinding(result_.import_records[record.value], spec.first);
          result_.re_exports.push_back(
              graph::ReExport{
                  .exported = std::move(spec.second),
                  .record = record,
                  .imported = std::move(spec.first)});
        }
        return {};
      }
      for (auto& spec : *specifiers) {
        pending_exports_.emplace_back(
            std::move(spec.second), std::move(spec.first));
      }
      return {};
    }

    if (token.IsIdent("default")) {
      return ParseExportDefault(Range{.first = i + 1, .last = range.last});
    }

    if (IsDeclarationStart(i)) {
      PendingStatement pending{.range = Range{.first = i, .last = range.last}};
      if (auto parsed = ParseDeclaration(pending.range, pending); !parsed) {
        return std::unexpected(std::move(parsed.error()));
      }
      for (size_t binding : pending.binding_tokens) {
        std::string name(tokens_[binding].text);
        pending_exports_.emplace_back(name, name);
      }
      statements_.push_back(std::move(pending));
      return {};
    }

    // TypeScript-only exports (types, interfaces) have no runtime form.
    if (token.IsIdent("type") || token.IsIdent("interface") ||
        token.IsIdent("declare")) {
      return {};
    }
    return std::unexpected(Malformed("export declaration", i));
  }

  auto ParseExportDefault(const Range& range) -> Result<void> {
    if (range.first > range.last) {
      return std::unexpected(Malformed("export default", range.first));
    }
    size_t i = range.first;
    bool is_async = At(i).IsIdent("async") && At(i + 1).IsIdent("function");
    size_t keyword = is_async ? i + 1 : i;
    bool is_function = At(keyword).IsIdent("function");
    bool is_class = At(keyword).IsIdent("class");

    if (is_function || is_class) {
      size_t name = keyword + 1;
      if (is_function && At(name).IsPunct("*")) {
        ++name;
      }
      if (At(name).kind == TokenKind::kIdentifier &&
          !At(name).IsIdent("extends")) {
        // Named: an ordinary declaration exported as "default".
        PendingStatement pending{.range = range};
        if (auto parsed = ParseDeclaration(range, pending); !parsed) {
          return std::unexpected(std::move(parsed.error()));
        }
        pending_exports_.emplace_back("default", std::string(At(name).text));
        statements_.push_back(std::move(pending));
        return {};
      }
      // Anonymous: give it the module's default name.
      auto local = NewSymbol(name_ + "_default");
      std::string head(
          source_.substr(At(i).begin, At(name - 1).end - At(i).begin));
      PendingStatement pending{
          .range = Range{.first = name, .last = range.last},
          .kind = is_class ? StatementKind::kClassDeclaration
                           : StatementKind::kFunctionDeclaration,
          .binding_tokens = {},
          .prefix =
              {graph::TextPiece{head + " "}, graph::SymbolPiece{.local = local},
               graph::TextPiece{" "}},
          .append_semicolon = false,
          .declared = {local}};
      result_.local_exports.push_back(
          graph::LocalExport{.exported = "default", .local = local});
      statements_.push_back(std::move(pending));
      return {};
    }

    // Expression: `var <name>_default = <expr>;`
    auto local = NewSymbol(name_ + "_default");
    PendingStatement pending{
        .range = range,
        .kind = StatementKind::kVariableDeclaration,
        .binding_tokens = {},
        .prefix =
            {graph::TextPiece{"var "}, graph::SymbolPiece{.local = local},
             graph::TextPiece{" = "}},
        .append_semicolon = !tokens_[range.last].IsPunct(";"),
        .declared = {local}};
    result_.local_exports.push_back(
        graph::LocalExport{.exported = "default", .local = local});
    statements_.push_back(std::move(pending));
    return {};
  }

  // Innermost open bracket before token `i` is `{`.
  static auto InBraces(const std::vector<char>& brackets) -> bool {
    return !brackets.empty() && brackets.back() == '{';
  }

  auto IsObjectKey(size_t i, const std::vector<char>& brackets) const
      -> bool {
    const Token& prev = At(i - 1);
    return InBraces(brackets) && (prev.IsPunct("{") || prev.IsPunct(",")) &&
           At(i + 1).IsPunct(":");
  }

  // `name(...) {` inside braces: a method or nested function name.
  auto IsMethodName(size_t i, size_t last, const std::vector<char>& brackets)
      const -> bool {
    if (!InBraces(brackets) || !At(i + 1).IsPunct("(")) {
      return false;
    }
    int depth = 0;
    for (size_t j = i + 1; j <= last; ++j) {
      if (IsOpener(tokens_[j])) {
        ++depth;
      } else if (IsCloser(tokens_[j])) {
        --depth;
        if (depth == 0) {
          return At(j + 1).IsPunct("{");
        }
      }
    }
    return false;
  }

  auto IsShorthand(size_t i, const std::vector<char>& brackets, bool binding)
      const -> bool {
    const Token& prev = At(i - 1);
    const Token& next = At(i + 1);
    return InBraces(brackets) && (prev.IsPunct("{") || prev.IsPunct(",")) &&
           (next.IsPunct(",") || next.IsPunct("}") ||
            (binding && next.IsPunct("=")));
  }

  void AddUnresolved(std::string_view name) {
    if (unresolved_seen_.insert(std::string(name)).second) {
      result_.unresolved_references.emplace_back(name);
    }
  }

  auto BuildStatement(PendingStatement& pending) -> graph::Statement {
    const Range& range = pending.range;
    graph::Statement statement{
        .kind = pending.kind,
        .pieces = std::move(pending.prefix),
        .declared = std::move(pending.declared),
        .line = tokens_[range.first].line};
    std::string text;
    auto flush = [&]() {
      if (!text.empty()) {
        statement.pieces.emplace_back(graph::TextPiece{std::move(text)});
        text.clear();
      }
    };

    absl::flat_hash_set<size_t> binding_tokens(
        pending.binding_tokens.begin(), pending.binding_tokens.end());
    bool split_keyword = pending.kind == StatementKind::kVariableDeclaration &&
                         statement.pieces.empty();
    std::vector<char> brackets;

    for (size_t i = range.first; i <= range.last; ++i) {
      const Token& token = tokens_[i];
      if (i > range.first) {
        const Token& prev = tokens_[i - 1];
        text += source_.substr(prev.end, token.begin - prev.end);
      }
      if (split_keyword && i == range.first + 1) {
        flush();
      }

      bool after_dot = i > range.first &&
                       (tokens_[i - 1].IsPunct(".") ||
                        tokens_[i - 1].IsPunct("?."));
      if (binding_tokens.contains(i)) {
        flush();
        statement.pieces.emplace_back(
            graph::SymbolPiece{
                .local = bindings_.at(absl::string_view(
                    token.text.data(), token.text.size())),
                .shorthand = IsShorthand(i, brackets, true)});
      } else if (token.kind == TokenKind::kIdentifier && !after_dot) {
        if (token.text == "require" && !bindings_.contains("require") &&
            At(i + 1).IsPunct("(") &&
            At(i + 2).kind == TokenKind::kString && At(i + 3).IsPunct(")") &&
            i + 3 <= range.last) {
          auto record = AddRecord(
              Unquote(At(i + 2).text), graph::ImportKind::kRequire);
          flush();
          statement.pieces.emplace_back(graph::RequirePiece{.record = record});
          i += 3;
          continue;
        }
        if (token.text == "import" && At(i + 1).IsPunct("(") &&
            At(i + 2).kind == TokenKind::kString && At(i + 3).IsPunct(")") &&
            i + 3 <= range.last) {
          auto record = AddRecord(
              Unquote(At(i + 2).text), graph::ImportKind::kDynamicImport);
          // The promise resolves to the target's namespace.
          result_.import_records[record.value].contains_import_star = true;
          flush();
          statement.pieces.emplace_back(
              graph::DynamicImportPiece{
                  .record = record,
                  .text = std::string(source_.substr(
                      token.begin, At(i + 3).end - token.begin))});
          i += 3;
          continue;
        }
        // With import attributes the call is kept as written.
        if (token.text == "import" && At(i + 1).IsPunct("(") &&
            At(i + 2).kind == TokenKind::kString && At(i + 3).IsPunct(",")) {
          AddRecord(Unquote(At(i + 2).text), graph::ImportKind::kDynamicImport);
          text += token.text;
        } else if (IsObjectKey(i, brackets) ||
                   IsMethodName(i, range.last, brackets)) {
          text += token.text;
        } else if (auto it = bindings_.find(
                       absl::string_view(token.text.data(), token.text.size()));
                   it != bindings_.end()) {
          flush();
          statement.pieces.emplace_back(
              graph::SymbolPiece{
                  .local = it->second,
                  .shorthand = IsShorthand(i, brackets, false)});
        } else {
          if (!IsKeyword(token.text) && token.text.front() != '#') {
            AddUnresolved(token.text);
          }
          text += token.text;
        }
      } else {
        text += token.text;
      }

      if (IsOpener(token)) {
        brackets.push_back(
            token.kind == TokenKind::kTemplateHead ? '`' : token.text.front());
      } else if (IsCloser(token) && !brackets.empty()) {
        brackets.pop_back();
      }
    }
    if (pending.append_semicolon) {
      text += ";";
    }
    flush();
    return statement;
  }

  auto ComputeExportsKind() const -> graph::ExportsKind {
    if (has_module_syntax_) {
      return graph::ExportsKind::kEsm;
    }
    bool uses_commonjs = unresolved_seen_.contains("module") ||
                         unresolved_seen_.contains("exports");
    for (const auto& record : result_.import_records) {
      uses_commonjs |= record.kind == graph::ImportKind::kRequire;
    }
    return uses_commonjs ? graph::ExportsKind::kCommonJs
                         : graph::ExportsKind::kNone;
  }

  ModuleId id_;
  std::string_view source_;
  std::string path_;
  std::string name_;
  std::vector<Token> tokens_;
  ScanResult result_;
  absl::flat_hash_map<std::string, uint32_t> bindings_;
  absl::flat_hash_set<std::string> unresolved_seen_;
  std::vector<PendingStatement> statements_;
  // (exported, local name), resolved once every declaration has been seen.
  std::vector<std::pair<std::string, std::string>> pending_exports_;
  bool has_module_syntax_ = false;
};

}  // namespace

auto ScanModule(ModuleId id, std::string_view source, std::string_view path)
    -> Result<ScanResult> {
  auto tokens = Lexer(source).Tokenize();
  if (!tokens) {
    auto diag = std::move(tokens.error());
    diag.primary.location = std::string(path);
    return std::unexpected(std::move(diag));
  }
  return Scanner(id, source, path, std::move(*tokens)).Run();
}

}  // namespace weld::frontend
