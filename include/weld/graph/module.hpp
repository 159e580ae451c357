#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "weld/common/ids.hpp"
#include "weld/graph/import_record.hpp"

namespace weld::graph {

enum class ExportsKind : uint8_t {
  kNone,      // No module syntax at all
  kEsm,       // import/export syntax
  kCommonJs,  // module.exports / exports / require
};

[[nodiscard]] constexpr auto ToString(ExportsKind kind) -> std::string_view {
  switch (kind) {
    case ExportsKind::kNone:
      return "none";
    case ExportsKind::kEsm:
      return "esm";
    case ExportsKind::kCommonJs:
      return "commonjs";
  }
  return "none";
}

// Source text copied verbatim into the output.
struct TextPiece {
  std::string text;
};

// A reference to (or the declaration of) a top-level binding of the module,
// by local symbol index. `shorthand` marks `{ name }` object shorthand, which
// must be expanded to `name: renamed` if the binding gets renamed.
struct SymbolPiece {
  uint32_t local = 0;
  bool shorthand = false;
};

// A whole `require("x")` call, replaced by the target's wrapper call.
struct RequirePiece {
  ImportRecordId record;
};

// `import("x")` with a literal specifier. A bundled target renders as a
// promise of its namespace; `text` is the call as written, which stays when
// the specifier does not resolve.
struct DynamicImportPiece {
  ImportRecordId record;
  std::string text;
};

using Piece =
    std::variant<TextPiece, SymbolPiece, RequirePiece, DynamicImportPiece>;

enum class StatementKind : uint8_t {
  kPlain,
  // var/let/const: pieces[0] is the keyword text including its trailing
  // whitespace, so the keyword can be dropped when the binding is hoisted.
  kVariableDeclaration,
  kFunctionDeclaration,
  // pieces[0] is "class" plus whitespace, pieces[1] the class name.
  kClassDeclaration,
};

struct Statement {
  StatementKind kind = StatementKind::kPlain;
  std::vector<Piece> pieces;
  std::vector<uint32_t> declared;  // Local symbols this statement declares
  uint32_t line = 0;               // 0-based line of the first token
};

// The parsed form of one module handed to the per-module renderer. Import
// and export declarations are gone; linking replaces them.
struct ModuleAst {
  std::vector<Statement> statements;
  bool contains_use_strict = false;
};

// `import { imported as local } from "x"`; imported is "default" for default
// imports and "*" for namespace imports.
struct NamedImport {
  uint32_t local = 0;
  ImportRecordId record;
  std::string imported;
};

struct LocalExport {
  std::string exported;
  uint32_t local = 0;
};

// `export { imported as exported } from "x"`; imported "*" is
// `export * as exported from "x"`.
struct ReExport {
  std::string exported;
  ImportRecordId record;
  std::string imported;
};

struct Module {
  ModuleId id;
  // Absolute path, or a NUL-prefixed virtual id.
  std::string resource_id;
  std::string pretty_path;
  std::string source;
  ExportsKind exports_kind = ExportsKind::kNone;
  std::vector<ImportRecord> import_records;
  ModuleAst ast;
  std::vector<NamedImport> named_imports;
  std::vector<LocalExport> local_exports;
  std::vector<ReExport> re_exports;
  std::vector<ImportRecordId> star_exports;
  // Identifiers the module uses but does not bind (globals, nested locals).
  // Canonical names never take one of these.
  std::vector<std::string> unresolved_references;
  // Local symbol 0: the module's own namespace object.
  SymbolRef namespace_ref;

  [[nodiscard]] auto IsVirtual() const -> bool {
    return !resource_id.empty() && resource_id.front() == '\0';
  }
};

}  // namespace weld::graph
