#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "weld/common/overloaded.hpp"
#include "weld/frontend/module_scanner.hpp"

namespace weld::frontend {
namespace {

using graph::ExportsKind;
using graph::ImportKind;
using graph::StatementKind;

class ModuleScannerTest : public ::testing::Test {
 protected:
  static auto Scan(std::string_view source, std::string_view path = "main.js")
      -> ScanResult {
    auto result = ScanModule(ModuleId{1}, source, path);
    EXPECT_TRUE(result.has_value())
        << (result ? "" : result.error().primary.message);
    return result ? std::move(*result) : ScanResult{};
  }

  // Statement text with symbols spelled by their declared names, require
  // calls as `require#<record>` and dynamic imports as `import#<record>`.
  static auto Text(const ScanResult& scan, size_t index) -> std::string {
    std::string out;
    for (const auto& piece : scan.ast.statements.at(index).pieces) {
      std::visit(
          common::Overloaded{
              [&](const graph::TextPiece& text) { out += text.text; },
              [&](const graph::SymbolPiece& symbol) {
                out += scan.symbol_names.at(symbol.local);
              },
              [&](const graph::RequirePiece& require) {
                out += fmt::format("require#{}", require.record.value);
              },
              [&](const graph::DynamicImportPiece& dynamic) {
                out += fmt::format("import#{}", dynamic.record.value);
              },
          },
          piece);
    }
    return out;
  }

  static auto LocalOf(const ScanResult& scan, std::string_view name)
      -> uint32_t {
    for (uint32_t i = 0; i < scan.symbol_names.size(); ++i) {
      if (scan.symbol_names[i] == name) {
        return i;
      }
    }
    ADD_FAILURE() << "no symbol named " << name;
    return 0;
  }
};

// =============================================================================
// Import Tests
// =============================================================================

TEST_F(ModuleScannerTest, NamespaceSymbolComesFirst) {
  auto scan = Scan("const x = 1;", "src/my-lib.js");
  ASSERT_FALSE(scan.symbol_names.empty());
  EXPECT_EQ(scan.symbol_names[0], "my_lib_exports");
}

TEST_F(ModuleScannerTest, ImportDeclarationBindsLocals) {
  auto scan = Scan(
      "import def, { a as b } from './x.js';\n"
      "console.log(def, b);\n");
  ASSERT_EQ(scan.import_records.size(), 1);
  const auto& record = scan.import_records[0];
  EXPECT_EQ(record.module_request, "./x.js");
  EXPECT_EQ(record.kind, ImportKind::kImport);
  EXPECT_TRUE(record.contains_import_default);
  EXPECT_FALSE(record.contains_import_star);
  EXPECT_TRUE(record.contains_import_named);
  EXPECT_EQ(record.namespace_ref.owner, ModuleId{1});
  EXPECT_EQ(scan.symbol_names[record.namespace_ref.symbol], "import_x");

  ASSERT_EQ(scan.named_imports.size(), 2);
  EXPECT_EQ(scan.named_imports[0].imported, "default");
  EXPECT_EQ(scan.named_imports[0].local, LocalOf(scan, "def"));
  EXPECT_EQ(scan.named_imports[1].imported, "a");
  EXPECT_EQ(scan.named_imports[1].local, LocalOf(scan, "b"));

  // The import declaration itself is gone.
  ASSERT_EQ(scan.ast.statements.size(), 1);
  EXPECT_EQ(Text(scan, 0), "console.log(def, b);");
  EXPECT_EQ(scan.exports_kind, ExportsKind::kEsm);
}

TEST_F(ModuleScannerTest, SideEffectImport) {
  auto scan = Scan("import './setup.js';");
  ASSERT_EQ(scan.import_records.size(), 1);
  const auto& record = scan.import_records[0];
  EXPECT_EQ(record.module_request, "./setup.js");
  EXPECT_FALSE(record.contains_import_default);
  EXPECT_FALSE(record.contains_import_star);
  EXPECT_FALSE(record.contains_import_named);
  EXPECT_TRUE(scan.named_imports.empty());
  EXPECT_TRUE(scan.ast.statements.empty());
  EXPECT_EQ(scan.exports_kind, ExportsKind::kEsm);
}

TEST_F(ModuleScannerTest, NamespaceImport) {
  auto scan = Scan("import * as ns from './x.js';");
  ASSERT_EQ(scan.named_imports.size(), 1);
  EXPECT_EQ(scan.named_imports[0].imported, "*");
  EXPECT_TRUE(scan.import_records[0].contains_import_star);
}

TEST_F(ModuleScannerTest, TypeOnlyImportHasNoRecord) {
  auto scan = Scan("import type { T } from './types.js';");
  EXPECT_TRUE(scan.import_records.empty());
}

TEST_F(ModuleScannerTest, MalformedImportIsAnError) {
  auto result = ScanModule(ModuleId{1}, "import { a from './x.js';", "a.js");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.location, "a.js");
  EXPECT_NE(
      result.error().primary.message.find("malformed import declaration"),
      std::string::npos);
}

// =============================================================================
// Export Tests
// =============================================================================

TEST_F(ModuleScannerTest, ExportedDeclarationDropsExportKeyword) {
  auto scan = Scan("export const a = 1, b = 2;");
  ASSERT_EQ(scan.ast.statements.size(), 1);
  const auto& statement = scan.ast.statements[0];
  EXPECT_EQ(statement.kind, StatementKind::kVariableDeclaration);
  ASSERT_FALSE(statement.pieces.empty());
  EXPECT_EQ(std::get<graph::TextPiece>(statement.pieces[0]).text, "const ");
  EXPECT_EQ(Text(scan, 0), "const a = 1, b = 2;");
  EXPECT_EQ(statement.declared.size(), 2);

  ASSERT_EQ(scan.local_exports.size(), 2);
  EXPECT_EQ(scan.local_exports[0].exported, "a");
  EXPECT_EQ(scan.local_exports[1].exported, "b");
}

TEST_F(ModuleScannerTest, ExportClauseMayPrecedeDeclaration) {
  auto scan = Scan("export { x as y };\nconst x = 1;\n");
  ASSERT_EQ(scan.local_exports.size(), 1);
  EXPECT_EQ(scan.local_exports[0].exported, "y");
  EXPECT_EQ(scan.local_exports[0].local, LocalOf(scan, "x"));
  ASSERT_EQ(scan.ast.statements.size(), 1);
  EXPECT_EQ(Text(scan, 0), "const x = 1;");
}

TEST_F(ModuleScannerTest, ExportOfUndeclaredNameIsAnError) {
  auto result = ScanModule(ModuleId{1}, "export { nope };", "a.js");
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(
      result.error().primary.message.find(
          "\"nope\" is exported but not declared"),
      std::string::npos);
}

TEST_F(ModuleScannerTest, DefaultExpressionGetsVariable) {
  auto scan = Scan("export default 40 + 2;", "src/main.js");
  ASSERT_EQ(scan.ast.statements.size(), 1);
  EXPECT_EQ(Text(scan, 0), "var main_default = 40 + 2;");
  ASSERT_EQ(scan.local_exports.size(), 1);
  EXPECT_EQ(scan.local_exports[0].exported, "default");
  EXPECT_EQ(scan.local_exports[0].local, LocalOf(scan, "main_default"));
}

TEST_F(ModuleScannerTest, DefaultExpressionWithoutSemicolon) {
  auto scan = Scan("export default 1", "main.js");
  ASSERT_EQ(scan.ast.statements.size(), 1);
  EXPECT_EQ(Text(scan, 0), "var main_default = 1;");
}

TEST_F(ModuleScannerTest, AnonymousDefaultFunctionIsNamed) {
  auto scan = Scan("export default function () { return 1; }", "main.js");
  ASSERT_EQ(scan.ast.statements.size(), 1);
  EXPECT_EQ(
      scan.ast.statements[0].kind, StatementKind::kFunctionDeclaration);
  EXPECT_EQ(Text(scan, 0), "function main_default () { return 1; }");
}

TEST_F(ModuleScannerTest, NamedDefaultFunctionKeepsItsName) {
  auto scan = Scan("export default function run() {}");
  ASSERT_EQ(scan.local_exports.size(), 1);
  EXPECT_EQ(scan.local_exports[0].exported, "default");
  EXPECT_EQ(scan.local_exports[0].local, LocalOf(scan, "run"));
  EXPECT_EQ(Text(scan, 0), "function run() {}");
}

TEST_F(ModuleScannerTest, ReExportsAndStarExports) {
  auto scan = Scan(
      "export { a as b } from './x.js';\n"
      "export * from './y.js';\n"
      "export * as ns from './z.js';\n");
  ASSERT_EQ(scan.import_records.size(), 3);
  ASSERT_EQ(scan.re_exports.size(), 2);
  EXPECT_EQ(scan.re_exports[0].exported, "b");
  EXPECT_EQ(scan.re_exports[0].imported, "a");
  EXPECT_EQ(scan.re_exports[0].record, ImportRecordId{0});
  EXPECT_EQ(scan.re_exports[1].exported, "ns");
  EXPECT_EQ(scan.re_exports[1].imported, "*");
  EXPECT_EQ(scan.re_exports[1].record, ImportRecordId{2});
  ASSERT_EQ(scan.star_exports.size(), 1);
  EXPECT_EQ(scan.star_exports[0], ImportRecordId{1});
  EXPECT_TRUE(scan.import_records[0].contains_import_named);
  EXPECT_FALSE(scan.import_records[1].contains_import_star);
  EXPECT_TRUE(scan.import_records[2].contains_import_star);
  EXPECT_TRUE(scan.ast.statements.empty());
}

// =============================================================================
// CommonJS and Dynamic Import Tests
// =============================================================================

TEST_F(ModuleScannerTest, RequireCallBecomesPiece) {
  auto scan = Scan(
      "const lib = require('./lib.js');\nmodule.exports = lib;\n", "a.js");
  ASSERT_EQ(scan.import_records.size(), 1);
  EXPECT_EQ(scan.import_records[0].kind, ImportKind::kRequire);
  EXPECT_EQ(scan.import_records[0].module_request, "./lib.js");
  EXPECT_EQ(Text(scan, 0), "const lib = require#0;");
  EXPECT_EQ(Text(scan, 1), "module.exports = lib;");
  EXPECT_EQ(scan.exports_kind, ExportsKind::kCommonJs);
}

TEST_F(ModuleScannerTest, ExportsAssignmentIsCommonJs) {
  auto scan = Scan("exports.value = 1;");
  EXPECT_EQ(scan.exports_kind, ExportsKind::kCommonJs);
}

TEST_F(ModuleScannerTest, PlainScriptHasNoModuleSyntax) {
  auto scan = Scan("console.log('hi');");
  EXPECT_EQ(scan.exports_kind, ExportsKind::kNone);
}

TEST_F(ModuleScannerTest, DynamicImportBecomesAPiece) {
  auto scan = Scan("import( './lazy.js' ).then(m => m.run());");
  ASSERT_EQ(scan.import_records.size(), 1);
  EXPECT_EQ(scan.import_records[0].kind, ImportKind::kDynamicImport);
  EXPECT_TRUE(scan.import_records[0].contains_import_star);
  EXPECT_EQ(Text(scan, 0), "import#0.then(m => m.run());");
  const auto& piece = std::get<graph::DynamicImportPiece>(
      scan.ast.statements[0].pieces[0]);
  EXPECT_EQ(piece.text, "import( './lazy.js' )");
  EXPECT_EQ(scan.exports_kind, ExportsKind::kNone);
}

TEST_F(ModuleScannerTest, DynamicImportWithAttributesStaysText) {
  auto scan = Scan("import('./data.json', { with: { type: 'json' } });");
  ASSERT_EQ(scan.import_records.size(), 1);
  EXPECT_EQ(scan.import_records[0].kind, ImportKind::kDynamicImport);
  EXPECT_EQ(
      Text(scan, 0), "import('./data.json', { with: { type: 'json' } });");
}

TEST_F(ModuleScannerTest, UseStrictDirectiveIsRecordedAndDropped) {
  auto scan = Scan("'use strict';\nexports.a = 1;\n");
  EXPECT_TRUE(scan.ast.contains_use_strict);
  ASSERT_EQ(scan.ast.statements.size(), 1);
  EXPECT_EQ(Text(scan, 0), "exports.a = 1;");
}

// =============================================================================
// Statement and Reference Tests
// =============================================================================

TEST_F(ModuleScannerTest, NewlinesSplitStatements) {
  auto scan = Scan("let a = 1\nlet b = 2\n");
  ASSERT_EQ(scan.ast.statements.size(), 2);
  EXPECT_EQ(Text(scan, 0), "let a = 1");
  EXPECT_EQ(scan.ast.statements[1].line, 1);
}

TEST_F(ModuleScannerTest, GlobalsAreUnresolvedReferences) {
  auto scan = Scan("const a = 1;\nconsole.log(a, window);\n");
  const auto& unresolved = scan.unresolved_references;
  EXPECT_NE(
      std::ranges::find(unresolved, "console"), unresolved.end());
  EXPECT_NE(std::ranges::find(unresolved, "window"), unresolved.end());
  EXPECT_EQ(std::ranges::find(unresolved, "a"), unresolved.end());
  EXPECT_EQ(std::ranges::find(unresolved, "log"), unresolved.end());
}

TEST_F(ModuleScannerTest, ShorthandPropertyIsMarked) {
  auto scan = Scan("const a = 1;\nconst o = { a };\n");
  ASSERT_EQ(scan.ast.statements.size(), 2);
  uint32_t a = LocalOf(scan, "a");
  bool found = false;
  for (const auto& piece : scan.ast.statements[1].pieces) {
    if (const auto* symbol = std::get_if<graph::SymbolPiece>(&piece)) {
      if (symbol->local == a) {
        EXPECT_TRUE(symbol->shorthand);
        found = true;
      }
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(ModuleScannerTest, ObjectKeyIsNotAReference) {
  auto scan = Scan("const a = 1;\nconst o = { a: a };\n");
  uint32_t a = LocalOf(scan, "a");
  int references = 0;
  for (const auto& piece : scan.ast.statements[1].pieces) {
    if (const auto* symbol = std::get_if<graph::SymbolPiece>(&piece)) {
      references += symbol->local == a ? 1 : 0;
    }
  }
  EXPECT_EQ(references, 1);
  EXPECT_EQ(Text(scan, 1), "const o = { a: a };");
}

TEST_F(ModuleScannerTest, LexerErrorNamesTheModule) {
  auto result = ScanModule(ModuleId{1}, "const s = 'abc", "src/bad.js");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.location, "src/bad.js");
}

}  // namespace
}  // namespace weld::frontend
