#include "weld/render/module_renderer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "absl/container/flat_hash_set.h"
#include "weld/common/internal_error.hpp"
#include "weld/common/overloaded.hpp"
#include "weld/graph/import_record.hpp"
#include "weld/render/js_syntax.hpp"

namespace weld::render {

namespace {

using graph::StatementKind;
using link::WrapKind;

// Output lines, each remembering the source line it was printed from.
class LineWriter {
 public:
  // Generated code with no source position.
  void Generated(std::string_view text) {
    Append(text, std::nullopt);
  }

  // Source text starting at `original_line`. Embedded line breaks advance
  // the original line along with the output.
  void Mapped(std::string_view text, uint32_t original_line) {
    Append(text, original_line);
  }

  [[nodiscard]] auto IsEmpty() const -> bool {
    return lines_.empty();
  }
  [[nodiscard]] auto LineCount() const -> size_t {
    return lines_.size();
  }

  [[nodiscard]] auto Text() const -> std::string {
    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (i > 0) {
        out += '\n';
      }
      out += lines_[i];
    }
    return out;
  }

  [[nodiscard]] auto Map(const graph::Module& module) const
      -> sourcemap::SourceMap {
    sourcemap::MappingLines mappings(lines_.size());
    for (size_t i = 0; i < origins_.size(); ++i) {
      if (origins_[i]) {
        mappings[i].push_back(
            sourcemap::Mapping{
                .generated_column = 0,
                .source = 0,
                .original_line = *origins_[i],
                .original_column = 0,
                .name = std::nullopt});
      }
    }
    return sourcemap::SourceMap(
        {module.resource_id}, {module.source}, {}, std::move(mappings));
  }

 private:
  void Append(std::string_view text, std::optional<uint32_t> origin) {
    size_t start = 0;
    while (true) {
      size_t end = text.find('\n', start);
      lines_.emplace_back(text.substr(start, end - start));
      origins_.push_back(origin);
      if (end == std::string_view::npos) {
        return;
      }
      if (origin) {
        ++*origin;
      }
      start = end + 1;
    }
  }

  std::vector<std::string> lines_;
  std::vector<std::optional<uint32_t>> origins_;
};

auto StripTrailingSemicolon(std::string_view text) -> std::string_view {
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  if (!text.empty() && text.back() == ';') {
    text.remove_suffix(1);
  }
  return text;
}

class ModulePrinter {
 public:
  explicit ModulePrinter(const ModuleRenderContext& context)
      : context_(context),
        module_(context.module),
        meta_(context.link.Meta(context.module.id)),
        symbols_(context.link.graph.symbols) {
  }

  auto Print() -> LineWriter {
    switch (meta_.wrap_kind) {
      case WrapKind::kNone:
        PrintUnwrapped();
        break;
      case WrapKind::kCjs:
        PrintCjsWrapped();
        break;
      case WrapKind::kEsm:
        PrintEsmWrapped();
        break;
    }
    return std::move(out_);
  }

 private:
  auto Name(SymbolRef ref) const -> const std::string& {
    return symbols_.CanonicalNameFor(ref, context_.chunk.canonical_names);
  }

  // How code in this chunk reads the binding `ref`.
  auto Reference(SymbolRef ref) const -> std::string {
    SymbolRef root = symbols_.Root(ref);
    if (const auto& alias = symbols_.Get(root).namespace_alias) {
      return Reference(alias->namespace_ref) + PropertyAccess(alias->property);
    }
    return Name(root);
  }

  auto Helper(std::string_view name) const -> const std::string& {
    return Name(context_.link.RuntimeHelper(name));
  }

  auto Wrapper(ModuleId target) const -> const std::string& {
    const auto& wrapper = context_.link.Meta(target).wrapper_ref;
    if (!wrapper) {
      common::ThrowInternalError(
          "ModulePrinter::Wrapper",
          fmt::format(
              "module '{}' is used through a wrapper but has none",
              context_.link.graph[target].pretty_path));
    }
    return Name(*wrapper);
  }

  auto TargetOf(ImportRecordId record) const -> ModuleId {
    return module_.import_records[record.value].resolved_module;
  }

  // Value of `require("x")` for the record's target.
  auto RequireCall(ImportRecordId record) const -> std::string {
    ModuleId target = TargetOf(record);
    switch (context_.link.Meta(target).wrap_kind) {
      case WrapKind::kCjs:
        return Wrapper(target) + "()";
      case WrapKind::kEsm:
        return fmt::format(
            "({}(), {}({}))", Wrapper(target), Helper("__toCommonJS"),
            Name(context_.link.graph[target].namespace_ref));
      case WrapKind::kNone:
        break;
    }
    common::ThrowInternalError(
        "ModulePrinter::RequireCall",
        fmt::format(
            "required module '{}' is not wrapped",
            context_.link.graph[target].pretty_path));
  }

  // Value of `import("x")` for a bundled target. The target already ran in
  // execution order, so the promise resolves to its namespace.
  auto DynamicImportCall(ImportRecordId record) const -> std::string {
    ModuleId target = TargetOf(record);
    const graph::Module& module = context_.link.graph[target];
    std::string value;
    if (module.exports_kind == graph::ExportsKind::kCommonJs) {
      value = fmt::format("{}({}())", Helper("__toESM"), Wrapper(target));
    } else if (context_.link.Meta(target).wrap_kind == WrapKind::kEsm) {
      value = fmt::format(
          "({}(), {})", Wrapper(target), Name(module.namespace_ref));
    } else {
      value = Name(module.namespace_ref);
    }
    return fmt::format("Promise.resolve().then(() => {})", value);
  }

  auto RenderPieces(const graph::Statement& statement, size_t first) const
      -> std::string {
    std::string out;
    for (size_t i = first; i < statement.pieces.size(); ++i) {
      std::visit(
          common::Overloaded{
              [&](const graph::TextPiece& text) { out += text.text; },
              [&](const graph::SymbolPiece& symbol) {
                SymbolRef ref{.owner = module_.id, .symbol = symbol.local};
                std::string name = Reference(ref);
                const std::string& written = symbols_.Get(ref).name;
                if (symbol.shorthand && name != written) {
                  out += written;
                  out += ": ";
                }
                out += name;
              },
              [&](const graph::RequirePiece& require) {
                out += RequireCall(require.record);
              },
              [&](const graph::DynamicImportPiece& dynamic) {
                out += DynamicImportCall(dynamic.record);
              },
          },
          statement.pieces[i]);
    }
    return out;
  }

  void PrintNamespaceObject() {
    if (!meta_.needs_namespace_object) {
      return;
    }
    const std::string& ns = Name(module_.namespace_ref);
    out_.Generated(fmt::format("var {} = {{}};", ns));
    if (meta_.resolved_exports.empty()) {
      return;
    }
    out_.Generated(fmt::format("{}({}, {{", Helper("__export"), ns));
    size_t remaining = meta_.resolved_exports.size();
    for (const auto& [name, ref] : meta_.resolved_exports) {
      out_.Generated(
          fmt::format(
              "  {}: () => {}{}", PropertyKey(name), Reference(ref),
              --remaining > 0 ? "," : ""));
    }
    out_.Generated("});");
  }

  // Initializes every wrapped module this one imports statically, in record
  // order. CommonJS imports with bindings get their namespace variable here.
  void PrintImportPrologue(bool hoisted) {
    absl::flat_hash_set<ModuleId> initialized;
    for (uint32_t i = 0; i < module_.import_records.size(); ++i) {
      const auto& record = module_.import_records[i];
      if (record.kind != graph::ImportKind::kImport) {
        continue;
      }
      ModuleId target = record.resolved_module;
      if (!context_.link.Meta(target).IsWrapped()) {
        continue;
      }
      bool has_namespace = false;
      for (ImportRecordId ns_record : meta_.namespace_records) {
        has_namespace |= ns_record == ImportRecordId{i};
      }
      if (has_namespace) {
        out_.Generated(
            fmt::format(
                "{}{} = {}({}());", hoisted ? "" : "var ",
                Name(record.namespace_ref), Helper("__toESM"),
                Wrapper(target)));
        initialized.insert(target);
        continue;
      }
      if (initialized.insert(target).second) {
        out_.Generated(fmt::format("{}();", Wrapper(target)));
      }
    }
  }

  void PrintStatements() {
    for (const auto& statement : module_.ast.statements) {
      out_.Mapped(RenderPieces(statement, 0), statement.line);
    }
  }

  void PrintUnwrapped() {
    PrintNamespaceObject();
    PrintImportPrologue(false);
    PrintStatements();
  }

  void PrintCjsWrapped() {
    out_.Generated(
        fmt::format(
            "var {} = {}((exports, module) => {{", Name(*meta_.wrapper_ref),
            Helper("__commonJS")));
    if (module_.ast.contains_use_strict) {
      out_.Generated("\"use strict\";");
    }
    PrintStatements();
    out_.Generated("});");
  }

  // Top-level bindings become `var`s outside the initializer so other
  // modules can reference them before it runs. Function declarations move
  // out whole; they are hoisted anyway.
  void PrintEsmWrapped() {
    std::vector<std::string> hoisted;
    for (const auto& statement : module_.ast.statements) {
      if (statement.kind == StatementKind::kVariableDeclaration ||
          statement.kind == StatementKind::kClassDeclaration) {
        for (uint32_t local : statement.declared) {
          hoisted.push_back(
              Name(SymbolRef{.owner = module_.id, .symbol = local}));
        }
      }
    }
    for (ImportRecordId record : meta_.namespace_records) {
      const auto& ns = module_.import_records[record.value].namespace_ref;
      hoisted.push_back(Name(ns));
    }
    if (!hoisted.empty()) {
      out_.Generated(fmt::format("var {};", fmt::join(hoisted, ", ")));
    }
    PrintNamespaceObject();
    for (const auto& statement : module_.ast.statements) {
      if (statement.kind == StatementKind::kFunctionDeclaration) {
        out_.Mapped(RenderPieces(statement, 0), statement.line);
      }
    }

    out_.Generated(
        fmt::format(
            "var {} = {}(() => {{", Name(*meta_.wrapper_ref),
            Helper("__esm")));
    PrintImportPrologue(true);
    for (const auto& statement : module_.ast.statements) {
      switch (statement.kind) {
        case StatementKind::kPlain:
          out_.Mapped(RenderPieces(statement, 0), statement.line);
          break;
        case StatementKind::kVariableDeclaration: {
          // pieces[0] is the keyword.
          std::string assignment = RenderPieces(statement, 1);
          std::string_view body = StripTrailingSemicolon(assignment);
          if (!body.empty() && body.front() == '{') {
            out_.Mapped(fmt::format("({});", body), statement.line);
          } else {
            out_.Mapped(fmt::format("{};", body), statement.line);
          }
          break;
        }
        case StatementKind::kFunctionDeclaration:
          break;
        case StatementKind::kClassDeclaration: {
          SymbolRef ref{.owner = module_.id, .symbol = statement.declared[0]};
          out_.Mapped(
              fmt::format("{} = {};", Name(ref), RenderPieces(statement, 0)),
              statement.line);
          break;
        }
      }
    }
    out_.Generated("});");
  }

  const ModuleRenderContext& context_;
  const graph::Module& module_;
  const link::LinkingMetadata& meta_;
  const graph::SymbolTable& symbols_;
  LineWriter out_;
};

}  // namespace

auto DefaultModuleRenderer::Render(const ModuleRenderContext& context) const
    -> Result<std::optional<ModuleRenderOutput>> {
  const graph::Module& module = context.module;
  LineWriter writer = ModulePrinter(context).Print();
  if (writer.IsEmpty()) {
    return std::nullopt;
  }

  std::string content = writer.Text();
  std::optional<sourcemap::SourceMap> map;
  if (context.options.sourcemap && !module.IsVirtual()) {
    map = writer.Map(module);
  }
  return ModuleRenderOutput{
      .module_path = module.resource_id,
      .module_pretty_path = module.pretty_path,
      .rendered_module = RenderedModule{.code = content},
      .rendered_content = content,
      .sourcemap = std::move(map),
      .lines_count = writer.LineCount()};
}

}  // namespace weld::render
