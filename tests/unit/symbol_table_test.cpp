#include <gtest/gtest.h>

#include <string>

#include "weld/common/internal_error.hpp"
#include "weld/graph/symbol_table.hpp"

namespace weld::graph {
namespace {

class SymbolTableTest : public ::testing::Test {
 protected:
  SymbolTable table_;
};

TEST_F(SymbolTableTest, DeclareNumbersSymbolsPerModule) {
  SymbolRef a = table_.Declare(ModuleId{0}, "a");
  SymbolRef b = table_.Declare(ModuleId{0}, "b");
  SymbolRef c = table_.Declare(ModuleId{2}, "c");
  EXPECT_EQ(a.symbol, 0);
  EXPECT_EQ(b.symbol, 1);
  EXPECT_EQ(c.symbol, 0);
  EXPECT_EQ(table_.SymbolCount(ModuleId{0}), 2);
  EXPECT_EQ(table_.SymbolCount(ModuleId{1}), 0);
  EXPECT_EQ(table_.SymbolCount(ModuleId{5}), 0);
  EXPECT_EQ(table_.Get(c).name, "c");
}

TEST_F(SymbolTableTest, UnknownSymbolIsAnInternalError) {
  table_.Declare(ModuleId{0}, "a");
  EXPECT_THROW(
      (void)table_.Get(SymbolRef{.owner = ModuleId{0}, .symbol = 4}),
      common::InternalError);
  EXPECT_THROW(
      (void)table_.Get(SymbolRef{.owner = ModuleId{3}, .symbol = 0}),
      common::InternalError);
}

// =============================================================================
// Linking Tests
// =============================================================================

TEST_F(SymbolTableTest, RootFollowsLinkChain) {
  SymbolRef import_a = table_.Declare(ModuleId{0}, "x");
  SymbolRef reexport = table_.Declare(ModuleId{1}, "x");
  SymbolRef decl = table_.Declare(ModuleId{2}, "x");
  table_.Link(import_a, reexport);
  table_.Link(reexport, decl);
  EXPECT_EQ(table_.Root(import_a), decl);
  EXPECT_EQ(table_.Root(reexport), decl);
  EXPECT_EQ(table_.Root(decl), decl);
}

TEST_F(SymbolTableTest, LinkingALinkedSymbolMovesItsRoot) {
  SymbolRef a = table_.Declare(ModuleId{0}, "a");
  SymbolRef b = table_.Declare(ModuleId{1}, "b");
  SymbolRef c = table_.Declare(ModuleId{2}, "c");
  table_.Link(a, b);
  table_.Link(a, c);
  EXPECT_EQ(table_.Root(a), c);
  EXPECT_EQ(table_.Root(b), c);
}

TEST_F(SymbolTableTest, LinkToSelfIsIgnored) {
  SymbolRef a = table_.Declare(ModuleId{0}, "a");
  SymbolRef b = table_.Declare(ModuleId{1}, "b");
  table_.Link(a, b);
  table_.Link(b, a);
  EXPECT_EQ(table_.Root(a), b);
  EXPECT_EQ(table_.Root(b), b);
}

TEST_F(SymbolTableTest, NamespaceAliasIsStored) {
  SymbolRef ns = table_.Declare(ModuleId{0}, "import_lib");
  SymbolRef value = table_.Declare(ModuleId{0}, "value");
  table_.SetNamespaceAlias(
      value, NamespaceAlias{.namespace_ref = ns, .property = "value"});
  ASSERT_TRUE(table_.Get(value).namespace_alias.has_value());
  EXPECT_EQ(table_.Get(value).namespace_alias->namespace_ref, ns);
  EXPECT_EQ(table_.Get(value).namespace_alias->property, "value");
}

// =============================================================================
// Canonical Name Tests
// =============================================================================

TEST_F(SymbolTableTest, CanonicalNameUsesRoot) {
  SymbolRef import_x = table_.Declare(ModuleId{0}, "x");
  SymbolRef decl = table_.Declare(ModuleId{1}, "x");
  table_.Link(import_x, decl);
  CanonicalNames names;
  names.emplace(decl, "x$1");
  EXPECT_EQ(table_.CanonicalNameFor(import_x, names), "x$1");
  EXPECT_EQ(table_.CanonicalNameFor(decl, names), "x$1");
}

TEST_F(SymbolTableTest, MissingCanonicalNameIsAnInternalError) {
  SymbolRef a = table_.Declare(ModuleId{0}, "a");
  CanonicalNames names;
  try {
    (void)table_.CanonicalNameFor(a, names);
    FAIL() << "expected InternalError";
  } catch (const common::InternalError& e) {
    EXPECT_NE(
        std::string(e.what()).find("has no canonical name"),
        std::string::npos);
  }
}

}  // namespace
}  // namespace weld::graph
