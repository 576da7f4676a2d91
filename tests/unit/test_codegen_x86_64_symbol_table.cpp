// File: tests/unit/test_codegen_x86_64_symbol_table.cpp
// Purpose: Verify symbol registration, prefixing and lookup rules.
// Key invariants: Module symbols carry the configured prefix; externs keep
//                 their spelling; a name is defined at most once.
// Ownership/Lifetime: Each test owns its table.
// Links: src/codegen/x86_64/SymbolTable.hpp

#include "codegen/x86_64/SymbolTable.hpp"
#include "codegen/x86_64/TranslationError.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace kestrel::codegen::x64;

TEST(SymbolTable, PrefixesDefinedSymbolsOnly)
{
    SymbolTable table("_");
    const SymbolInfo &fn = table.define("main", SymbolKind::Function);
    const SymbolInfo &ext = table.declareExtern("puts");

    EXPECT_EQ(fn.asmName, "_main");
    EXPECT_TRUE(fn.defined);
    EXPECT_EQ(ext.asmName, "puts");
    EXPECT_FALSE(ext.defined);
    EXPECT_EQ(table.size(), 2U);
}

TEST(SymbolTable, ReferencesSurviveLaterInsertions)
{
    SymbolTable table("k_");
    const SymbolInfo &first = table.define("entry", SymbolKind::Function);
    const SymbolInfo &ext = table.declareExtern("printf");
    for (int i = 0; i < 256; ++i)
    {
        table.define("g" + std::to_string(i), SymbolKind::Variable);
        table.declareExtern("ext" + std::to_string(i));
    }

    EXPECT_EQ(first.original, "entry");
    EXPECT_EQ(first.asmName, "k_entry");
    EXPECT_EQ(ext.asmName, "printf");
    EXPECT_EQ(&first, table.lookup("entry"));
    EXPECT_EQ(table.size(), 514U);
}

TEST(SymbolTable, RecordsDataAddresses)
{
    SymbolTable table;
    table.define("counter", SymbolKind::Variable, SectionAddress{Section::Data, 16});
    const SymbolInfo &data = table.resolveData("counter");
    ASSERT_TRUE(data.address.has_value());
    EXPECT_EQ(data.address->section, Section::Data);
    EXPECT_EQ(data.address->offset, 16U);
}

TEST(SymbolTable, UpgradesExternToDefinition)
{
    SymbolTable table("k_");
    table.declareExtern("helper");
    const SymbolInfo &fn = table.define("helper", SymbolKind::Function);
    EXPECT_TRUE(fn.defined);
    EXPECT_EQ(fn.asmName, "k_helper");
    EXPECT_EQ(table.size(), 1U);
}

TEST(SymbolTable, RejectsDuplicateDefinition)
{
    SymbolTable table;
    table.define("x", SymbolKind::Variable, SectionAddress{Section::Bss, 0});
    try
    {
        table.define("x", SymbolKind::Variable, SectionAddress{Section::Bss, 8});
        FAIL() << "duplicate definition accepted";
    }
    catch (const TranslationException &ex)
    {
        EXPECT_EQ(ex.error().kind, ErrorKind::UnsupportedConstruct);
        EXPECT_EQ(ex.error().construct, "x");
    }
}

TEST(SymbolTable, ResolvesUnknownCalleeAsExtern)
{
    SymbolTable table("_");
    const SymbolInfo &callee = table.resolveCallee("memcpy");
    EXPECT_EQ(callee.asmName, "memcpy");
    EXPECT_FALSE(callee.defined);
    ASSERT_NE(table.lookup("memcpy"), nullptr);
}

TEST(SymbolTable, SeparatesCodeFromData)
{
    SymbolTable table;
    table.define("f", SymbolKind::Function);
    table.define("g", SymbolKind::Constant, SectionAddress{Section::Data, 0});

    EXPECT_THROW((void)table.resolveData("f"), TranslationException);
    EXPECT_THROW((void)table.resolveData("missing"), TranslationException);
    EXPECT_THROW((void)table.resolveCallee("g"), TranslationException);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
