// File: tests/unit/test_ir_parser.cpp
// Purpose: Check that the IR text reader builds the expected module and
//          reports malformed input with a located diagnostic.
// Key invariants: Parsing stops at the first malformed line.
// Ownership/Lifetime: Modules are parsed into locals.
// Links: src/ir/Parser.cpp

#include "ir/Parser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>

using namespace kestrel;
using namespace kestrel::ir;

namespace
{

constexpr const char *kSample = R"(module demo
global counter: i64 = 7
const limit: i32 = -3
global scratch: array<32>
extern puts

# comment line
func pick(c: bool, a: i64, b: f64) -> i64 {
bb0:
  %0 = lt i64 %a, 10
  br %0, bb1, bb2
bb1:
  %1 = call i64 @puts(%a, 4)
  ret %1
bb2:
  store i64 %a, @counter
  unreachable
}
)";

support::Expected<void> parseText(const std::string &text, IrModule &module)
{
    std::istringstream in(text);
    return Parser::parse(in, module, 3);
}

} // namespace

TEST(IrParser, ReadsModuleItems)
{
    IrModule module;
    ASSERT_TRUE(parseText(kSample, module));

    EXPECT_EQ(module.name, "demo");
    ASSERT_EQ(module.globals.size(), 3U);
    EXPECT_EQ(module.globals[0].name, "counter");
    ASSERT_TRUE(module.globals[0].init.has_value());
    EXPECT_EQ(*module.globals[0].init, 7);
    EXPECT_FALSE(module.globals[0].isConstant);
    EXPECT_TRUE(module.globals[1].isConstant);
    EXPECT_EQ(module.globals[1].type.kind, TypeKind::I32);
    EXPECT_EQ(*module.globals[1].init, -3);
    EXPECT_FALSE(module.globals[2].init.has_value());
    EXPECT_EQ(module.globals[2].type.sizeInBytes(), 32U);
    ASSERT_EQ(module.externs.size(), 1U);
    EXPECT_EQ(module.externs[0], "puts");
}

TEST(IrParser, ReadsFunctionBody)
{
    IrModule module;
    ASSERT_TRUE(parseText(kSample, module));
    ASSERT_EQ(module.functions.size(), 1U);

    const IrFunction &fn = module.functions[0];
    EXPECT_EQ(fn.name, "pick");
    ASSERT_EQ(fn.params.size(), 3U);
    EXPECT_EQ(fn.params[2].type.kind, TypeKind::F64);
    EXPECT_EQ(fn.retType.kind, TypeKind::I64);
    ASSERT_EQ(fn.blocks.size(), 3U);

    const BasicBlock &entry = fn.blocks[0];
    ASSERT_EQ(entry.instrs.size(), 1U);
    EXPECT_EQ(entry.instrs[0].kind, InstructionKind::BinaryOp);
    EXPECT_EQ(entry.instrs[0].op, BinaryOp::Lt);
    EXPECT_EQ(entry.instrs[0].operands[0].kind, IrOperand::Kind::Param);
    EXPECT_EQ(entry.instrs[0].operands[0].id, 1U);
    EXPECT_EQ(entry.instrs[0].operands[1].bits, 10);
    EXPECT_EQ(entry.instrs[0].loc.line, 10U);
    EXPECT_EQ(entry.instrs[0].loc.file_id, 3U);
    EXPECT_EQ(entry.terminator.kind, TerminatorKind::ConditionalJump);
    EXPECT_EQ(entry.terminator.target, 1U);
    EXPECT_EQ(entry.terminator.elseTarget, 2U);

    // A trailing ret becomes the terminator.
    const BasicBlock &then = fn.blocks[1];
    ASSERT_EQ(then.instrs.size(), 1U);
    EXPECT_EQ(then.instrs[0].kind, InstructionKind::Call);
    EXPECT_EQ(then.instrs[0].callee, "puts");
    EXPECT_EQ(then.terminator.kind, TerminatorKind::Return);
    ASSERT_TRUE(then.terminator.value.has_value());
    EXPECT_EQ(then.terminator.value->id, 1U);

    const BasicBlock &other = fn.blocks[2];
    ASSERT_EQ(other.instrs.size(), 1U);
    EXPECT_EQ(other.instrs[0].kind, InstructionKind::Store);
    EXPECT_EQ(other.instrs[0].operands[1].kind, IrOperand::Kind::Global);
    EXPECT_EQ(other.terminator.kind, TerminatorKind::Unreachable);
}

TEST(IrParser, KeepsMidBlockReturnAsInstruction)
{
    IrModule module;
    ASSERT_TRUE(parseText("func early(a: i64) -> i64 {\n"
                          "bb0:\n"
                          "  ret %a\n"
                          "  jmp bb1\n"
                          "bb1:\n"
                          "  ret 0\n"
                          "}\n",
                          module));
    const BasicBlock &entry = module.functions[0].blocks[0];
    ASSERT_EQ(entry.instrs.size(), 1U);
    EXPECT_EQ(entry.instrs[0].kind, InstructionKind::Return);
    EXPECT_EQ(entry.terminator.kind, TerminatorKind::Jump);
}

TEST(IrParser, ParsesTypes)
{
    EXPECT_EQ(parseType("u16")->kind, TypeKind::U16);
    EXPECT_EQ(parseType("struct<24>")->sizeInBytes(), 24U);
    EXPECT_FALSE(parseType("struct<0>").has_value());
    EXPECT_FALSE(parseType("i128").has_value());
}

TEST(IrParser, ReportsUnknownOpcodeWithLocation)
{
    IrModule module;
    const auto parsed = parseText("func f() -> void {\n"
                                  "bb0:\n"
                                  "  frob i64 1\n"
                                  "}\n",
                                  module);
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().loc.line, 3U);
    EXPECT_NE(parsed.error().message.find("frob"), std::string::npos);
}

TEST(IrParser, RejectsBlockWithoutTerminator)
{
    IrModule module;
    const auto parsed = parseText("func f(a: i64) -> i64 {\n"
                                  "bb0:\n"
                                  "  %0 = add i64 %a, 1\n"
                                  "}\n",
                                  module);
    ASSERT_FALSE(parsed);
    EXPECT_NE(parsed.error().message.find("no terminator"), std::string::npos);
}

TEST(IrParser, RejectsUnknownValueName)
{
    IrModule module;
    const auto parsed = parseText("func f(a: i64) -> i64 {\n"
                                  "bb0:\n"
                                  "  ret %b\n"
                                  "}\n",
                                  module);
    ASSERT_FALSE(parsed);
    EXPECT_NE(parsed.error().message.find("%b"), std::string::npos);
}

TEST(IrParser, RejectsLiteralOutsideTypeRange)
{
    IrModule module;
    const auto parsed = parseText("func f() -> i32 {\n"
                                  "bb0:\n"
                                  "  %0 = const i32 5000000000\n"
                                  "  ret %0\n"
                                  "}\n",
                                  module);
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().loc.line, 3U);
    EXPECT_EQ(parsed.error().loc.column, 18U);
    EXPECT_NE(parsed.error().message.find("out of range"), std::string::npos);

    IrModule flags;
    const auto badBool = parseText("func g() -> bool {\n"
                                   "bb0:\n"
                                   "  ret 2\n"
                                   "}\n",
                                   flags);
    ASSERT_FALSE(badBool);
    EXPECT_NE(badBool.error().message.find("bool"), std::string::npos);

    IrModule globals;
    const auto badGlobal = parseText("global small: u8 = 256\n", globals);
    ASSERT_FALSE(badGlobal);
    EXPECT_EQ(badGlobal.error().loc.line, 1U);
}

TEST(IrParser, AcceptsLiteralsAtTypeBounds)
{
    IrModule module;
    const auto parsed = parseText("global lo: i32 = -2147483648\n"
                                  "func f() -> u8 {\n"
                                  "bb0:\n"
                                  "  %0 = const i16 -32768\n"
                                  "  %1 = const u32 0xffffffff\n"
                                  "  %2 = const u8 255\n"
                                  "  ret %2\n"
                                  "}\n",
                                  module);
    ASSERT_TRUE(parsed) << parsed.error().message;
    ASSERT_EQ(module.functions.size(), 1U);
    const auto &instrs = module.functions[0].blocks[0].instrs;
    ASSERT_EQ(instrs.size(), 3U);
    EXPECT_EQ(instrs[1].operands[0].bits, INT64_C(4294967295));
    EXPECT_EQ(instrs[2].operands[0].bits, 255);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
