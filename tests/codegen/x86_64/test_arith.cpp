// File: tests/codegen/x86_64/test_arith.cpp
// Purpose: Cover the integer and floating-point arithmetic emitters.
// Key invariants: Division goes through %rdx:%rax; variable shift counts live
//                 in %cl; literals that fit in 32 bits become immediates and
//                 wider ones use movabsq.
// Ownership/Lifetime: Modules are parsed per test.
// Links: src/codegen/x86_64/Lowering.Arith.cpp

#include "common/KirFixtures.hpp"

#include <string>
#include <vector>

using namespace kestrel;
using namespace kestrel::codegen::x64;
using namespace kestrel::test;

namespace
{

[[nodiscard]] std::string sysv(const std::string &text)
{
    return translateKir(text, optionsFor(AbiKind::SysV));
}

[[nodiscard]] bool contains(const std::string &text, const std::string &needle)
{
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST(CodegenX64Arith, SignedDivisionSignExtendsIntoRdx)
{
    const std::string text = sysv(R"(func quot(a: i64, b: i64) -> i64 {
bb0:
  %0 = div i64 %a, %b
  ret %0
}
)");
    const std::vector<std::string> body = instructionsOf(text, "quot:");
    const std::vector<std::string> expected = {
        "\tpushq %rbp",
        "\tmovq %rsp, %rbp",
        "\tmovq %rdi, -8(%rbp)\t# %a",
        "\tmovq %rsi, -16(%rbp)\t# %b",
        "\tmovq -8(%rbp), %rax",
        "\tcqto",
        "\tidivq -16(%rbp)",
        "\tmovq %rax, -24(%rbp)",
        "\tmovq -24(%rbp), %rax",
        "\tpopq %rbp",
        "\tret",
    };
    EXPECT_EQ(body, expected) << text;
}

TEST(CodegenX64Arith, UnsignedDivisionClearsRdx)
{
    const std::string text = sysv(R"(func uquot(a: u64, b: u64) -> u64 {
bb0:
  %0 = div u64 %a, %b
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\txorl %edx, %edx\n\tdivq -16(%rbp)\n")) << text;
    EXPECT_FALSE(contains(text, "cqto"));
}

TEST(CodegenX64Arith, LiteralDivisorIsMaterialised)
{
    const std::string text = sysv(R"(func sevenths(a: i64) -> i64 {
bb0:
  %0 = div i64 %a, 7
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tcqto\n\tmovq $7, %r10\n\tidivq %r10\n")) << text;
}

TEST(CodegenX64Arith, ShiftByLiteralUsesImmediate)
{
    const std::string text = sysv(R"(func times8(a: i64) -> i64 {
bb0:
  %0 = shl i64 %a, 3
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tmovq -8(%rbp), %r10\n\tshlq $3, %r10\n")) << text;
    EXPECT_FALSE(contains(text, "%rcx"));
}

TEST(CodegenX64Arith, ShiftByValueUsesCl)
{
    const std::string text = sysv(R"(func lshift(a: i64, n: i64) -> i64 {
bb0:
  %0 = shl i64 %a, %n
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tmovq -16(%rbp), %rcx\n\tshlq %cl, %r10\n")) << text;
}

TEST(CodegenX64Arith, RightShiftFollowsSignedness)
{
    const std::string sar = sysv(R"(func sar(a: i64) -> i64 {
bb0:
  %0 = shr i64 %a, 2
  ret %0
}
)");
    const std::string shr = sysv(R"(func shr(a: u64) -> u64 {
bb0:
  %0 = shr u64 %a, 2
  ret %0
}
)");
    EXPECT_TRUE(contains(sar, "\tsarq $2, %r10")) << sar;
    EXPECT_TRUE(contains(shr, "\tshrq $2, %r10")) << shr;
}

TEST(CodegenX64Arith, NarrowResultsAreRenormalised)
{
    const std::string text = sysv(R"(func add32(a: i32, b: i32) -> i32 {
bb0:
  %0 = add i32 %a, %b
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\taddq -16(%rbp), %r10\n\tmovslq %r10d, %r10\n\tmovq %r10, -24(%rbp)\n"))
        << text;
}

TEST(CodegenX64Arith, ConstantsFoldToImmediatesOrMovabs)
{
    const std::string small = sysv(R"(func five() -> i64 {
bb0:
  %0 = const i64 5
  ret %0
}
)");
    const std::string wide = sysv(R"(func wide() -> i64 {
bb0:
  ret 0x0123456789ABCDEF
}
)");
    EXPECT_TRUE(contains(small, "\tmovq $5, %rax")) << small;
    EXPECT_TRUE(contains(wide, "\tmovabsq $81985529216486895, %rax")) << wide;
}

TEST(CodegenX64Arith, LiteralRightOperandIsImmediate)
{
    const std::string text = sysv(R"(func bump(a: i64) -> i64 {
bb0:
  %0 = add i64 %a, 1
  %1 = mul i64 %0, -3
  ret %1
}
)");
    EXPECT_TRUE(contains(text, "\taddq $1, %r10")) << text;
    EXPECT_TRUE(contains(text, "\timulq $-3, %r10")) << text;
}

TEST(CodegenX64Arith, DoubleArithmeticUsesScalarSse)
{
    const std::string text = sysv(R"(func fadd(x: f64, y: f64) -> f64 {
bb0:
  %0 = add f64 %x, %y
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tmovsd -8(%rbp), %xmm8\n\taddsd -16(%rbp), %xmm8\n")) << text;
    EXPECT_TRUE(contains(text, "\tmovsd -24(%rbp), %xmm0")) << text;
}

TEST(CodegenX64Arith, FloatEqualityRejectsUnordered)
{
    const std::string text = sysv(R"(func feq(x: f64, y: f64) -> bool {
bb0:
  %0 = eq f64 %x, %y
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tucomisd")) << text;
    EXPECT_TRUE(contains(text, "\tsete")) << text;
    EXPECT_TRUE(contains(text, "\tsetnp")) << text;
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
