// File: tests/codegen/x86_64/test_memory.cpp
// Purpose: Check stack allocation, loads and stores through frame slots and
//          globals, and the data sections globals produce.
// Key invariants: An alloca'd address is used directly as an %rbp-relative
//                 operand; globals are addressed %rip-relative; narrow loads
//                 extend to 64 bits according to their signedness.
// Ownership/Lifetime: Modules are parsed per test.
// Links: src/codegen/x86_64/Lowering.Mem.cpp, src/codegen/x86_64/Translator.cpp

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

TEST(CodegenX64Memory, AllocaStoreLoadRoundTripsThroughTheFrame)
{
    const std::string text = sysv(R"(func local(a: i64) -> i64 {
bb0:
  %0 = alloca i64
  store i64 %a, %0
  %1 = load i64 %0
  ret %1
}
)");
    const std::vector<std::string> expected = {
        "\tpushq %rbp",
        "\tmovq %rsp, %rbp",
        "\tmovq %rdi, -8(%rbp)\t# %a",
        "\tmovq -8(%rbp), %r10",
        "\tmovq %r10, -16(%rbp)",
        "\tmovq -16(%rbp), %r10",
        "\tmovq %r10, -24(%rbp)",
        "\tmovq -24(%rbp), %rax",
        "\tpopq %rbp",
        "\tret",
    };
    EXPECT_EQ(instructionsOf(text, "local:"), expected) << text;
}

TEST(CodegenX64Memory, GlobalsAreRipRelative)
{
    const std::string text = sysv(R"(module mem
global counter: i64 = 0
global buffer: array<64>
func bump() -> i64 {
bb0:
  store i64 5, @counter
  %0 = load i64 @counter
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tmovq $5, counter(%rip)\n")) << text;
    EXPECT_TRUE(contains(text, "\tmovq counter(%rip), %r10\n")) << text;
    EXPECT_TRUE(contains(text, "\t.data\n\t.globl counter\n\t.p2align 3\ncounter:\n\t.quad 0\n"))
        << text;
    EXPECT_TRUE(contains(text, "\t.bss\n\t.globl buffer\n\t.p2align 3\nbuffer:\n\t.zero 64\n"))
        << text;
    EXPECT_LT(text.find("\t.text"), text.find("\t.data"));
    EXPECT_LT(text.find("\t.data"), text.find("\t.bss"));
}

TEST(CodegenX64Memory, GlobalAddressIsTakenWithLea)
{
    const std::string text = sysv(R"(module mem
global buffer: array<64>
func base() -> ptr {
bb0:
  ret @buffer
}
)");
    EXPECT_TRUE(contains(text, "\tleaq buffer(%rip), %rax\n")) << text;
}

TEST(CodegenX64Memory, NarrowLoadsExtendBySignedness)
{
    const std::string text = sysv(R"(module mem
global wide: i32 = -2
global small: u8 = 200
func widen() -> i64 {
bb0:
  %0 = load i32 @wide
  %1 = load u8 @small
  ret 0
}
)");
    EXPECT_TRUE(contains(text, "\tmovslq wide(%rip), %r10\n")) << text;
    EXPECT_TRUE(contains(text, "\tmovzbq small(%rip), %r10\n")) << text;
    EXPECT_TRUE(contains(text, "wide:\n\t.long -2\n")) << text;
    EXPECT_TRUE(contains(text, "small:\n\t.byte -56\n")) << text;
}

TEST(CodegenX64Memory, NarrowStoreUsesByteImmediate)
{
    const std::string text = sysv(R"(module mem
global flag: u8
func setflag(v: u8) -> void {
bb0:
  store u8 %v, @flag
  store u8 200, @flag
  ret
}
)");
    EXPECT_TRUE(contains(text, "\tmovq -8(%rbp), %r10\n\tmovb %r10b, flag(%rip)\n")) << text;
    EXPECT_TRUE(contains(text, "\tmovb $-56, flag(%rip)\n")) << text;
}

TEST(CodegenX64Memory, LoadThroughPointerValue)
{
    const std::string text = sysv(R"(func deref(p: ptr) -> i64 {
bb0:
  %0 = load i64 %p
  ret %0
}
)");
    EXPECT_TRUE(contains(text, "\tmovq -8(%rbp), %r10\n\tmovq (%r10), %r11\n")) << text;
}

TEST(CodegenX64Memory, AggregateLoadIsUnsupported)
{
    const ir::IrModule module = parseKir(R"(module mem
global blob: struct<16>
func grab() -> i64 {
bb0:
  %0 = load struct<16> @blob
  ret 0
}
)");
    const TranslationResult result = translateModule(module, optionsFor(AbiKind::SysV));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::UnsupportedType);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
