// File: tests/codegen/x86_64/test_pro_epi.cpp
// Purpose: Verify the frame prologue and epilogue mirror each other,
//          including callee-saved registers claimed by temporaries.
// Key invariants: Registers pushed after the frame pointer are popped in
//                 reverse order before it; the frame pointer pair brackets
//                 the whole function.
// Ownership/Lifetime: Modules are parsed per test and inspected by value.
// Links: src/codegen/x86_64/FrameLowering.cpp

#include "common/KirFixtures.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace kestrel;
using namespace kestrel::codegen::x64;
using namespace kestrel::test;

namespace
{

/// @brief A call with nine integer arguments: three go to the stack under
///        SysV and five under Win64, each through its own temporary.
constexpr const char *kWideCall = R"(module wide
extern sink
func caller(a: i64) -> i64 {
bb0:
  %0 = call i64 @sink(%a, %a, %a, %a, %a, %a, %a, %a, %a)
  ret %0
}
)";

struct FrameRegisters
{
    std::vector<std::string> pushed;
    std::vector<std::string> popped;
};

/// @brief Registers pushed before the first block and popped after the
///        epilogue label, frame pointer excluded.
[[nodiscard]] FrameRegisters frameRegisters(const std::string &text, const std::string &fn)
{
    FrameRegisters regs;
    bool inPrologue = false;
    bool inEpilogue = false;
    for (const std::string &line : splitLines(text))
    {
        if (line == fn + ":")
        {
            inPrologue = true;
            continue;
        }
        if (line == ".L" + fn + "_epilogue:")
        {
            inEpilogue = true;
            continue;
        }
        if (inPrologue && line.rfind(".L", 0) == 0)
        {
            inPrologue = false;
        }
        if (inPrologue && line.rfind("\tpushq ", 0) == 0 && line != "\tpushq %rbp")
        {
            regs.pushed.push_back(line.substr(7));
        }
        if (inEpilogue && line.rfind("\tpopq ", 0) == 0 && line != "\tpopq %rbp")
        {
            regs.popped.push_back(line.substr(6));
        }
    }
    return regs;
}

} // namespace

TEST(CodegenX64FrameLoweringTest, SysVCalleeSavedPairIsSymmetric)
{
    const std::string text = translateKir(kWideCall, optionsFor(AbiKind::SysV));
    FrameRegisters regs = frameRegisters(text, "caller");

    ASSERT_FALSE(regs.pushed.empty()) << text;
    EXPECT_NE(std::find(regs.pushed.begin(), regs.pushed.end(), "%rbx"), regs.pushed.end());
    std::reverse(regs.popped.begin(), regs.popped.end());
    EXPECT_EQ(regs.pushed, regs.popped) << text;
}

TEST(CodegenX64FrameLoweringTest, Win64CalleeSavedPairIsSymmetric)
{
    const std::string text = translateKir(kWideCall, optionsFor(AbiKind::Win64));
    FrameRegisters regs = frameRegisters(text, "caller");

    // Five stack arguments claim R10, R11, RBX, RSI and RDI.
    const std::vector<std::string> expected = {"%rbx", "%rsi", "%rdi"};
    EXPECT_EQ(regs.pushed, expected) << text;
    std::reverse(regs.popped.begin(), regs.popped.end());
    EXPECT_EQ(regs.pushed, regs.popped) << text;
}

TEST(CodegenX64FrameLoweringTest, EmitsCanonicalPrologueAndEpilogue)
{
    const std::string text = translateKir(kWideCall, optionsFor(AbiKind::SysV));
    const std::vector<std::string> instrs = instructionsOf(text, "caller:");
    ASSERT_GE(instrs.size(), 6U) << text;

    // push %rbp; mov %rsp, %rbp; sub locals; push %rbx; sub outgoing.
    EXPECT_EQ(instrs[0], "\tpushq %rbp");
    EXPECT_EQ(instrs[1], "\tmovq %rsp, %rbp");
    EXPECT_EQ(instrs[2], "\tsubq $24, %rsp\t# locals");
    EXPECT_EQ(instrs[3], "\tpushq %rbx");
    EXPECT_EQ(instrs[4], "\tsubq $32, %rsp\t# outgoing arguments");

    const std::vector<std::string> tail(instrs.end() - 5, instrs.end());
    const std::vector<std::string> expectedTail = {"\taddq $32, %rsp\t# outgoing arguments",
                                                   "\tpopq %rbx",
                                                   "\tmovq %rbp, %rsp",
                                                   "\tpopq %rbp",
                                                   "\tret"};
    EXPECT_EQ(tail, expectedTail) << text;
}

TEST(CodegenX64FrameLoweringTest, LeafWithoutSavesHasNoCalleeSavedTraffic)
{
    const std::string text = translateKir("func id(a: i64) -> i64 {\nbb0:\n  ret %a\n}\n",
                                          optionsFor(AbiKind::SysV));
    const FrameRegisters regs = frameRegisters(text, "id");
    EXPECT_TRUE(regs.pushed.empty());
    EXPECT_TRUE(regs.popped.empty());
    EXPECT_EQ(countOccurrences(text, "\tpushq %rbp"), 1U);
    EXPECT_EQ(countOccurrences(text, "\tpopq %rbp"), 1U);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
