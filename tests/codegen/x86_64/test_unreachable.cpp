// File: tests/codegen/x86_64/test_unreachable.cpp
// Purpose: Check that an Unreachable-only function emits nothing past its
//          prologue beyond the configured trap.
// Key invariants: Trap emits exactly one ud2; None emits no instruction; a
//                 function that never returns has no epilogue.
// Ownership/Lifetime: Modules are parsed per test.
// Links: src/codegen/x86_64/TerminatorTranslator.cpp

#include "common/KirFixtures.hpp"

#include <string>
#include <vector>

using namespace kestrel;
using namespace kestrel::codegen::x64;
using namespace kestrel::test;

namespace
{

constexpr const char *kDead = R"(module dead
func dead() {
bb0:
  unreachable
}
)";

} // namespace

TEST(CodegenX64Unreachable, TrapPolicyEmitsSingleUd2)
{
    for (const AbiKind abi : {AbiKind::SysV, AbiKind::Win64})
    {
        const std::string text = translateKir(kDead, optionsFor(abi));
        const std::vector<std::string> instrs = instructionsOf(text, "dead:");
        ASSERT_FALSE(instrs.empty()) << text;
        EXPECT_EQ(instrs.back(), "\tud2\t# unreachable") << text;
        EXPECT_EQ(countOccurrences(text, "ud2"), 1U);
        EXPECT_EQ(text.find("\tret"), std::string::npos);
        EXPECT_EQ(text.find("_epilogue"), std::string::npos);
    }
}

TEST(CodegenX64Unreachable, NonePolicyEmitsNothingAfterPrologue)
{
    TranslatorOptions opts = optionsFor(AbiKind::SysV);
    opts.unreachable = UnreachablePolicy::None;
    const std::string text = translateKir(kDead, opts);

    const std::vector<std::string> expected = {"\tpushq %rbp", "\tmovq %rsp, %rbp"};
    EXPECT_EQ(instructionsOf(text, "dead:"), expected) << text;
    EXPECT_NE(text.find(".Ldead_bb0:\n"), std::string::npos);
}

TEST(CodegenX64Unreachable, ParsesPolicyNames)
{
    EXPECT_EQ(parseUnreachablePolicy("trap"), UnreachablePolicy::Trap);
    EXPECT_EQ(parseUnreachablePolicy("none"), UnreachablePolicy::None);
    EXPECT_FALSE(parseUnreachablePolicy("debug").has_value());
    EXPECT_EQ(TranslatorOptions{}.unreachable, UnreachablePolicy::Trap);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
