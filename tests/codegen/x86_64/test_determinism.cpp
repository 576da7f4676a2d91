// File: tests/codegen/x86_64/test_determinism.cpp
// Purpose: Re-translate the same module and require byte-identical output.
// Key invariants: Output depends only on the module and the options, not on
//                 hash ordering or translator reuse.
// Ownership/Lifetime: A single Translator is reused across runs.
// Links: src/codegen/x86_64/Translator.cpp

#include "common/KirFixtures.hpp"

#include <string>

using namespace kestrel;
using namespace kestrel::codegen::x64;
using namespace kestrel::test;

namespace
{

constexpr const char *kModule = R"(module det
global total: i64 = 0
global flags: u8
func clamp(x: i64, lo: i64, hi: i64) -> i64 {
bb0:
  %0 = lt i64 %x, %lo
  br %0, bb1, bb2
bb1:
  ret %lo
bb2:
  %1 = gt i64 %x, %hi
  br %1, bb3, bb4
bb3:
  ret %hi
bb4:
  %2 = load i64 @total
  %3 = add i64 %2, %x
  store i64 %3, @total
  ret %x
}
func scale(x: f64, k: f32) -> f64 {
bb0:
  %0 = mul f64 %x, 2.5
  %1 = sub f64 %0, %x
  ret %1
}
)";

} // namespace

TEST(CodegenX64Determinism, RepeatedTranslationIsByteIdentical)
{
    const ir::IrModule module = parseKir(kModule);
    for (const AbiKind abi : {AbiKind::SysV, AbiKind::Win64})
    {
        TranslatorOptions opts = optionsFor(abi);
        opts.emitSourceMap = true;
        const Translator translator(opts);

        const TranslationResult first = translator.translate(module);
        ASSERT_TRUE(first) << first.error().message;
        for (int run = 0; run < 3; ++run)
        {
            const TranslationResult again = translator.translate(module);
            ASSERT_TRUE(again);
            EXPECT_EQ(again.value().assembly, first.value().assembly);
            EXPECT_EQ(again.value().sourceMap, first.value().sourceMap);
        }
        EXPECT_EQ(translateModule(module, opts).value().assembly, first.value().assembly);
    }
}

TEST(CodegenX64Determinism, ConventionsDiffer)
{
    const ir::IrModule module = parseKir(kModule);
    const auto sysv = translateModule(module, optionsFor(AbiKind::SysV));
    const auto win64 = translateModule(module, optionsFor(AbiKind::Win64));
    ASSERT_TRUE(sysv);
    ASSERT_TRUE(win64);
    EXPECT_NE(sysv.value().assembly, win64.value().assembly);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
