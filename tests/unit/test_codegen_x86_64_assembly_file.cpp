// File: tests/unit/test_codegen_x86_64_assembly_file.cpp
// Purpose: Verify section ordering, instruction formatting, the line map and
//          sealing of the assembly file value.
// Key invariants: Sections render text, data, bss; empty sections are
//                 omitted; a rendered file rejects further appends.
// Ownership/Lifetime: Each test owns its file.
// Links: src/codegen/x86_64/AssemblyFile.hpp

#include "codegen/x86_64/AsmEmitter.hpp"
#include "codegen/x86_64/AssemblyFile.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <type_traits>

using namespace kestrel;
using namespace kestrel::codegen::x64;

TEST(AssemblyFile, RendersSectionsInFixedOrder)
{
    AssemblyFile file;
    file.addHeaderDirective("\t.file \"t\"");
    file.appendDirective(Section::Bss, ".zero 8");
    file.appendLabel(Section::Data, "value");
    file.appendDirective(Section::Data, ".quad 1");
    file.appendInstr(Section::Text, MInstr::make(MOpcode::RET));

    const RenderedAssembly out = file.render(true);
    EXPECT_EQ(out.text,
              "\t.file \"t\"\n"
              "\t.text\n"
              "\tret\n"
              "\t.data\n"
              "value:\n"
              "\t.quad 1\n"
              "\t.bss\n"
              "\t.zero 8\n");
}

TEST(AssemblyFile, FormatsOperandsAndComments)
{
    AssemblyFile file;
    MInstr store = MInstr::make(
        MOpcode::MOVQ, {makePhysReg(PhysReg::RDI), makeMemOperand(makePhysReg(PhysReg::RBP), -8)});
    store.withComment("%a");
    file.appendInstr(Section::Text, store);
    file.appendInstr(Section::Text,
                     MInstr::make(MOpcode::LEAQ,
                                  {makeRipLabelOperand("counter"), makePhysReg(PhysReg::RAX)}));

    EXPECT_EQ(file.render(true).text,
              "\t.text\n"
              "\tmovq %rdi, -8(%rbp)\t# %a\n"
              "\tleaq counter(%rip), %rax\n");
}

TEST(AssemblyFile, OmitsCommentsOnRequest)
{
    AssemblyFile file;
    file.appendInstr(Section::Text, MInstr::make(MOpcode::UD2).withComment("unreachable"));
    EXPECT_EQ(file.render(false).text, "\t.text\n\tud2\n");
}

TEST(AssemblyFile, MapsInstructionsWithOrigins)
{
    MFunction fn{};
    fn.name = "f";
    fn.prologue.push_back(MInstr::make(MOpcode::PUSHQ, {makePhysReg(PhysReg::RBP)}));
    MBasicBlock block{};
    block.label = ".Lf_bb0";
    MInstr ret = MInstr::make(MOpcode::MOVQ, {makeImmOperand(0), makePhysReg(PhysReg::RAX)});
    ret.origin = support::SourceLoc{1, 4, 3};
    block.instructions.push_back(ret);
    fn.blocks.push_back(block);

    AssemblyFile file;
    file.appendFunction(fn);
    const RenderedAssembly out = file.render(true);

    // .text, .globl, .p2align, f:, pushq, .Lf_bb0:, movq
    ASSERT_EQ(out.lines.size(), 1U);
    EXPECT_EQ(out.lines[0].asmLine, 7U);
    EXPECT_EQ(out.lines[0].label, ".Lf_bb0");
    EXPECT_EQ(out.lines[0].irLoc.line, 4U);
    EXPECT_TRUE(fn.epilogueLabel.empty());
    EXPECT_EQ(out.text.find(".Lf_epilogue"), std::string::npos);
}

TEST(AssemblyFile, EveryOpcodeHasAMnemonic)
{
    using Raw = std::underlying_type_t<MOpcode>;
    for (Raw raw = 0; raw <= static_cast<Raw>(MOpcode::MOVSS); ++raw)
    {
        const MInstr instr = MInstr::make(static_cast<MOpcode>(raw));
        EXPECT_NE(AsmEmitter::mnemonic(instr), "<unknown>") << "opcode " << static_cast<int>(raw);
    }
    EXPECT_EQ(AsmEmitter::mnemonic(MInstr::make(MOpcode::MOVSS)), "movss");
}

TEST(AssemblyFile, RejectsAppendAfterRender)
{
    AssemblyFile file;
    (void)file.render(true);
    EXPECT_TRUE(file.sealed());
    EXPECT_THROW(file.appendDirective(Section::Text, ".p2align 4"), std::logic_error);
    EXPECT_THROW((void)file.render(true), std::logic_error);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
