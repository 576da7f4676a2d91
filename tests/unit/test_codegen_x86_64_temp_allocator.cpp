// File: tests/unit/test_codegen_x86_64_temp_allocator.cpp
// Purpose: Exercise the temporary register allocator in isolation.
// Key invariants: Temporary ids are never reused; a register is never handed
//                 to two live temporaries; exhaustion raises
//                 RegisterAllocationFailed.
// Ownership/Lifetime: Each test owns its allocator and machine function.
// Links: src/codegen/x86_64/TempRegisterAllocator.hpp

#include "codegen/x86_64/TempRegisterAllocator.hpp"
#include "codegen/x86_64/TranslationError.hpp"

#include <gtest/gtest.h>

#include <set>
#include <variant>

using namespace kestrel::codegen::x64;

TEST(TempRegisterAllocator, IssuesInAllocationOrder)
{
    TempRegisterAllocator temps(sysvTarget());
    const TempReg a = temps.issue(RegClass::GPR);
    const TempReg b = temps.issue(RegClass::GPR);
    const TempReg x = temps.issue(RegClass::XMM);

    EXPECT_EQ(temps.assigned(a.id), PhysReg::R10);
    EXPECT_EQ(temps.assigned(b.id), PhysReg::R11);
    EXPECT_EQ(temps.assigned(x.id), PhysReg::XMM8);
    EXPECT_TRUE(temps.usedCalleeSaved().empty());
}

TEST(TempRegisterAllocator, NeverReusesIds)
{
    TempRegisterAllocator temps(sysvTarget());
    std::set<uint16_t> ids;
    for (int round = 0; round < 4; ++round)
    {
        ids.insert(temps.issue(RegClass::GPR).id);
        ids.insert(temps.issue(RegClass::GPR).id);
        temps.releaseAll();
    }
    EXPECT_EQ(ids.size(), 8U);
    EXPECT_EQ(temps.issuedCount(), 8U);

    // Registers are recycled across instructions even though ids are not.
    const TempReg again = temps.issue(RegClass::GPR);
    EXPECT_EQ(temps.assigned(again.id), PhysReg::R10);
    EXPECT_TRUE(temps.isLive(again.id));
    EXPECT_FALSE(temps.isLive(0));
}

TEST(TempRegisterAllocator, ReportsCalleeSavedUse)
{
    TempRegisterAllocator temps(sysvTarget());
    (void)temps.issue(RegClass::GPR);
    (void)temps.issue(RegClass::GPR);
    (void)temps.issue(RegClass::GPR);
    const auto saved = temps.usedCalleeSaved();
    ASSERT_EQ(saved.size(), 1U);
    EXPECT_EQ(saved[0], PhysReg::RBX);
}

TEST(TempRegisterAllocator, ExhaustionRaisesAllocationFailure)
{
    TempRegisterAllocator temps(win64Target());
    (void)temps.issue(RegClass::XMM);
    (void)temps.issue(RegClass::XMM);
    try
    {
        (void)temps.issue(RegClass::XMM);
        FAIL() << "third XMM temporary should not fit";
    }
    catch (const TranslationException &ex)
    {
        EXPECT_EQ(ex.error().kind, ErrorKind::RegisterAllocationFailed);
    }
}

TEST(TempRegisterAllocator, AssignTemporariesRewritesOperands)
{
    TempRegisterAllocator temps(sysvTarget());
    const TempReg t = temps.issue(RegClass::GPR);

    MFunction func{};
    MBasicBlock block{};
    block.label = ".Lf_bb0";
    block.instructions.push_back(MInstr::make(
        MOpcode::MOVQ, {makeImmOperand(1), makeTempReg(RegClass::GPR, t.id)}));
    block.instructions.push_back(MInstr::make(
        MOpcode::MOVQ,
        {makeMemOperand(makeTempReg(RegClass::GPR, t.id), 8), makePhysReg(PhysReg::RAX)}));
    func.blocks.push_back(std::move(block));

    assignTemporaries(func, temps);

    const auto &instrs = func.blocks.front().instructions;
    const auto *reg = std::get_if<OpReg>(&instrs[0].operands[1]);
    ASSERT_NE(reg, nullptr);
    EXPECT_TRUE(reg->isPhys);
    EXPECT_EQ(static_cast<PhysReg>(reg->idOrPhys), PhysReg::R10);
    const auto *mem = std::get_if<OpMem>(&instrs[1].operands[0]);
    ASSERT_NE(mem, nullptr);
    EXPECT_TRUE(mem->base.isPhys);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
