//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/TempRegisterAllocator.cpp
// Purpose: Implement temporary issuance and the rewrite of temporaries into
//          physical registers.
// Key invariants: assignment_[id] is fixed when temporary id is issued.
// Ownership/Lifetime: The allocator borrows the singleton TargetInfo.
// Links: src/codegen/x86_64/TempRegisterAllocator.hpp
//
//===----------------------------------------------------------------------===//

#include "TempRegisterAllocator.hpp"

#include "TranslationError.hpp"

#include <algorithm>
#include <limits>
#include <variant>

namespace kestrel::codegen::x64
{

TempRegisterAllocator::TempRegisterAllocator(const TargetInfo &target) : target_(&target) {}

void TempRegisterAllocator::reset()
{
    assignment_.clear();
    live_.clear();
}

TempReg TempRegisterAllocator::issue(RegClass cls)
{
    if (assignment_.size() >= std::numeric_limits<uint16_t>::max())
    {
        raiseError(ErrorKind::RegisterAllocationFailed, "temporary id space exhausted");
    }
    const auto &pool =
        cls == RegClass::GPR ? target_->gprAllocationOrder : target_->xmmAllocationOrder;
    for (const PhysReg candidate : pool)
    {
        const bool held = std::any_of(live_.begin(),
                                      live_.end(),
                                      [&](uint16_t id) { return assignment_[id] == candidate; });
        if (held)
        {
            continue;
        }
        const auto id = static_cast<uint16_t>(assignment_.size());
        assignment_.push_back(candidate);
        live_.push_back(id);
        return TempReg{id, cls};
    }
    raiseError(ErrorKind::RegisterAllocationFailed,
               std::string("no free ") + (cls == RegClass::GPR ? "general-purpose" : "XMM") +
                   " register for a temporary");
}

void TempRegisterAllocator::releaseAll()
{
    live_.clear();
}

PhysReg TempRegisterAllocator::assigned(uint16_t id) const
{
    if (id >= assignment_.size())
    {
        raiseError(ErrorKind::RegisterAllocationFailed,
                   "temporary %t" + std::to_string(id) + " was never issued");
    }
    return assignment_[id];
}

bool TempRegisterAllocator::isLive(uint16_t id) const
{
    return std::find(live_.begin(), live_.end(), id) != live_.end();
}

std::size_t TempRegisterAllocator::issuedCount() const noexcept
{
    return assignment_.size();
}

std::vector<PhysReg> TempRegisterAllocator::usedCalleeSaved() const
{
    std::vector<PhysReg> used;
    for (const auto &pool : {target_->gprAllocationOrder, target_->xmmAllocationOrder})
    {
        for (const PhysReg reg : pool)
        {
            if (!isCalleeSaved(*target_, reg))
            {
                continue;
            }
            if (std::find(assignment_.begin(), assignment_.end(), reg) != assignment_.end())
            {
                used.push_back(reg);
            }
        }
    }
    return used;
}

namespace
{

void rewriteReg(OpReg &reg, const TempRegisterAllocator &temps)
{
    if (reg.isPhys)
    {
        return;
    }
    reg.idOrPhys = static_cast<uint16_t>(temps.assigned(reg.idOrPhys));
    reg.isPhys = true;
}

void rewriteInstr(MInstr &instr, const TempRegisterAllocator &temps)
{
    for (auto &operand : instr.operands)
    {
        if (auto *reg = std::get_if<OpReg>(&operand))
        {
            rewriteReg(*reg, temps);
        }
        else if (auto *mem = std::get_if<OpMem>(&operand))
        {
            rewriteReg(mem->base, temps);
            if (mem->hasIndex)
            {
                rewriteReg(mem->index, temps);
            }
        }
    }
}

} // namespace

void assignTemporaries(MFunction &func, const TempRegisterAllocator &temps)
{
    for (auto &instr : func.prologue)
    {
        rewriteInstr(instr, temps);
    }
    for (auto &block : func.blocks)
    {
        for (auto &instr : block.instructions)
        {
            rewriteInstr(instr, temps);
        }
    }
    for (auto &instr : func.epilogue)
    {
        rewriteInstr(instr, temps);
    }
}

} // namespace kestrel::codegen::x64
