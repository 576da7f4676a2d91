//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/FrameLowering.cpp
// Purpose: Implement frame slot reservation, frame size checking, and the
//          canonical prologue/epilogue instruction sequences.
// Key invariants: After the prologue, %rsp is 16-byte aligned: the saved
//                 %rbp restores alignment, localsAdjust + 8 * saved registers
//                 is a multiple of 16, and the outgoing area is rounded to 16.
// Ownership/Lifetime: Builders return fresh instruction vectors.
// Links: src/codegen/x86_64/FrameLowering.hpp
//
//===----------------------------------------------------------------------===//

#include "FrameLowering.hpp"

#include "TranslationError.hpp"

#include <algorithm>
#include <limits>

namespace kestrel::codegen::x64
{

namespace
{

[[nodiscard]] Operand rsp()
{
    return makePhysReg(PhysReg::RSP);
}

[[nodiscard]] Operand rbp()
{
    return makePhysReg(PhysReg::RBP);
}

} // namespace

int32_t FrameState::allocateSlot(uint32_t bytes)
{
    const int64_t size = roundUp(std::max<int64_t>(bytes, kSlotSizeBytes), kSlotSizeBytes);
    if (localsSize_ + size > std::numeric_limits<int32_t>::max())
    {
        raiseError(ErrorKind::StackOverflow,
                   "local storage of " + std::to_string(localsSize_ + size) +
                       " bytes cannot be addressed from the frame pointer");
    }
    localsSize_ += size;
    return static_cast<int32_t>(-localsSize_);
}

void FrameState::noteCall(int64_t outgoingBytes)
{
    hasCalls_ = true;
    maxOutgoing_ = std::max(maxOutgoing_, outgoingBytes);
}

int64_t FrameState::localsSize() const noexcept
{
    return localsSize_;
}

int64_t FrameState::maxOutgoing() const noexcept
{
    return maxOutgoing_;
}

bool FrameState::hasCalls() const noexcept
{
    return hasCalls_;
}

int64_t roundUp(int64_t value, int64_t align)
{
    const int64_t remainder = value % align;
    if (remainder == 0)
    {
        return value;
    }
    return value + (align - remainder);
}

/// @brief Complete a frame whose locals, saves and outgoing area are known.
/// @details The locals adjustment is padded so that, together with the
///          callee-saved pushes, it keeps %rsp on a 16-byte boundary. A frame
///          using the red zone keeps localsAdjust at zero but still counts its
///          locals towards the size limit.
void finishFrameLayout(FrameInfo &frame, const TargetInfo &target, uint64_t maxFrameSize)
{
    const auto align = static_cast<int64_t>(target.stackAlignment);
    const auto savedBytes = static_cast<int64_t>(frame.usedCalleeSaved.size()) * kSlotSizeBytes;
    if (frame.usesRedZone)
    {
        frame.localsAdjust = 0;
    }
    else
    {
        frame.localsAdjust = roundUp(frame.localsSize + savedBytes, align) - savedBytes;
    }
    frame.outgoingArgArea = roundUp(frame.outgoingArgArea, align);

    const int64_t localsBytes = frame.usesRedZone ? frame.localsSize : frame.localsAdjust;
    frame.frameSize = localsBytes + savedBytes + frame.outgoingArgArea;
    if (static_cast<uint64_t>(frame.frameSize) > maxFrameSize)
    {
        raiseError(ErrorKind::StackOverflow,
                   "stack frame of " + std::to_string(frame.frameSize) +
                       " bytes exceeds the limit of " + std::to_string(maxFrameSize) + " bytes");
    }
}

std::vector<MInstr> buildStandardPrologue(const FrameInfo &frame)
{
    std::vector<MInstr> out;
    out.push_back(MInstr::make(MOpcode::PUSHQ, {rbp()}));
    out.push_back(MInstr::make(MOpcode::MOVQ, {rsp(), rbp()}));
    if (frame.localsAdjust > 0)
    {
        out.push_back(MInstr::make(MOpcode::SUBQ, {makeImmOperand(frame.localsAdjust), rsp()})
                          .withComment("locals"));
    }
    for (const PhysReg reg : frame.usedCalleeSaved)
    {
        out.push_back(MInstr::make(MOpcode::PUSHQ, {makePhysReg(reg)}));
    }
    if (frame.outgoingArgArea > 0)
    {
        out.push_back(
            MInstr::make(MOpcode::SUBQ, {makeImmOperand(frame.outgoingArgArea), rsp()})
                .withComment("outgoing arguments"));
    }
    return out;
}

std::vector<MInstr> buildStandardEpilogue(const FrameInfo &frame)
{
    std::vector<MInstr> out;
    if (frame.outgoingArgArea > 0)
    {
        out.push_back(
            MInstr::make(MOpcode::ADDQ, {makeImmOperand(frame.outgoingArgArea), rsp()})
                .withComment("outgoing arguments"));
    }
    for (auto it = frame.usedCalleeSaved.rbegin(); it != frame.usedCalleeSaved.rend(); ++it)
    {
        out.push_back(MInstr::make(MOpcode::POPQ, {makePhysReg(*it)}));
    }
    if (frame.localsAdjust > 0)
    {
        out.push_back(MInstr::make(MOpcode::MOVQ, {rbp(), rsp()}));
    }
    out.push_back(MInstr::make(MOpcode::POPQ, {rbp()}));
    out.push_back(MInstr::make(MOpcode::RET));
    return out;
}

} // namespace kestrel::codegen::x64
