//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/FrameLowering.hpp
// Purpose: Declare the stack-frame bookkeeping used while a function is
//          translated and the shared prologue/epilogue sequences.
// Key invariants: Value homes are addressed off %rbp with negative
//                 displacements; %rsp is 16-byte aligned at every call site;
//                 the epilogue restores exactly the registers the prologue
//                 saved, in reverse order.
// Ownership/Lifetime: FrameState lives in the per-function part of
//                     TranslationContext; FrameInfo is a plain value.
// Links: src/codegen/x86_64/AbiAdapter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "TargetX64.hpp"

#include <cstdint>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Frame requirements accumulated while translating one function.
class FrameState
{
  public:
    /// \brief Reserve @p bytes (rounded up to 8) below the saved %rbp.
    /// \return The %rbp-relative displacement of the new slot.
    /// \throws TranslationException (StackOverflow) past the 32-bit range.
    [[nodiscard]] int32_t allocateSlot(uint32_t bytes);

    /// \brief Record a call needing @p outgoingBytes of argument space at %rsp.
    void noteCall(int64_t outgoingBytes);

    [[nodiscard]] int64_t localsSize() const noexcept;
    [[nodiscard]] int64_t maxOutgoing() const noexcept;
    [[nodiscard]] bool hasCalls() const noexcept;

  private:
    int64_t localsSize_{0};
    int64_t maxOutgoing_{0};
    bool hasCalls_{false};
};

/// \brief Final frame layout of a function.
/// \details Layout below the return address: saved %rbp, the locals area of
///          localsAdjust bytes, the pushed callee-saved registers, then the
///          outgoing argument area (which includes any shadow space).
struct FrameInfo
{
    int64_t localsSize{0};                  ///< Bytes of homes and allocations.
    int64_t localsAdjust{0};                ///< Bytes subtracted for locals (0 in the red zone).
    int64_t outgoingArgArea{0};             ///< Bytes reserved for calls at %rsp.
    std::vector<PhysReg> usedCalleeSaved{}; ///< Pushed after the locals adjustment.
    bool usesRedZone{false};                ///< Locals live below %rsp without adjustment.
    int64_t frameSize{0};                   ///< Total bytes below the saved %rbp.
};

/// \brief Round @p value up to the next multiple of @p align.
[[nodiscard]] int64_t roundUp(int64_t value, int64_t align);

/// \brief Pad the locals area so %rsp stays aligned after the register pushes,
///        compute the frame size, and enforce @p maxFrameSize.
/// \throws TranslationException (StackOverflow) when the frame is too large.
void finishFrameLayout(FrameInfo &frame, const TargetInfo &target, uint64_t maxFrameSize);

/// \brief pushq %rbp; movq %rsp, %rbp; [subq locals]; pushq saved...; [subq outgoing].
[[nodiscard]] std::vector<MInstr> buildStandardPrologue(const FrameInfo &frame);

/// \brief [addq outgoing]; popq saved (reverse)...; [movq %rbp, %rsp]; popq %rbp; ret.
[[nodiscard]] std::vector<MInstr> buildStandardEpilogue(const FrameInfo &frame);

} // namespace kestrel::codegen::x64
