//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TempRegisterAllocator.hpp
// Purpose: Declare the issuer of function-scoped temporary registers and the
//          naive one-to-one mapping of those temporaries onto the ABI's
//          priority-ordered allocation lists.
// Key invariants: Temporary ids increase monotonically within a function and
//                 are never reused. Two temporaries live at the same time never
//                 share a physical register. No temporary maps onto a register
//                 outside TargetInfo::gprAllocationOrder/xmmAllocationOrder.
// Ownership/Lifetime: Owned by TranslationContext; reset at every function.
// Links: src/codegen/x86_64/TargetX64.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "TargetX64.hpp"

#include <cstdint>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Handle to an issued temporary.
struct TempReg
{
    uint16_t id{0};
    RegClass cls{RegClass::GPR};
};

/// \brief Issues temporaries and records their physical assignment.
/// \details A temporary is live from issue until releaseAll(), which the
///          translator calls once every IR instruction has been expanded.
///          At issue time the temporary is bound to the first register of its
///          class's allocation list that no live temporary holds.
class TempRegisterAllocator
{
  public:
    explicit TempRegisterAllocator(const TargetInfo &target);

    /// \brief Forget every temporary; called at each function boundary.
    void reset();

    /// \brief Issue a fresh temporary of class @p cls.
    /// \throws TranslationException (RegisterAllocationFailed) when every
    ///         register of the class is held by a live temporary.
    [[nodiscard]] TempReg issue(RegClass cls);

    /// \brief End the lifetime of every live temporary.
    void releaseAll();

    /// \brief Physical register bound to temporary @p id.
    [[nodiscard]] PhysReg assigned(uint16_t id) const;

    /// \brief Whether temporary @p id is currently live.
    [[nodiscard]] bool isLive(uint16_t id) const;

    /// \brief Number of temporaries issued since the last reset.
    [[nodiscard]] std::size_t issuedCount() const noexcept;

    /// \brief Callee-saved registers bound to any temporary, in allocation order.
    [[nodiscard]] std::vector<PhysReg> usedCalleeSaved() const;

  private:
    const TargetInfo *target_;
    std::vector<PhysReg> assignment_{};
    std::vector<uint16_t> live_{};
};

/// \brief Rewrite every temporary operand in @p func to its physical register.
void assignTemporaries(MFunction &func, const TempRegisterAllocator &temps);

} // namespace kestrel::codegen::x64
