//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TargetX64.hpp
// Purpose: Define physical registers, register classes, and the per-ABI target
//          facts (parameter registers, register classification, stack-frame
//          rules) for the System V and Windows x64 calling conventions.
// Key invariants: TargetInfo singletons are built once and never mutated.
//                 Temporary allocation lists never contain a parameter
//                 register or a register used implicitly by instruction rules
//                 (%rax, %rcx, %rdx, %rsp, %rbp).
// Ownership/Lifetime: Singletons have static storage duration.
// Links: src/codegen/x86_64/AbiAdapter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Enumerates the x86-64 registers the translator can name.
enum class PhysReg
{
    RAX,
    RBX,
    RCX,
    RDX,
    RSI,
    RDI,
    R8,
    R9,
    R10,
    R11,
    R12,
    R13,
    R14,
    R15,
    RBP,
    RSP,
    XMM0,
    XMM1,
    XMM2,
    XMM3,
    XMM4,
    XMM5,
    XMM6,
    XMM7,
    XMM8,
    XMM9,
    XMM10,
    XMM11,
    XMM12,
    XMM13,
    XMM14,
    XMM15
};

/// \brief Register classification used by temporaries and parameter mapping.
enum class RegClass
{
    GPR,
    XMM
};

/// \brief The two supported calling conventions.
enum class AbiKind
{
    SysV,
    Win64
};

/// \brief Size of a single value home or stack argument slot in bytes.
inline constexpr int kSlotSizeBytes = 8;

/// \brief Captures the calling-convention contract of one ABI.
/// \invariant Populated once during singleton creation and constant afterwards.
struct TargetInfo
{
    AbiKind abi{AbiKind::SysV};
    /// \brief Integer/pointer parameter registers in argument order.
    std::vector<PhysReg> intArgOrder{};
    /// \brief Floating-point parameter registers in argument order.
    std::vector<PhysReg> floatArgOrder{};
    /// \brief True when integer and float parameters consume one shared
    ///        positional index (Windows), false for independent counters.
    bool sharedArgIndexSpace{false};
    std::size_t maxIntRegArgs{0};
    std::size_t maxFloatRegArgs{0};
    /// \brief Caller-saved (volatile) registers.
    std::vector<PhysReg> volatileGPR{};
    std::vector<PhysReg> volatileXMM{};
    /// \brief Callee-saved (non-volatile) registers, excluding %rsp.
    std::vector<PhysReg> nonVolatileGPR{};
    std::vector<PhysReg> nonVolatileXMM{};
    /// \brief Priority-ordered registers handed out to temporaries.
    std::vector<PhysReg> gprAllocationOrder{};
    std::vector<PhysReg> xmmAllocationOrder{};
    PhysReg intReturnReg{PhysReg::RAX};
    PhysReg floatReturnReg{PhysReg::XMM0};
    /// \brief Required stack alignment at call boundaries (bytes).
    unsigned stackAlignment{16U};
    bool hasRedZone{false};
    unsigned redZoneSize{0U};
    /// \brief Bytes the caller reserves above outgoing stack arguments.
    unsigned shadowSpace{0U};
    /// \brief Whether the ABI itself mandates a frame pointer.
    bool requiresFramePointer{false};
};

/// \brief Returns the singleton System V AMD64 description.
[[nodiscard]] const TargetInfo &sysvTarget() noexcept;

/// \brief Returns the singleton Windows x64 description.
[[nodiscard]] const TargetInfo &win64Target() noexcept;

/// \brief The convention native to the host this binary was built for.
[[nodiscard]] AbiKind hostAbiKind() noexcept;

/// \brief Parse an ABI identifier ("sysv" or "win64").
[[nodiscard]] std::optional<AbiKind> parseAbiKind(std::string_view text) noexcept;

/// \brief Identifier of @p abi as accepted by parseAbiKind.
[[nodiscard]] const char *abiKindName(AbiKind abi) noexcept;

/// \brief Determines if a physical register belongs to the general-purpose class.
[[nodiscard]] bool isGPR(PhysReg reg) noexcept;

/// \brief Determines if a physical register belongs to the XMM class.
[[nodiscard]] bool isXMM(PhysReg reg) noexcept;

/// \brief True when @p reg must be preserved by a callee under @p target.
[[nodiscard]] bool isCalleeSaved(const TargetInfo &target, PhysReg reg) noexcept;

/// \brief Provides the AT&T name of a register at the given access width.
/// \param widthBytes 8, 4, 2 or 1 for GPRs; ignored for XMM registers.
[[nodiscard]] const char *regName(PhysReg reg, unsigned widthBytes = 8) noexcept;

} // namespace kestrel::codegen::x64
