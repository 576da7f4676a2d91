//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TargetX64.cpp
// Purpose: Build the System V and Windows x64 target descriptions and the
//          register naming helpers used by the assembly emitter.
// Key invariants: Singleton data is initialised once with ABI-compliant
//                 register sets and remains immutable.
// Ownership/Lifetime: All data is stored in static duration objects.
// Links: src/codegen/x86_64/TargetX64.hpp
//
//===----------------------------------------------------------------------===//

#include "TargetX64.hpp"

#include <algorithm>
#include <array>

namespace kestrel::codegen::x64
{

namespace
{

TargetInfo makeSysVTarget()
{
    TargetInfo info{};
    info.abi = AbiKind::SysV;
    info.intArgOrder = {
        PhysReg::RDI,
        PhysReg::RSI,
        PhysReg::RDX,
        PhysReg::RCX,
        PhysReg::R8,
        PhysReg::R9,
    };
    info.floatArgOrder = {
        PhysReg::XMM0,
        PhysReg::XMM1,
        PhysReg::XMM2,
        PhysReg::XMM3,
        PhysReg::XMM4,
        PhysReg::XMM5,
        PhysReg::XMM6,
        PhysReg::XMM7,
    };
    info.sharedArgIndexSpace = false;
    info.maxIntRegArgs = 6;
    info.maxFloatRegArgs = 8;
    info.volatileGPR = {
        PhysReg::RAX,
        PhysReg::RCX,
        PhysReg::RDX,
        PhysReg::RSI,
        PhysReg::RDI,
        PhysReg::R8,
        PhysReg::R9,
        PhysReg::R10,
        PhysReg::R11,
    };
    info.nonVolatileGPR = {
        PhysReg::RBX,
        PhysReg::RBP,
        PhysReg::R12,
        PhysReg::R13,
        PhysReg::R14,
        PhysReg::R15,
    };
    info.volatileXMM = {
        PhysReg::XMM0,
        PhysReg::XMM1,
        PhysReg::XMM2,
        PhysReg::XMM3,
        PhysReg::XMM4,
        PhysReg::XMM5,
        PhysReg::XMM6,
        PhysReg::XMM7,
        PhysReg::XMM8,
        PhysReg::XMM9,
        PhysReg::XMM10,
        PhysReg::XMM11,
        PhysReg::XMM12,
        PhysReg::XMM13,
        PhysReg::XMM14,
        PhysReg::XMM15,
    };
    info.nonVolatileXMM = {};
    info.gprAllocationOrder = {
        PhysReg::R10,
        PhysReg::R11,
        PhysReg::RBX,
        PhysReg::R12,
        PhysReg::R13,
        PhysReg::R14,
        PhysReg::R15,
    };
    info.xmmAllocationOrder = {
        PhysReg::XMM8,
        PhysReg::XMM9,
        PhysReg::XMM10,
        PhysReg::XMM11,
        PhysReg::XMM12,
        PhysReg::XMM13,
        PhysReg::XMM14,
        PhysReg::XMM15,
    };
    info.intReturnReg = PhysReg::RAX;
    info.floatReturnReg = PhysReg::XMM0;
    info.stackAlignment = 16U;
    info.hasRedZone = true;
    info.redZoneSize = 128U;
    info.shadowSpace = 0U;
    info.requiresFramePointer = false;
    return info;
}

TargetInfo makeWin64Target()
{
    TargetInfo info{};
    info.abi = AbiKind::Win64;
    info.intArgOrder = {
        PhysReg::RCX,
        PhysReg::RDX,
        PhysReg::R8,
        PhysReg::R9,
    };
    info.floatArgOrder = {
        PhysReg::XMM0,
        PhysReg::XMM1,
        PhysReg::XMM2,
        PhysReg::XMM3,
    };
    info.sharedArgIndexSpace = true;
    info.maxIntRegArgs = 4;
    info.maxFloatRegArgs = 4;
    info.volatileGPR = {
        PhysReg::RAX,
        PhysReg::RCX,
        PhysReg::RDX,
        PhysReg::R8,
        PhysReg::R9,
        PhysReg::R10,
        PhysReg::R11,
    };
    info.nonVolatileGPR = {
        PhysReg::RBX,
        PhysReg::RBP,
        PhysReg::RDI,
        PhysReg::RSI,
        PhysReg::R12,
        PhysReg::R13,
        PhysReg::R14,
        PhysReg::R15,
    };
    info.volatileXMM = {
        PhysReg::XMM0,
        PhysReg::XMM1,
        PhysReg::XMM2,
        PhysReg::XMM3,
        PhysReg::XMM4,
        PhysReg::XMM5,
    };
    info.nonVolatileXMM = {
        PhysReg::XMM6,
        PhysReg::XMM7,
        PhysReg::XMM8,
        PhysReg::XMM9,
        PhysReg::XMM10,
        PhysReg::XMM11,
        PhysReg::XMM12,
        PhysReg::XMM13,
        PhysReg::XMM14,
        PhysReg::XMM15,
    };
    info.gprAllocationOrder = {
        PhysReg::R10,
        PhysReg::R11,
        PhysReg::RBX,
        PhysReg::RSI,
        PhysReg::RDI,
        PhysReg::R12,
        PhysReg::R13,
        PhysReg::R14,
        PhysReg::R15,
    };
    // Only volatile XMM registers: saving non-volatile XMM state would need
    // 16-byte spill slots the frame does not model.
    info.xmmAllocationOrder = {
        PhysReg::XMM4,
        PhysReg::XMM5,
    };
    info.intReturnReg = PhysReg::RAX;
    info.floatReturnReg = PhysReg::XMM0;
    info.stackAlignment = 16U;
    info.hasRedZone = false;
    info.redZoneSize = 0U;
    info.shadowSpace = 32U;
    info.requiresFramePointer = false;
    return info;
}

struct RegNames
{
    const char *q;
    const char *d;
    const char *w;
    const char *b;
};

constexpr std::array<RegNames, 16> kGprNames{{
    {"%rax", "%eax", "%ax", "%al"},
    {"%rbx", "%ebx", "%bx", "%bl"},
    {"%rcx", "%ecx", "%cx", "%cl"},
    {"%rdx", "%edx", "%dx", "%dl"},
    {"%rsi", "%esi", "%si", "%sil"},
    {"%rdi", "%edi", "%di", "%dil"},
    {"%r8", "%r8d", "%r8w", "%r8b"},
    {"%r9", "%r9d", "%r9w", "%r9b"},
    {"%r10", "%r10d", "%r10w", "%r10b"},
    {"%r11", "%r11d", "%r11w", "%r11b"},
    {"%r12", "%r12d", "%r12w", "%r12b"},
    {"%r13", "%r13d", "%r13w", "%r13b"},
    {"%r14", "%r14d", "%r14w", "%r14b"},
    {"%r15", "%r15d", "%r15w", "%r15b"},
    {"%rbp", "%ebp", "%bp", "%bpl"},
    {"%rsp", "%esp", "%sp", "%spl"},
}};

constexpr std::array<const char *, 16> kXmmNames{
    "%xmm0",
    "%xmm1",
    "%xmm2",
    "%xmm3",
    "%xmm4",
    "%xmm5",
    "%xmm6",
    "%xmm7",
    "%xmm8",
    "%xmm9",
    "%xmm10",
    "%xmm11",
    "%xmm12",
    "%xmm13",
    "%xmm14",
    "%xmm15",
};

} // namespace

const TargetInfo &sysvTarget() noexcept
{
    static const TargetInfo info = makeSysVTarget();
    return info;
}

const TargetInfo &win64Target() noexcept
{
    static const TargetInfo info = makeWin64Target();
    return info;
}

AbiKind hostAbiKind() noexcept
{
#ifdef _WIN32
    return AbiKind::Win64;
#else
    return AbiKind::SysV;
#endif
}

std::optional<AbiKind> parseAbiKind(std::string_view text) noexcept
{
    if (text == "sysv")
    {
        return AbiKind::SysV;
    }
    if (text == "win64")
    {
        return AbiKind::Win64;
    }
    return std::nullopt;
}

const char *abiKindName(AbiKind abi) noexcept
{
    return abi == AbiKind::Win64 ? "win64" : "sysv";
}

bool isGPR(PhysReg reg) noexcept
{
    return static_cast<int>(reg) <= static_cast<int>(PhysReg::RSP);
}

bool isXMM(PhysReg reg) noexcept
{
    return !isGPR(reg);
}

bool isCalleeSaved(const TargetInfo &target, PhysReg reg) noexcept
{
    const auto &set = isGPR(reg) ? target.nonVolatileGPR : target.nonVolatileXMM;
    return std::find(set.begin(), set.end(), reg) != set.end();
}

const char *regName(PhysReg reg, unsigned widthBytes) noexcept
{
    if (isXMM(reg))
    {
        return kXmmNames[static_cast<std::size_t>(reg) - static_cast<std::size_t>(PhysReg::XMM0)];
    }
    const RegNames &names = kGprNames[static_cast<std::size_t>(reg)];
    switch (widthBytes)
    {
        case 1:
            return names.b;
        case 2:
            return names.w;
        case 4:
            return names.d;
        default:
            return names.q;
    }
}

} // namespace kestrel::codegen::x64
