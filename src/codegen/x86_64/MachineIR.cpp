//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/MachineIR.cpp
// Purpose: Provide the concrete implementations for the Machine IR helpers
//          used by the x86-64 translator.
// Key invariants: Helpers never fabricate invalid register classes.
// Ownership/Lifetime: All Machine IR nodes own their operands by value.
// Links: src/codegen/x86_64/MachineIR.hpp
//
//===----------------------------------------------------------------------===//

#include "MachineIR.hpp"

#include <limits>
#include <utility>

namespace kestrel::codegen::x64
{

CondCode invertCond(CondCode cc) noexcept
{
    switch (cc)
    {
        case CondCode::E:
            return CondCode::NE;
        case CondCode::NE:
            return CondCode::E;
        case CondCode::L:
            return CondCode::GE;
        case CondCode::LE:
            return CondCode::G;
        case CondCode::G:
            return CondCode::LE;
        case CondCode::GE:
            return CondCode::L;
        case CondCode::B:
            return CondCode::AE;
        case CondCode::BE:
            return CondCode::A;
        case CondCode::A:
            return CondCode::BE;
        case CondCode::AE:
            return CondCode::B;
        case CondCode::P:
            return CondCode::NP;
        case CondCode::NP:
            return CondCode::P;
    }
    return CondCode::E;
}

std::string_view condSuffix(CondCode cc) noexcept
{
    switch (cc)
    {
        case CondCode::E:
            return "e";
        case CondCode::NE:
            return "ne";
        case CondCode::L:
            return "l";
        case CondCode::LE:
            return "le";
        case CondCode::G:
            return "g";
        case CondCode::GE:
            return "ge";
        case CondCode::B:
            return "b";
        case CondCode::BE:
            return "be";
        case CondCode::A:
            return "a";
        case CondCode::AE:
            return "ae";
        case CondCode::P:
            return "p";
        case CondCode::NP:
            return "np";
    }
    return "";
}

/// @brief Construct an instruction by pairing an opcode with operands.
MInstr MInstr::make(MOpcode opc, std::vector<Operand> ops)
{
    MInstr instr{};
    instr.opcode = opc;
    instr.operands = std::move(ops);
    return instr;
}

MInstr MInstr::make(MOpcode opc, std::initializer_list<Operand> ops)
{
    return make(opc, std::vector<Operand>(ops));
}

MInstr MInstr::makeCond(MOpcode opc, CondCode cc, Operand op)
{
    MInstr instr = make(opc, {std::move(op)});
    instr.cond = cc;
    return instr;
}

MInstr &MInstr::withComment(std::string text)
{
    comment = std::move(text);
    return *this;
}

MInstr &MBasicBlock::append(MInstr instr)
{
    instructions.push_back(std::move(instr));
    return instructions.back();
}

OpReg makePhysReg(PhysReg reg, uint8_t width) noexcept
{
    OpReg op{};
    op.isPhys = true;
    op.cls = isXMM(reg) ? RegClass::XMM : RegClass::GPR;
    op.idOrPhys = static_cast<uint16_t>(reg);
    op.width = width;
    return op;
}

OpReg makeTempReg(RegClass cls, uint16_t id, uint8_t width) noexcept
{
    OpReg op{};
    op.isPhys = false;
    op.cls = cls;
    op.idOrPhys = id;
    op.width = width;
    return op;
}

OpReg withWidth(OpReg reg, uint8_t width) noexcept
{
    reg.width = width;
    return reg;
}

Operand makeImmOperand(int64_t value)
{
    return OpImm{value};
}

Operand makeMemOperand(OpReg base, int32_t disp)
{
    OpMem mem{};
    mem.base = base;
    mem.disp = disp;
    return mem;
}

Operand makeLabelOperand(std::string name)
{
    return OpLabel{std::move(name)};
}

Operand makeSymbolOperand(std::string name)
{
    return OpSymbol{std::move(name)};
}

Operand makeRipLabelOperand(std::string name)
{
    return OpRipLabel{std::move(name)};
}

bool fitsImm32(int64_t imm) noexcept
{
    return imm >= std::numeric_limits<int32_t>::min() && imm <= std::numeric_limits<int32_t>::max();
}

} // namespace kestrel::codegen::x64
