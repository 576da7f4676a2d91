//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/AsmEmitter.cpp
// Purpose: Materialise textual x86-64 assembly from Machine IR instructions.
// Key invariants: The mnemonic table is sorted by opcode so lookups can use
//                 binary search; every MOpcode has exactly one entry.
// Ownership/Lifetime: Stateless helpers returning new strings.
// Links: src/codegen/x86_64/MachineIR.hpp
//
//===----------------------------------------------------------------------===//

#include "AsmEmitter.hpp"

#include <algorithm>
#include <array>
#include <type_traits>

namespace kestrel::codegen::x64
{

namespace
{

/// @brief Provide an overload set capable of visiting std::variant operands.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

struct OpFmt
{
    MOpcode opc;
    const char *mnemonic;
};

constexpr std::array<OpFmt, 47> kOpFmt{{
    {MOpcode::MOVQ, "movq"},
    {MOpcode::MOVL, "movl"},
    {MOpcode::MOVW, "movw"},
    {MOpcode::MOVB, "movb"},
    {MOpcode::MOVABSQ, "movabsq"},
    {MOpcode::MOVZBQ, "movzbq"},
    {MOpcode::MOVZWQ, "movzwq"},
    {MOpcode::MOVSBQ, "movsbq"},
    {MOpcode::MOVSWQ, "movswq"},
    {MOpcode::MOVSLQ, "movslq"},
    {MOpcode::LEAQ, "leaq"},
    {MOpcode::ADDQ, "addq"},
    {MOpcode::SUBQ, "subq"},
    {MOpcode::IMULQ, "imulq"},
    {MOpcode::ANDQ, "andq"},
    {MOpcode::ORQ, "orq"},
    {MOpcode::XORQ, "xorq"},
    {MOpcode::XORL, "xorl"},
    {MOpcode::ANDB, "andb"},
    {MOpcode::ORB, "orb"},
    {MOpcode::SHLQ, "shlq"},
    {MOpcode::SHRQ, "shrq"},
    {MOpcode::SARQ, "sarq"},
    {MOpcode::CQTO, "cqto"},
    {MOpcode::IDIVQ, "idivq"},
    {MOpcode::DIVQ, "divq"},
    {MOpcode::CMPQ, "cmpq"},
    {MOpcode::SETCC, "set"},
    {MOpcode::JMP, "jmp"},
    {MOpcode::JCC, "j"},
    {MOpcode::CALL, "call"},
    {MOpcode::RET, "ret"},
    {MOpcode::PUSHQ, "pushq"},
    {MOpcode::POPQ, "popq"},
    {MOpcode::UD2, "ud2"},
    {MOpcode::ADDSD, "addsd"},
    {MOpcode::SUBSD, "subsd"},
    {MOpcode::MULSD, "mulsd"},
    {MOpcode::DIVSD, "divsd"},
    {MOpcode::ADDSS, "addss"},
    {MOpcode::SUBSS, "subss"},
    {MOpcode::MULSS, "mulss"},
    {MOpcode::DIVSS, "divss"},
    {MOpcode::UCOMISD, "ucomisd"},
    {MOpcode::UCOMISS, "ucomiss"},
    {MOpcode::MOVSD, "movsd"},
    {MOpcode::MOVSS, "movss"},
}};

/// @brief Retrieves the mnemonic entry for @p opc.
const OpFmt *getFmt(MOpcode opc) noexcept
{
    using Raw = std::underlying_type_t<MOpcode>;
    const auto needle = static_cast<Raw>(opc);
    const auto it = std::lower_bound(kOpFmt.begin(),
                                     kOpFmt.end(),
                                     needle,
                                     [](const OpFmt &fmt, Raw value)
                                     { return static_cast<Raw>(fmt.opc) < value; });
    if (it == kOpFmt.end() || static_cast<Raw>(it->opc) != needle)
    {
        return nullptr;
    }
    return &*it;
}

} // namespace

std::string AsmEmitter::mnemonic(const MInstr &instr)
{
    const OpFmt *fmt = getFmt(instr.opcode);
    std::string text = fmt ? fmt->mnemonic : "<unknown>";
    if (instr.opcode == MOpcode::SETCC || instr.opcode == MOpcode::JCC)
    {
        text += condSuffix(instr.cond);
    }
    return text;
}

std::string AsmEmitter::formatReg(const OpReg &reg)
{
    if (!reg.isPhys)
    {
        // Only visible in debug dumps taken before temporaries are assigned.
        return "%t" + std::to_string(reg.idOrPhys);
    }
    return regName(static_cast<PhysReg>(reg.idOrPhys), reg.width);
}

std::string AsmEmitter::formatMem(const OpMem &mem)
{
    std::string text;
    if (mem.disp != 0)
    {
        text += std::to_string(mem.disp);
    }
    text += '(';
    text += formatReg(withWidth(mem.base, 8U));
    if (mem.hasIndex)
    {
        text += ", ";
        text += formatReg(withWidth(mem.index, 8U));
        text += ", ";
        text += std::to_string(static_cast<unsigned>(mem.scale));
    }
    text += ')';
    return text;
}

std::string AsmEmitter::formatOperand(const Operand &operand)
{
    return std::visit(Overload{[](const OpReg &reg) { return formatReg(reg); },
                               [](const OpImm &imm) { return "$" + std::to_string(imm.val); },
                               [](const OpMem &mem) { return formatMem(mem); },
                               [](const OpLabel &label) { return label.name; },
                               [](const OpSymbol &sym) { return sym.name; },
                               [](const OpRipLabel &rip) { return rip.name + "(%rip)"; }},
                      operand);
}

/// @brief Format one instruction line such as "\tmovq %rdi, -8(%rbp)".
std::string AsmEmitter::formatInstruction(const MInstr &instr, bool withComment)
{
    std::string line = "\t" + mnemonic(instr);
    for (std::size_t i = 0; i < instr.operands.size(); ++i)
    {
        line += (i == 0) ? " " : ", ";
        line += formatOperand(instr.operands[i]);
    }
    if (withComment && !instr.comment.empty())
    {
        line += "\t# ";
        line += instr.comment;
    }
    return line;
}

} // namespace kestrel::codegen::x64
