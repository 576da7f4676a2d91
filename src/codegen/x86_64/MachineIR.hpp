//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/MachineIR.hpp
// Purpose: Declare the assembly-level representation produced by translation:
//          operands, instructions, labelled blocks and functions.
// Key invariants: Operands are stored in AT&T order (sources first, the
//                 destination last). Temporary registers (isPhys == false) are
//                 function-scoped ids that must be rewritten to physical
//                 registers before a function is appended to an AssemblyFile.
// Ownership/Lifetime: All nodes own their contained data by value.
// Links: src/codegen/x86_64/AsmEmitter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "TargetX64.hpp"
#include "support/source_loc.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Register operand naming either a physical register or a temporary.
struct OpReg
{
    bool isPhys{false};          ///< True when referencing a physical register.
    RegClass cls{RegClass::GPR}; ///< Register class of the operand.
    uint16_t idOrPhys{0U};       ///< Temporary id (if !isPhys) or PhysReg enum value.
    uint8_t width{8U};           ///< Access width in bytes (GPR only).
};

/// \brief Immediate operand for integer values.
struct OpImm
{
    int64_t val{0};
};

/// \brief Memory operand: disp(base, index, scale).
struct OpMem
{
    OpReg base{};         ///< Base register supplying the address.
    OpReg index{};        ///< Optional index register.
    uint8_t scale{1};     ///< Scale for the index (1, 2, 4, 8).
    int32_t disp{0};      ///< Signed displacement in bytes.
    bool hasIndex{false}; ///< True when index participates.
};

/// \brief Function-local label (blocks, epilogue).
struct OpLabel
{
    std::string name{};
};

/// \brief External or module-level symbol used as a call target.
struct OpSymbol
{
    std::string name{};
};

/// \brief RIP-relative reference to a module-level data symbol.
struct OpRipLabel
{
    std::string name{};
};

/// \brief Union over all supported operand kinds.
using Operand = std::variant<OpReg, OpImm, OpMem, OpLabel, OpSymbol, OpRipLabel>;

/// \brief Opcode set emitted by the translator; one entry per AT&T mnemonic.
enum class MOpcode
{
    MOVQ,    ///< 64-bit move; also GPR<->XMM bit transfer.
    MOVL,    ///< 32-bit move (zero-extends into the full register).
    MOVW,    ///< 16-bit move.
    MOVB,    ///< 8-bit move.
    MOVABSQ, ///< Move a full 64-bit immediate into a register.
    MOVZBQ,  ///< Zero-extend byte.
    MOVZWQ,  ///< Zero-extend word.
    MOVSBQ,  ///< Sign-extend byte.
    MOVSWQ,  ///< Sign-extend word.
    MOVSLQ,  ///< Sign-extend doubleword.
    LEAQ,    ///< Load effective address.
    ADDQ,
    SUBQ,
    IMULQ,
    ANDQ,
    ORQ,
    XORQ,
    XORL,    ///< 32-bit XOR, used to zero %edx before unsigned division.
    ANDB,
    ORB,
    SHLQ,
    SHRQ,
    SARQ,
    CQTO,    ///< Sign-extend %rax into %rdx:%rax.
    IDIVQ,
    DIVQ,
    CMPQ,
    SETCC,   ///< set<cc> on a byte register.
    JMP,
    JCC,     ///< j<cc> to a label.
    CALL,
    RET,
    PUSHQ,
    POPQ,
    UD2,     ///< Undefined instruction used as the unreachable trap.
    ADDSD,
    SUBSD,
    MULSD,
    DIVSD,
    ADDSS,
    SUBSS,
    MULSS,
    DIVSS,
    UCOMISD,
    UCOMISS,
    MOVSD,
    MOVSS
};

/// \brief Condition codes carried by SETCC and JCC.
enum class CondCode
{
    E,
    NE,
    L,
    LE,
    G,
    GE,
    B,
    BE,
    A,
    AE,
    P,
    NP
};

/// \brief Condition that holds exactly when @p cc does not.
[[nodiscard]] CondCode invertCond(CondCode cc) noexcept;

/// \brief Mnemonic suffix of @p cc, e.g. "ne".
[[nodiscard]] std::string_view condSuffix(CondCode cc) noexcept;

/// \brief Machine instruction: opcode with ordered operands.
struct MInstr
{
    MOpcode opcode{MOpcode::MOVQ};   ///< Opcode for the instruction.
    CondCode cond{CondCode::E};      ///< Condition for SETCC/JCC.
    std::vector<Operand> operands{}; ///< Operands in AT&T order.
    std::string comment{};           ///< Optional trailing comment.
    support::SourceLoc origin{};     ///< IR location that produced the instruction.

    /// \brief Create an instruction with the given operands.
    [[nodiscard]] static MInstr make(MOpcode opc, std::vector<Operand> ops);

    /// \brief Create an instruction from an initializer list of operands.
    [[nodiscard]] static MInstr make(MOpcode opc, std::initializer_list<Operand> ops = {});

    /// \brief Create a SETCC or JCC instruction.
    [[nodiscard]] static MInstr makeCond(MOpcode opc, CondCode cc, Operand op);

    /// \brief Attach a trailing comment and return the instruction.
    MInstr &withComment(std::string text);
};

/// \brief A sequence of machine instructions labelled for control flow.
struct MBasicBlock
{
    std::string label{};                ///< Symbolic label for the block.
    std::vector<MInstr> instructions{}; ///< Ordered list of instructions.

    /// \brief Append an instruction to the block and return a reference to it.
    MInstr &append(MInstr instr);
};

/// \brief Machine function: prologue, body blocks and optional epilogue.
struct MFunction
{
    std::string name{};                ///< Assembly symbol of the function.
    std::vector<MInstr> prologue{};    ///< Frame setup and parameter homing.
    std::vector<MBasicBlock> blocks{}; ///< Body in emission order.
    std::string epilogueLabel{};       ///< Empty when the function never returns.
    std::vector<MInstr> epilogue{};    ///< Frame teardown ending in ret.
};

// -----------------------------------------------------------------------------
// Operand helpers
// -----------------------------------------------------------------------------

/// \brief Construct an OpReg naming physical register @p reg.
[[nodiscard]] OpReg makePhysReg(PhysReg reg, uint8_t width = 8U) noexcept;

/// \brief Construct an OpReg naming temporary @p id.
[[nodiscard]] OpReg makeTempReg(RegClass cls, uint16_t id, uint8_t width = 8U) noexcept;

/// \brief Copy of @p reg accessed at @p width bytes.
[[nodiscard]] OpReg withWidth(OpReg reg, uint8_t width) noexcept;

/// \brief Construct an immediate operand.
[[nodiscard]] Operand makeImmOperand(int64_t value);

/// \brief Construct a memory operand from base register and displacement.
[[nodiscard]] Operand makeMemOperand(OpReg base, int32_t disp);

/// \brief Construct a label operand with the provided local label name.
[[nodiscard]] Operand makeLabelOperand(std::string name);

/// \brief Construct a symbol operand for a call target.
[[nodiscard]] Operand makeSymbolOperand(std::string name);

/// \brief Construct a RIP-relative operand for a data symbol.
[[nodiscard]] Operand makeRipLabelOperand(std::string name);

/// \brief True when @p imm fits a sign-extended 32-bit immediate field.
[[nodiscard]] bool fitsImm32(int64_t imm) noexcept;

} // namespace kestrel::codegen::x64
