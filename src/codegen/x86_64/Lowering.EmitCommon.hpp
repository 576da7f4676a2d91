//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/Lowering.EmitCommon.hpp
// Purpose: Declare the helper facade shared by every lowering rule: operand
//          access (immediates, homes, addresses), temporary issuance, result
//          storage with width normalisation, and instruction emission into the
//          current machine block.
// Key invariants: Every emitted instruction carries the IR location of the
//                 instruction or terminator being lowered. Integer values held
//                 in homes are always sign- or zero-extended to 64 bits
//                 according to their type.
// Ownership/Lifetime: Borrows the TranslationContext and the output block
//                     for the duration of one instruction or terminator.
// Links: src/codegen/x86_64/LoweringRuleTable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "TranslationContext.hpp"
#include "ir/Module.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kestrel::codegen::x64
{

/// @brief Shared helper facade used by the opcode-specific emitters.
class EmitCommon
{
  public:
    EmitCommon(TranslationContext &ctx, MBasicBlock &out, support::SourceLoc origin) noexcept;

    [[nodiscard]] TranslationContext &context() const noexcept;
    [[nodiscard]] MBasicBlock &block() const noexcept;

    /// @brief Leave a comparison in the flags for the block's branch instead
    ///        of materialising a boolean.
    void setFlagsOnly(bool value) noexcept;
    [[nodiscard]] bool flagsOnly() const noexcept;

    /// @brief Append @p instr to the output block, stamped with the origin.
    MInstr &emit(MInstr instr);

    /// @brief Issue a temporary of class @p cls accessed at @p width bytes.
    [[nodiscard]] OpReg newTemp(RegClass cls, uint8_t width = 8U);

    /// @brief IR type of @p operand (Global operands are pointers).
    [[nodiscard]] ir::IrType typeOf(const ir::IrOperand &operand) const;

    /// @brief Register class that holds values of @p type.
    [[nodiscard]] static RegClass classOf(const ir::IrType &type) noexcept;

    /// @brief Literal payload of @p operand when it is known at translation time.
    [[nodiscard]] std::optional<int64_t> constantValue(const ir::IrOperand &operand) const;

    /// @brief Source operand for a 64-bit GPR instruction: an imm32, a home
    ///        slot, or a temporary holding the value.
    [[nodiscard]] Operand gprSource(const ir::IrOperand &operand);

    /// @brief Source operand for a scalar SSE instruction: a home slot or an
    ///        XMM temporary holding the value.
    [[nodiscard]] Operand xmmSource(const ir::IrOperand &operand);

    /// @brief Copy the 64-bit value of @p operand into register @p dst.
    void loadGprInto(const ir::IrOperand &operand, OpReg dst);

    /// @brief Copy the float value of @p operand into XMM register @p dst.
    void loadXmmInto(const ir::IrOperand &operand, OpReg dst);

    /// @brief Load @p operand into a fresh GPR temporary.
    [[nodiscard]] OpReg loadGpr(const ir::IrOperand &operand);

    /// @brief Load @p operand into a fresh XMM temporary.
    [[nodiscard]] OpReg loadXmm(const ir::IrOperand &operand);

    /// @brief Memory operand addressed by the pointer @p operand.
    /// @throws TranslationException (InvalidOperand) when it is not a pointer.
    [[nodiscard]] Operand addressOf(const ir::IrOperand &operand);

    /// @brief Give result @p instr a home slot typed @p type.
    /// @return The home as a memory operand.
    [[nodiscard]] Operand defineHome(const ir::Instruction &instr, const ir::IrType &type);

    /// @brief Sign- or zero-extend @p reg in place from @p type's width.
    void normalize(OpReg reg, const ir::IrType &type);

    /// @brief Normalise @p src and store it into the home of @p instr.
    void storeGprResult(const ir::Instruction &instr, OpReg src, const ir::IrType &type);

    /// @brief Store XMM @p src into the home of @p instr.
    void storeXmmResult(const ir::Instruction &instr, OpReg src, const ir::IrType &type);

    /// @brief Scalar move opcode for @p type (movsd or movss).
    [[nodiscard]] static MOpcode floatMove(const ir::IrType &type) noexcept;

    /// @brief Raise UnsupportedInstruction naming @p instr.
    [[noreturn]] void unsupported(const ir::Instruction &instr, const std::string &why) const;

    /// @brief Raise InvalidOperand naming @p instr.
    [[noreturn]] void invalid(const ir::Instruction &instr, const std::string &why) const;

  private:
    /// @brief Value, Param and Constant operands; Global operands are handled
    ///        by the callers.
    [[nodiscard]] ValueInfo lookup(const ir::IrOperand &operand) const;

    TranslationContext *ctx_;
    MBasicBlock *out_;
    support::SourceLoc origin_;
    bool flagsOnly_{false};
};

/// @brief Instruction that sign- or zero-extends @p reg in place from the
///        width of @p type, or nothing for 64-bit and float types.
[[nodiscard]] std::optional<MInstr> extendInPlace(OpReg reg, const ir::IrType &type);

/// @brief Width-correct load of an integer of @p type from @p src into @p dst,
///        extended to 64 bits.
[[nodiscard]] MInstr extendingLoad(const Operand &src, OpReg dst, const ir::IrType &type);

} // namespace kestrel::codegen::x64
