//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/AsmEmitter.hpp
// Purpose: Declare the formatter that turns Machine IR instructions into
//          AT&T-syntax assembly text for GNU as.
// Key invariants: Formatting is a pure function of the instruction; operands
//                 are printed in their stored (AT&T) order.
// Ownership/Lifetime: Stateless; callers own instructions and output buffers.
// Links: src/codegen/x86_64/AssemblyFile.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"

#include <string>

namespace kestrel::codegen::x64
{

/// \brief Formats Machine IR into assembler-ready text lines.
class AsmEmitter
{
  public:
    /// \brief Render one instruction as a tab-indented line without newline.
    /// \param withComment Append the instruction comment, if any, after '#'.
    [[nodiscard]] static std::string formatInstruction(const MInstr &instr, bool withComment);

    /// \brief Render a single operand.
    [[nodiscard]] static std::string formatOperand(const Operand &operand);

    /// \brief Mnemonic for @p instr, including any condition suffix.
    [[nodiscard]] static std::string mnemonic(const MInstr &instr);

  private:
    [[nodiscard]] static std::string formatReg(const OpReg &reg);
    [[nodiscard]] static std::string formatMem(const OpMem &mem);
};

} // namespace kestrel::codegen::x64
