//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/InstructionTranslator.hpp
// Purpose: Declare the closed dispatch from one IR instruction to zero or more
//          machine instructions.
// Key invariants: Dispatch goes through the rule tables only. An
//                 instruction kind, sub-operation or operand class with no
//                 rule raises UnsupportedInstruction carrying the IR location;
//                 nothing is emitted in its place.
// Ownership/Lifetime: Borrows the TranslationContext.
// Links: src/codegen/x86_64/LoweringRuleTable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "TranslationContext.hpp"
#include "ir/Module.hpp"

namespace kestrel::codegen::x64
{

/// \brief Translates individual IR instructions.
class InstructionTranslator
{
  public:
    explicit InstructionTranslator(TranslationContext &ctx) noexcept;

    /// \brief Append the expansion of @p instr to @p out.
    /// \param fuseIntoBranch For an integer comparison, leave the result in the
    ///        flags for the block's conditional jump instead of storing a
    ///        boolean. Chosen by the caller.
    void translate(const ir::Instruction &instr, MBasicBlock &out, bool fuseIntoBranch = false);

  private:
    TranslationContext *ctx_;
};

} // namespace kestrel::codegen::x64
