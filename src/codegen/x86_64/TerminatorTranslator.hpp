//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TerminatorTranslator.hpp
// Purpose: Declare the lowering of block exits: returns, jumps, conditional
//          jumps and unreachable.
// Key invariants: A jump to the block emitted next is omitted. A conditional
//                 jump emits at most one conditional and one unconditional
//                 jump. Unreachable emits a single ud2 or nothing, as the
//                 UnreachablePolicy option says.
// Ownership/Lifetime: Borrows the TranslationContext.
// Links: src/codegen/x86_64/BlockTranslator.hpp
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

class EmitCommon;

/// \brief Translates the terminator of each block.
class TerminatorTranslator
{
  public:
    explicit TerminatorTranslator(TranslationContext &ctx) noexcept;

    /// \brief Append the lowering of @p term to @p out.
    /// \param nextBlock Id of the block emitted right after this one, or
    ///        nullopt when this block is emitted last.
    void translate(const ir::Terminator &term, MBasicBlock &out, std::optional<uint32_t> nextBlock);

  private:
    void emitJumpTo(EmitCommon &emit, uint32_t target, std::optional<uint32_t> nextBlock);
    void emitConditional(const ir::Terminator &term,
                         EmitCommon &emit,
                         std::optional<uint32_t> nextBlock);

    TranslationContext *ctx_;
};

/// \brief Move @p value into the return register of the active ABI.
/// \throws TranslationException (InvalidOperand) when the presence of a value
///         disagrees with the function's return type.
void placeReturnValue(EmitCommon &emit,
                      const std::optional<ir::IrOperand> &value,
                      const std::string &construct);

} // namespace kestrel::codegen::x64
