//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/BlockTranslator.hpp
// Purpose: Declare block ordering and per-block dispatch for one function.
// Key invariants: Every block reachable from the entry is emitted exactly
//                 once, in reverse post-order; unreachable blocks are not
//                 emitted. Temporaries are released after each IR instruction
//                 and after each terminator.
// Ownership/Lifetime: Borrows the TranslationContext.
// Links: src/codegen/x86_64/FunctionTranslator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "TranslationContext.hpp"
#include "ir/Module.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Size of one translated block, reported by --trace.
struct BlockStats
{
    uint32_t id{0};
    std::size_t irInstructions{0};
    std::size_t machineInstructions{0};
};

/// \brief Orders and translates the blocks of one function.
class BlockTranslator
{
  public:
    explicit BlockTranslator(TranslationContext &ctx) noexcept;

    /// \brief Reachable blocks of @p fn in reverse post-order from blocks[0].
    /// \details The then-successor of a conditional jump is placed before the
    ///          else-successor when neither dominates the other.
    /// \throws TranslationException (UnsupportedConstruct) when the function
    ///         has no entry block or a reachable target is missing.
    [[nodiscard]] static std::vector<const ir::BasicBlock *> reversePostOrder(
        const ir::IrFunction &fn);

    /// \brief Translate every reachable block of @p fn.
    [[nodiscard]] std::vector<MBasicBlock> translate(const ir::IrFunction &fn);

    /// \brief Per-block sizes from the last translate(), in emission order.
    [[nodiscard]] const std::vector<BlockStats> &stats() const noexcept;

  private:
    [[nodiscard]] bool fusesIntoBranch(const ir::BasicBlock &block, std::size_t index) const;

    TranslationContext *ctx_;
    std::vector<BlockStats> stats_{};
};

} // namespace kestrel::codegen::x64
