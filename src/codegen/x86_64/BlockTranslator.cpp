//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/BlockTranslator.cpp
// Purpose: Compute the reverse post-order of a function's blocks and
//          translate each block's instructions and terminator.
// Key invariants: The traversal is iterative, so deep CFGs cannot exhaust the
//                 native stack. A Return instruction ends its machine block;
//                 any instructions after it go to a fresh continuation label.
// Ownership/Lifetime: Returns machine blocks by value.
// Links: src/codegen/x86_64/BlockTranslator.hpp
//
//===----------------------------------------------------------------------===//

#include "BlockTranslator.hpp"

#include "InstructionTranslator.hpp"
#include "TerminatorTranslator.hpp"
#include "TranslationError.hpp"

#include <algorithm>
#include <unordered_set>

namespace kestrel::codegen::x64
{

namespace
{

struct DfsFrame
{
    const ir::BasicBlock *block{nullptr};
    std::vector<uint32_t> successors{};
    std::size_t next{0};
};

/// @brief Successors in exploration order. The else-target is explored first
///        so that, once the post-order is reversed, the then-target comes
///        first.
[[nodiscard]] std::vector<uint32_t> explorationOrder(const ir::BasicBlock &block)
{
    std::vector<uint32_t> succs = block.terminator.successors();
    std::reverse(succs.begin(), succs.end());
    return succs;
}

} // namespace

BlockTranslator::BlockTranslator(TranslationContext &ctx) noexcept : ctx_(&ctx) {}

std::vector<const ir::BasicBlock *> BlockTranslator::reversePostOrder(const ir::IrFunction &fn)
{
    if (fn.blocks.empty())
    {
        raiseError(ErrorKind::UnsupportedConstruct,
                   "function '" + fn.name + "' has no entry block",
                   fn.name);
    }

    std::vector<const ir::BasicBlock *> postOrder;
    std::unordered_set<uint32_t> visited;
    std::vector<DfsFrame> stack;

    const ir::BasicBlock &entry = fn.blocks.front();
    visited.insert(entry.id);
    stack.push_back(DfsFrame{&entry, explorationOrder(entry), 0});

    while (!stack.empty())
    {
        DfsFrame &top = stack.back();
        if (top.next == top.successors.size())
        {
            postOrder.push_back(top.block);
            stack.pop_back();
            continue;
        }
        const uint32_t id = top.successors[top.next++];
        if (visited.count(id) != 0)
        {
            continue;
        }
        const ir::BasicBlock *succ = fn.findBlock(id);
        if (!succ)
        {
            raiseError(ErrorKind::UnsupportedConstruct,
                       "bb" + std::to_string(top.block->id) + " jumps to missing block bb" +
                           std::to_string(id),
                       ir::describe(top.block->terminator),
                       top.block->terminator.loc);
        }
        visited.insert(id);
        stack.push_back(DfsFrame{succ, explorationOrder(*succ), 0});
    }

    std::reverse(postOrder.begin(), postOrder.end());
    return postOrder;
}

const std::vector<BlockStats> &BlockTranslator::stats() const noexcept
{
    return stats_;
}

bool BlockTranslator::fusesIntoBranch(const ir::BasicBlock &block, std::size_t index) const
{
    if (index + 1 != block.instrs.size())
    {
        return false;
    }
    const ir::Instruction &instr = block.instrs[index];
    if (instr.kind != ir::InstructionKind::BinaryOp || !ir::isComparison(instr.op) ||
        !instr.type.isIntegerClass() || !instr.result)
    {
        return false;
    }
    const ir::Terminator &term = block.terminator;
    if (term.kind != ir::TerminatorKind::ConditionalJump || !term.value ||
        term.value->kind != ir::IrOperand::Kind::Value || term.value->id != *instr.result ||
        term.target == term.elseTarget)
    {
        return false;
    }
    return ctx_->useCount(*instr.result) == 1;
}

std::vector<MBasicBlock> BlockTranslator::translate(const ir::IrFunction &fn)
{
    const std::vector<const ir::BasicBlock *> order = reversePostOrder(fn);
    InstructionTranslator instrs(*ctx_);
    TerminatorTranslator terms(*ctx_);

    std::vector<MBasicBlock> out;
    stats_.clear();
    for (std::size_t i = 0; i < order.size(); ++i)
    {
        const ir::BasicBlock &block = *order[i];
        const std::optional<uint32_t> next =
            i + 1 < order.size() ? std::optional<uint32_t>(order[i + 1]->id) : std::nullopt;

        const std::size_t first = out.size();
        MBasicBlock head{};
        head.label = ctx_->blockLabel(block.id);
        out.push_back(std::move(head));

        for (std::size_t k = 0; k < block.instrs.size(); ++k)
        {
            const ir::Instruction &instr = block.instrs[k];
            instrs.translate(instr, out.back(), fusesIntoBranch(block, k));
            ctx_->temps().releaseAll();
            if (instr.kind == ir::InstructionKind::Return)
            {
                MBasicBlock cont{};
                cont.label = ctx_->freshLabel("cont");
                out.push_back(std::move(cont));
            }
        }
        terms.translate(block.terminator, out.back(), next);
        ctx_->temps().releaseAll();

        BlockStats stats{};
        stats.id = block.id;
        stats.irInstructions = block.instrs.size();
        for (std::size_t b = first; b < out.size(); ++b)
        {
            stats.machineInstructions += out[b].instructions.size();
        }
        stats_.push_back(stats);
    }
    return out;
}

} // namespace kestrel::codegen::x64
