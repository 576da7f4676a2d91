//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/TerminatorTranslator.cpp
// Purpose: Implement block-exit lowering and the Return instruction emitter.
// Key invariants: Every return funnels through the single shared epilogue;
//                 the jump to it is dropped only when the epilogue directly
//                 follows the returning block.
// Ownership/Lifetime: Stateless apart from the borrowed context.
// Links: src/codegen/x86_64/TerminatorTranslator.hpp
//
//===----------------------------------------------------------------------===//

#include "TerminatorTranslator.hpp"

#include "Lowering.EmitCommon.hpp"
#include "LoweringRuleTable.hpp"
#include "TranslationError.hpp"

namespace kestrel::codegen::x64
{

void placeReturnValue(EmitCommon &emit,
                      const std::optional<ir::IrOperand> &value,
                      const std::string &construct)
{
    TranslationContext &ctx = emit.context();
    const ir::IrType &retType = ctx.function().retType;
    ctx.hasReturn = true;

    if (retType.isVoid())
    {
        if (value)
        {
            raiseError(ErrorKind::InvalidOperand,
                       "void function returns a value",
                       construct);
        }
        return;
    }
    if (!value)
    {
        raiseError(ErrorKind::InvalidOperand,
                   "function returning " + retType.toString() + " returns no value",
                   construct);
    }
    if (retType.isAggregate())
    {
        raiseError(ErrorKind::UnsupportedType,
                   "cannot return a value of type " + retType.toString() + " in registers",
                   construct);
    }
    const TargetInfo &target = ctx.abi().target();
    if (retType.isFloat())
    {
        emit.loadXmmInto(*value, makePhysReg(target.floatReturnReg));
    }
    else
    {
        emit.loadGprInto(*value, makePhysReg(target.intReturnReg));
    }
}

namespace lowering
{

/// @brief A Return in the middle of a block: same as the terminator, but the
///        jump to the epilogue is always needed.
void emitReturn(const ir::Instruction &instr, EmitCommon &emit)
{
    if (instr.operands.size() > 1)
    {
        emit.invalid(instr, "ret takes at most one operand");
    }
    std::optional<ir::IrOperand> value;
    if (!instr.operands.empty())
    {
        value = instr.operands.front();
    }
    placeReturnValue(emit, value, ir::describe(instr));
    emit.emit(MInstr::make(MOpcode::JMP, {makeLabelOperand(emit.context().epilogueLabel())}));
}

} // namespace lowering

TerminatorTranslator::TerminatorTranslator(TranslationContext &ctx) noexcept : ctx_(&ctx) {}

void TerminatorTranslator::translate(const ir::Terminator &term,
                                     MBasicBlock &out,
                                     std::optional<uint32_t> nextBlock)
{
    EmitCommon emit(*ctx_, out, term.loc);
    try
    {
        switch (term.kind)
        {
            case ir::TerminatorKind::Return:
                placeReturnValue(emit, term.value, ir::describe(term));
                if (nextBlock)
                {
                    emit.emit(MInstr::make(MOpcode::JMP, {makeLabelOperand(ctx_->epilogueLabel())}));
                }
                break;
            case ir::TerminatorKind::Jump:
                emitJumpTo(emit, term.target, nextBlock);
                break;
            case ir::TerminatorKind::ConditionalJump:
                emitConditional(term, emit, nextBlock);
                break;
            case ir::TerminatorKind::Unreachable:
                if (ctx_->options().unreachable == UnreachablePolicy::Trap)
                {
                    emit.emit(MInstr::make(MOpcode::UD2).withComment("unreachable"));
                }
                break;
        }
    }
    catch (TranslationException &ex)
    {
        TranslationError &err = ex.error();
        if (!err.loc.hasLine())
        {
            err.loc = term.loc;
        }
        if (err.construct.empty())
        {
            err.construct = ir::describe(term);
        }
        throw;
    }
}

void TerminatorTranslator::emitJumpTo(EmitCommon &emit,
                                      uint32_t target,
                                      std::optional<uint32_t> nextBlock)
{
    if (nextBlock && *nextBlock == target)
    {
        return;
    }
    emit.emit(MInstr::make(MOpcode::JMP, {makeLabelOperand(ctx_->blockLabel(target))}));
}

/// @brief Lower br cond, then, else.
/// @details The condition is either left in the flags by a fused comparison,
///          known at translation time (the branch becomes a plain jump), or
///          tested against zero from its home. The branch whose block follows
///          is reached by fall-through.
void TerminatorTranslator::emitConditional(const ir::Terminator &term,
                                           EmitCommon &emit,
                                           std::optional<uint32_t> nextBlock)
{
    if (term.target == term.elseTarget)
    {
        ctx_->pendingBranchCond.reset();
        emitJumpTo(emit, term.target, nextBlock);
        return;
    }
    if (!term.value)
    {
        raiseError(ErrorKind::InvalidOperand, "conditional jump has no condition");
    }

    CondCode cc = CondCode::NE;
    if (ctx_->pendingBranchCond)
    {
        cc = *ctx_->pendingBranchCond;
        ctx_->pendingBranchCond.reset();
    }
    else
    {
        const ir::IrOperand &cond = *term.value;
        const ir::IrType type = emit.typeOf(cond);
        if (!type.isIntegerClass())
        {
            raiseError(ErrorKind::InvalidOperand,
                       "branch condition " + cond.toString() + " has type " + type.toString());
        }
        if (const auto literal = emit.constantValue(cond))
        {
            emitJumpTo(emit, *literal != 0 ? term.target : term.elseTarget, nextBlock);
            return;
        }
        emit.emit(MInstr::make(MOpcode::CMPQ, {makeImmOperand(0), emit.gprSource(cond)}));
    }

    const std::string thenLabel = ctx_->blockLabel(term.target);
    const std::string elseLabel = ctx_->blockLabel(term.elseTarget);
    if (nextBlock && *nextBlock == term.target)
    {
        emit.emit(MInstr::makeCond(MOpcode::JCC, invertCond(cc), makeLabelOperand(elseLabel)));
        return;
    }
    emit.emit(MInstr::makeCond(MOpcode::JCC, cc, makeLabelOperand(thenLabel)));
    if (!nextBlock || *nextBlock != term.elseTarget)
    {
        emit.emit(MInstr::make(MOpcode::JMP, {makeLabelOperand(elseLabel)}));
    }
}

} // namespace kestrel::codegen::x64
