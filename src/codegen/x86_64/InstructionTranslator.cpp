//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/InstructionTranslator.cpp
// Purpose: Route IR instructions through the lowering rule tables.
// Key invariants: Errors leaving translate() name the offending instruction
//                 and its IR location.
// Ownership/Lifetime: Stateless apart from the borrowed context.
// Links: src/codegen/x86_64/InstructionTranslator.hpp
//
//===----------------------------------------------------------------------===//

#include "InstructionTranslator.hpp"

#include "Lowering.EmitCommon.hpp"
#include "LoweringRuleTable.hpp"
#include "TranslationError.hpp"

namespace kestrel::codegen::x64
{

namespace
{

[[nodiscard]] lowering::EmitFn selectEmitter(const ir::Instruction &instr, EmitCommon &emit)
{
    const lowering::InstrRule *rule = lowering::lookupInstrRule(instr.kind);
    if (!rule)
    {
        emit.unsupported(instr, "no lowering rule for this instruction kind");
    }
    if (instr.kind != ir::InstructionKind::BinaryOp)
    {
        return rule->emit;
    }

    const lowering::BinaryRule *binary = lowering::lookupBinaryRule(instr.op);
    if (!binary)
    {
        emit.unsupported(instr,
                         std::string("no lowering rule for '") + ir::binaryOpName(instr.op) + "'");
    }
    lowering::EmitFn fn = nullptr;
    if (instr.type.isIntegerClass())
    {
        fn = binary->emitInt;
    }
    else if (instr.type.isFloat())
    {
        fn = binary->emitFloat;
    }
    if (!fn)
    {
        emit.unsupported(instr,
                         std::string("no lowering rule for '") + binary->name + "' on " +
                             instr.type.toString());
    }
    return fn;
}

} // namespace

InstructionTranslator::InstructionTranslator(TranslationContext &ctx) noexcept : ctx_(&ctx) {}

void InstructionTranslator::translate(const ir::Instruction &instr,
                                      MBasicBlock &out,
                                      bool fuseIntoBranch)
{
    EmitCommon emit(*ctx_, out, instr.loc);
    emit.setFlagsOnly(fuseIntoBranch);
    try
    {
        const lowering::EmitFn fn = selectEmitter(instr, emit);
        fn(instr, emit);
    }
    catch (TranslationException &ex)
    {
        TranslationError &err = ex.error();
        if (!err.loc.hasLine())
        {
            err.loc = instr.loc;
        }
        if (err.construct.empty())
        {
            err.construct = ir::describe(instr);
        }
        throw;
    }
}

} // namespace kestrel::codegen::x64
