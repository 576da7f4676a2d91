//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/FunctionTranslator.cpp
// Purpose: Drive prologue, blocks and epilogue for one function.
// Key invariants: Register parameters are stored to their homes in the
//                 prologue, never in a block, so a jump back to the entry
//                 block cannot re-read clobbered argument registers. Narrow
//                 integer parameters are extended to 64 bits before homing;
//                 64-bit and float stack parameters are used in place at
//                 16 + offset(%rbp).
// Ownership/Lifetime: Returns the machine function by value.
// Links: src/codegen/x86_64/FunctionTranslator.hpp
//
//===----------------------------------------------------------------------===//

#include "FunctionTranslator.hpp"

#include "BlockTranslator.hpp"
#include "Lowering.EmitCommon.hpp"
#include "TranslationError.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace kestrel::codegen::x64
{

namespace
{

/// Return address plus saved %rbp sit between %rbp and the caller's %rsp.
constexpr int32_t kIncomingArgBase = 16;

void countOperand(const ir::IrOperand &operand, std::unordered_map<uint32_t, uint32_t> &counts)
{
    if (operand.kind == ir::IrOperand::Kind::Value)
    {
        ++counts[operand.id];
    }
}

} // namespace

FunctionTranslator::FunctionTranslator(TranslationContext &ctx) noexcept : ctx_(&ctx) {}

std::unordered_map<uint32_t, uint32_t> FunctionTranslator::countUses(const ir::IrFunction &fn)
{
    std::unordered_map<uint32_t, uint32_t> counts;
    for (const auto &block : fn.blocks)
    {
        for (const auto &instr : block.instrs)
        {
            for (const auto &operand : instr.operands)
            {
                countOperand(operand, counts);
            }
        }
        if (block.terminator.value)
        {
            countOperand(*block.terminator.value, counts);
        }
    }
    return counts;
}

std::vector<MInstr> FunctionTranslator::homeParameters(const ir::IrFunction &fn)
{
    std::vector<ir::IrType> types;
    types.reserve(fn.params.size());
    for (const auto &param : fn.params)
    {
        types.push_back(param.type);
    }
    const std::vector<ParamLocation> locations = ctx_->abi().mapParameters(types);

    const OpReg rbp = makePhysReg(PhysReg::RBP);
    std::vector<MInstr> stores;
    for (std::size_t i = 0; i < locations.size(); ++i)
    {
        const ParamLocation &loc = locations[i];
        const std::string comment = "%" + fn.params[i].name;
        ValueInfo info{};
        info.kind = ValueInfo::Kind::Home;
        info.type = types[i];
        if (loc.kind == ParamLocation::Kind::Stack)
        {
            const int32_t incoming = kIncomingArgBase + loc.stackOffset;
            const bool narrow =
                types[i].sizeInBytes() < static_cast<uint32_t>(kSlotSizeBytes);
            if (loc.cls == RegClass::GPR && narrow)
            {
                // The caller only defines the low bytes of a narrow stack slot.
                const OpReg scratch = makePhysReg(PhysReg::RAX);
                info.disp = ctx_->frame().allocateSlot(kSlotSizeBytes);
                stores.push_back(extendingLoad(makeMemOperand(rbp, incoming), scratch, types[i]));
                stores.push_back(
                    MInstr::make(MOpcode::MOVQ, {scratch, makeMemOperand(rbp, info.disp)})
                        .withComment(comment));
            }
            else
            {
                info.disp = incoming;
            }
        }
        else
        {
            info.disp = ctx_->frame().allocateSlot(kSlotSizeBytes);
            const OpReg reg = makePhysReg(loc.reg);
            MOpcode opc = MOpcode::MOVQ;
            if (loc.cls == RegClass::XMM)
            {
                opc = EmitCommon::floatMove(types[i]);
            }
            else if (auto ext = extendInPlace(reg, types[i]))
            {
                stores.push_back(std::move(*ext));
            }
            stores.push_back(MInstr::make(opc, {reg, makeMemOperand(rbp, info.disp)})
                                 .withComment(comment));
        }
        ctx_->setParam(static_cast<uint32_t>(i), info);
    }
    return stores;
}

MFunction FunctionTranslator::translate(const ir::IrFunction &fn)
{
    const SymbolInfo *sym = ctx_->symbols().lookup(fn.name);
    const std::string asmName = sym ? sym->asmName : ctx_->options().symbolPrefix + fn.name;
    ctx_->beginFunction(fn, asmName);

    try
    {
        if (fn.retType.isAggregate())
        {
            raiseError(ErrorKind::UnsupportedType,
                       "cannot return a value of type " + fn.retType.toString() + " in registers",
                       fn.name);
        }

        MFunction out{};
        out.name = asmName;
        const std::vector<MInstr> homing = homeParameters(fn);
        ctx_->setUseCounts(countUses(fn));

        BlockTranslator blocks(*ctx_);
        out.blocks = blocks.translate(fn);

        const AbiAdapter &abi = ctx_->abi();
        const FrameInfo frame = abi.layoutFrame(
            ctx_->frame(), ctx_->temps().usedCalleeSaved(), ctx_->options().maxFrameSize);
        out.prologue = abi.generatePrologue(frame);
        out.prologue.insert(out.prologue.end(), homing.begin(), homing.end());
        if (ctx_->hasReturn)
        {
            out.epilogueLabel = ctx_->epilogueLabel();
            out.epilogue = abi.generateEpilogue(frame);
        }
        assignTemporaries(out, ctx_->temps());

        if (std::ostream *trace = ctx_->options().trace)
        {
            *trace << "[kestrel] function " << fn.name << ": " << blocks.stats().size()
                   << " block(s), frame " << frame.frameSize << " bytes\n";
            for (const BlockStats &stats : blocks.stats())
            {
                *trace << "[kestrel]   bb" << stats.id << ": " << stats.irInstructions
                       << " instruction(s) -> " << stats.machineInstructions
                       << " machine instruction(s)\n";
            }
        }
        return out;
    }
    catch (TranslationException &ex)
    {
        if (ex.error().function.empty())
        {
            ex.error().function = fn.name;
        }
        throw;
    }
}

} // namespace kestrel::codegen::x64
