//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/CallLowering.cpp
// Purpose: Lower Call instructions: argument placement according to the
//          active AbiAdapter, the call itself, and result capture.
// Key invariants: Stack arguments are written before any register argument
//                 is loaded, so no argument register is live while temporaries
//                 are in use. The frame records the outgoing space every call
//                 needs, including any shadow space.
// Ownership/Lifetime: Stateless emitter operating through EmitCommon.
// Links: src/codegen/x86_64/AbiAdapter.hpp
//
//===----------------------------------------------------------------------===//

#include "Lowering.EmitCommon.hpp"
#include "LoweringRuleTable.hpp"
#include "TranslationError.hpp"

#include <string>
#include <vector>

namespace kestrel::codegen::x64::lowering
{

/// @brief Emit the argument moves, the call and the result store.
/// @details Stack arguments travel through a GPR temporary as raw 8-byte
///          slots at their offset from %rsp; float arguments are copied bit
///          for bit. Register arguments are then loaded straight from their
///          homes into the registers the adapter chose.
void emitCall(const ir::Instruction &instr, EmitCommon &emit)
{
    TranslationContext &ctx = emit.context();
    const std::string callee = ctx.symbols().resolveCallee(instr.callee).asmName;

    std::vector<ir::IrType> types;
    types.reserve(instr.operands.size());
    for (const auto &arg : instr.operands)
    {
        types.push_back(emit.typeOf(arg));
    }
    const std::vector<ParamLocation> locations = ctx.abi().mapParameters(types);

    const OpReg rsp = makePhysReg(PhysReg::RSP);
    for (std::size_t i = 0; i < locations.size(); ++i)
    {
        if (locations[i].kind != ParamLocation::Kind::Stack)
        {
            continue;
        }
        const OpReg slot = emit.loadGpr(instr.operands[i]);
        emit.emit(MInstr::make(MOpcode::MOVQ, {slot, makeMemOperand(rsp, locations[i].stackOffset)}));
    }
    for (std::size_t i = 0; i < locations.size(); ++i)
    {
        const ParamLocation &loc = locations[i];
        if (loc.kind != ParamLocation::Kind::Register)
        {
            continue;
        }
        if (loc.cls == RegClass::XMM)
        {
            emit.loadXmmInto(instr.operands[i], makePhysReg(loc.reg));
        }
        else
        {
            emit.loadGprInto(instr.operands[i], makePhysReg(loc.reg));
        }
    }

    emit.emit(MInstr::make(MOpcode::CALL, {makeSymbolOperand(callee)}));
    ctx.frame().noteCall(ctx.abi().outgoingArgBytes(locations));

    if (!instr.result)
    {
        return;
    }
    if (instr.type.isVoid())
    {
        emit.invalid(instr, "call to '" + instr.callee + "' returns void but names a result");
    }
    if (instr.type.isAggregate())
    {
        raiseError(ErrorKind::UnsupportedType,
                   "cannot return a value of type " + instr.type.toString() + " in registers",
                   ir::describe(instr),
                   instr.loc);
    }
    const TargetInfo &target = ctx.abi().target();
    if (instr.type.isFloat())
    {
        emit.storeXmmResult(instr, makePhysReg(target.floatReturnReg), instr.type);
    }
    else
    {
        emit.storeGprResult(instr, makePhysReg(target.intReturnReg), instr.type);
    }
}

} // namespace kestrel::codegen::x64::lowering
