//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/Lowering.EmitCommon.cpp
// Purpose: Implement operand access and result storage shared by the
//          lowering rules.
// Key invariants: Two memory operands never meet in one instruction: values
//                 read from homes are either used directly as the single
//                 memory source or copied into a temporary first.
// Ownership/Lifetime: See Lowering.EmitCommon.hpp.
// Links: src/codegen/x86_64/Lowering.EmitCommon.hpp
//
//===----------------------------------------------------------------------===//

#include "Lowering.EmitCommon.hpp"

#include "TranslationError.hpp"

#include <utility>

namespace kestrel::codegen::x64
{

namespace
{

[[nodiscard]] OpReg rbp()
{
    return makePhysReg(PhysReg::RBP);
}

} // namespace

EmitCommon::EmitCommon(TranslationContext &ctx,
                       MBasicBlock &out,
                       support::SourceLoc origin) noexcept
    : ctx_(&ctx), out_(&out), origin_(origin)
{
}

TranslationContext &EmitCommon::context() const noexcept
{
    return *ctx_;
}

MBasicBlock &EmitCommon::block() const noexcept
{
    return *out_;
}

void EmitCommon::setFlagsOnly(bool value) noexcept
{
    flagsOnly_ = value;
}

bool EmitCommon::flagsOnly() const noexcept
{
    return flagsOnly_;
}

MInstr &EmitCommon::emit(MInstr instr)
{
    instr.origin = origin_;
    return out_->append(std::move(instr));
}

OpReg EmitCommon::newTemp(RegClass cls, uint8_t width)
{
    const TempReg temp = ctx_->temps().issue(cls);
    return makeTempReg(cls, temp.id, width);
}

ValueInfo EmitCommon::lookup(const ir::IrOperand &operand) const
{
    switch (operand.kind)
    {
        case ir::IrOperand::Kind::Value:
            return ctx_->value(operand.id);
        case ir::IrOperand::Kind::Param:
            return ctx_->param(operand.id);
        case ir::IrOperand::Kind::Constant:
        {
            ValueInfo info{};
            info.kind = ValueInfo::Kind::Constant;
            info.type = operand.type;
            info.bits = operand.bits;
            return info;
        }
        case ir::IrOperand::Kind::Global:
            break;
    }
    raiseError(ErrorKind::InvalidOperand,
               "global '@" + operand.name + "' has no value slot",
               operand.toString());
}

ir::IrType EmitCommon::typeOf(const ir::IrOperand &operand) const
{
    if (operand.kind == ir::IrOperand::Kind::Global)
    {
        return ir::IrType::scalar(ir::TypeKind::Ptr);
    }
    return lookup(operand).type;
}

std::optional<int64_t> EmitCommon::constantValue(const ir::IrOperand &operand) const
{
    if (operand.kind == ir::IrOperand::Kind::Global)
    {
        return std::nullopt;
    }
    const ValueInfo info = lookup(operand);
    if (info.kind != ValueInfo::Kind::Constant)
    {
        return std::nullopt;
    }
    return info.bits;
}

RegClass EmitCommon::classOf(const ir::IrType &type) noexcept
{
    return type.isFloat() ? RegClass::XMM : RegClass::GPR;
}

Operand EmitCommon::gprSource(const ir::IrOperand &operand)
{
    if (operand.kind != ir::IrOperand::Kind::Global)
    {
        const ValueInfo info = lookup(operand);
        if (info.kind == ValueInfo::Kind::Home)
        {
            return makeMemOperand(rbp(), info.disp);
        }
        if (info.kind == ValueInfo::Kind::Constant && fitsImm32(info.bits))
        {
            return makeImmOperand(info.bits);
        }
    }
    return loadGpr(operand);
}

Operand EmitCommon::xmmSource(const ir::IrOperand &operand)
{
    if (operand.kind != ir::IrOperand::Kind::Global)
    {
        const ValueInfo info = lookup(operand);
        if (info.kind == ValueInfo::Kind::Home)
        {
            return makeMemOperand(rbp(), info.disp);
        }
    }
    return loadXmm(operand);
}

void EmitCommon::loadGprInto(const ir::IrOperand &operand, OpReg dst)
{
    if (operand.kind == ir::IrOperand::Kind::Global)
    {
        const SymbolInfo &sym = ctx_->symbols().resolveData(operand.name);
        emit(MInstr::make(MOpcode::LEAQ, {makeRipLabelOperand(sym.asmName), dst}));
        return;
    }
    const ValueInfo info = lookup(operand);
    switch (info.kind)
    {
        case ValueInfo::Kind::Home:
            emit(MInstr::make(MOpcode::MOVQ, {makeMemOperand(rbp(), info.disp), dst}));
            return;
        case ValueInfo::Kind::Address:
            emit(MInstr::make(MOpcode::LEAQ, {makeMemOperand(rbp(), info.disp), dst}));
            return;
        case ValueInfo::Kind::Constant:
            if (fitsImm32(info.bits))
            {
                emit(MInstr::make(MOpcode::MOVQ, {makeImmOperand(info.bits), dst}));
            }
            else
            {
                emit(MInstr::make(MOpcode::MOVABSQ, {makeImmOperand(info.bits), dst}));
            }
            return;
    }
}

void EmitCommon::loadXmmInto(const ir::IrOperand &operand, OpReg dst)
{
    const ir::IrType type = typeOf(operand);
    if (!type.isFloat())
    {
        raiseError(ErrorKind::InvalidOperand,
                   "operand " + operand.toString() + " of type " + type.toString() +
                       " cannot be placed in an XMM register",
                   operand.toString(),
                   origin_);
    }
    const ValueInfo info = lookup(operand);
    if (info.kind == ValueInfo::Kind::Home)
    {
        emit(MInstr::make(floatMove(type), {makeMemOperand(rbp(), info.disp), dst}));
        return;
    }
    // Float literals travel through a GPR as their bit pattern.
    const OpReg bits = newTemp(RegClass::GPR);
    loadGprInto(operand, bits);
    emit(MInstr::make(MOpcode::MOVQ, {bits, dst}));
}

OpReg EmitCommon::loadGpr(const ir::IrOperand &operand)
{
    const OpReg temp = newTemp(RegClass::GPR);
    loadGprInto(operand, temp);
    return temp;
}

OpReg EmitCommon::loadXmm(const ir::IrOperand &operand)
{
    const OpReg temp = newTemp(RegClass::XMM);
    loadXmmInto(operand, temp);
    return temp;
}

Operand EmitCommon::addressOf(const ir::IrOperand &operand)
{
    const ir::IrType type = typeOf(operand);
    if (type.kind != ir::TypeKind::Ptr)
    {
        raiseError(ErrorKind::InvalidOperand,
                   "operand " + operand.toString() + " of type " + type.toString() +
                       " is not an address",
                   operand.toString(),
                   origin_);
    }
    if (operand.kind == ir::IrOperand::Kind::Global)
    {
        return makeRipLabelOperand(ctx_->symbols().resolveData(operand.name).asmName);
    }
    const ValueInfo info = lookup(operand);
    if (info.kind == ValueInfo::Kind::Address)
    {
        return makeMemOperand(rbp(), info.disp);
    }
    return makeMemOperand(loadGpr(operand), 0);
}

Operand EmitCommon::defineHome(const ir::Instruction &instr, const ir::IrType &type)
{
    if (!instr.result)
    {
        invalid(instr, "instruction produces a value but names no result");
    }
    ValueInfo info{};
    info.kind = ValueInfo::Kind::Home;
    info.type = type;
    info.disp = ctx_->frame().allocateSlot(kSlotSizeBytes);
    ctx_->setValue(*instr.result, info);
    return makeMemOperand(rbp(), info.disp);
}

void EmitCommon::normalize(OpReg reg, const ir::IrType &type)
{
    if (auto ext = extendInPlace(reg, type))
    {
        emit(std::move(*ext));
    }
}

void EmitCommon::storeGprResult(const ir::Instruction &instr,
                                OpReg src,
                                const ir::IrType &type)
{
    normalize(src, type);
    const Operand home = defineHome(instr, type);
    emit(MInstr::make(MOpcode::MOVQ, {src, home}));
}

void EmitCommon::storeXmmResult(const ir::Instruction &instr,
                                OpReg src,
                                const ir::IrType &type)
{
    const Operand home = defineHome(instr, type);
    emit(MInstr::make(floatMove(type), {src, home}));
}

MOpcode EmitCommon::floatMove(const ir::IrType &type) noexcept
{
    return type.kind == ir::TypeKind::F32 ? MOpcode::MOVSS : MOpcode::MOVSD;
}

void EmitCommon::unsupported(const ir::Instruction &instr, const std::string &why) const
{
    raiseError(ErrorKind::UnsupportedInstruction, why, ir::describe(instr), instr.loc);
}

void EmitCommon::invalid(const ir::Instruction &instr, const std::string &why) const
{
    raiseError(ErrorKind::InvalidOperand, why, ir::describe(instr), instr.loc);
}

std::optional<MInstr> extendInPlace(OpReg reg, const ir::IrType &type)
{
    switch (type.kind)
    {
        case ir::TypeKind::I8:
            return MInstr::make(MOpcode::MOVSBQ, {withWidth(reg, 1), reg});
        case ir::TypeKind::I16:
            return MInstr::make(MOpcode::MOVSWQ, {withWidth(reg, 2), reg});
        case ir::TypeKind::I32:
            return MInstr::make(MOpcode::MOVSLQ, {withWidth(reg, 4), reg});
        case ir::TypeKind::U8:
        case ir::TypeKind::Bool:
            return MInstr::make(MOpcode::MOVZBQ, {withWidth(reg, 1), reg});
        case ir::TypeKind::U16:
            return MInstr::make(MOpcode::MOVZWQ, {withWidth(reg, 2), reg});
        case ir::TypeKind::U32:
            // Writing a 32-bit register clears the upper half.
            return MInstr::make(MOpcode::MOVL, {withWidth(reg, 4), withWidth(reg, 4)});
        default:
            return std::nullopt;
    }
}

MInstr extendingLoad(const Operand &src, OpReg dst, const ir::IrType &type)
{
    switch (type.kind)
    {
        case ir::TypeKind::I8:
            return MInstr::make(MOpcode::MOVSBQ, {src, dst});
        case ir::TypeKind::U8:
        case ir::TypeKind::Bool:
            return MInstr::make(MOpcode::MOVZBQ, {src, dst});
        case ir::TypeKind::I16:
            return MInstr::make(MOpcode::MOVSWQ, {src, dst});
        case ir::TypeKind::U16:
            return MInstr::make(MOpcode::MOVZWQ, {src, dst});
        case ir::TypeKind::I32:
            return MInstr::make(MOpcode::MOVSLQ, {src, dst});
        case ir::TypeKind::U32:
            return MInstr::make(MOpcode::MOVL, {src, withWidth(dst, 4)});
        default:
            return MInstr::make(MOpcode::MOVQ, {src, dst});
    }
}

} // namespace kestrel::codegen::x64
