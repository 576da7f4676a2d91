//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/Lowering.Mem.cpp
// Purpose: Emitters for Load, Store, Allocate and Constant.
// Key invariants: Loads extend narrow integers according to signedness so the
//                 home holds a normalised 64-bit value; stores write exactly
//                 the type's width. Allocate and Constant emit no code.
// Ownership/Lifetime: Stateless emitters operating through EmitCommon.
// Links: src/codegen/x86_64/LoweringRuleTable.hpp
//
//===----------------------------------------------------------------------===//

#include "Lowering.EmitCommon.hpp"
#include "LoweringRuleTable.hpp"
#include "TranslationError.hpp"

namespace kestrel::codegen::x64::lowering
{

namespace
{

void requireOperands(const ir::Instruction &instr, EmitCommon &emit, std::size_t count)
{
    if (instr.operands.size() != count)
    {
        emit.invalid(instr,
                     "expected " + std::to_string(count) + " operand(s), got " +
                         std::to_string(instr.operands.size()));
    }
}

/// @brief Loads and stores move scalars only.
void requireScalar(const ir::Instruction &instr)
{
    if (instr.type.isAggregate() || instr.type.isVoid())
    {
        raiseError(ErrorKind::UnsupportedType,
                   "cannot move a value of type " + instr.type.toString() + " through a register",
                   ir::describe(instr),
                   instr.loc);
    }
}

[[nodiscard]] MOpcode storeOpcode(uint32_t width) noexcept
{
    switch (width)
    {
        case 1:
            return MOpcode::MOVB;
        case 2:
            return MOpcode::MOVW;
        case 4:
            return MOpcode::MOVL;
        default:
            return MOpcode::MOVQ;
    }
}

/// @brief Truncate @p value to @p width bytes and sign-extend it back.
[[nodiscard]] int64_t truncateImm(int64_t value, uint32_t width) noexcept
{
    switch (width)
    {
        case 1:
            return static_cast<int8_t>(value);
        case 2:
            return static_cast<int16_t>(value);
        case 4:
            return static_cast<int32_t>(value);
        default:
            return value;
    }
}

} // namespace

void emitLoad(const ir::Instruction &instr, EmitCommon &emit)
{
    requireOperands(instr, emit, 1);
    requireScalar(instr);
    const Operand addr = emit.addressOf(instr.operands[0]);

    if (instr.type.isFloat())
    {
        const OpReg value = emit.newTemp(RegClass::XMM);
        emit.emit(MInstr::make(EmitCommon::floatMove(instr.type), {addr, value}));
        emit.storeXmmResult(instr, value, instr.type);
        return;
    }

    const OpReg value = emit.newTemp(RegClass::GPR);
    emit.emit(extendingLoad(addr, value, instr.type));
    const Operand home = emit.defineHome(instr, instr.type);
    emit.emit(MInstr::make(MOpcode::MOVQ, {value, home}));
}

void emitStore(const ir::Instruction &instr, EmitCommon &emit)
{
    requireOperands(instr, emit, 2);
    requireScalar(instr);
    const ir::IrOperand &value = instr.operands[0];
    if (EmitCommon::classOf(emit.typeOf(value)) != EmitCommon::classOf(instr.type))
    {
        emit.invalid(instr,
                     "stored value " + value.toString() + " does not match " +
                         instr.type.toString());
    }

    if (instr.type.isFloat())
    {
        const OpReg src = emit.loadXmm(value);
        const Operand addr = emit.addressOf(instr.operands[1]);
        emit.emit(MInstr::make(EmitCommon::floatMove(instr.type), {src, addr}));
        return;
    }

    const uint32_t width = instr.type.sizeInBytes();
    Operand src;
    const auto literal = emit.constantValue(value);
    if (literal && fitsImm32(truncateImm(*literal, width)))
    {
        src = makeImmOperand(truncateImm(*literal, width));
    }
    else
    {
        src = withWidth(emit.loadGpr(value), static_cast<uint8_t>(width));
    }
    const Operand addr = emit.addressOf(instr.operands[1]);
    emit.emit(MInstr::make(storeOpcode(width), {src, addr}));
}

void emitAllocate(const ir::Instruction &instr, EmitCommon &emit)
{
    if (instr.type.isVoid())
    {
        raiseError(ErrorKind::UnsupportedType,
                   "cannot allocate storage for void",
                   ir::describe(instr),
                   instr.loc);
    }
    if (!instr.result)
    {
        emit.invalid(instr, "alloca names no result");
    }
    ValueInfo info{};
    info.kind = ValueInfo::Kind::Address;
    info.type = ir::IrType::scalar(ir::TypeKind::Ptr);
    info.disp = emit.context().frame().allocateSlot(instr.type.sizeInBytes());
    emit.context().setValue(*instr.result, info);
}

void emitConstant(const ir::Instruction &instr, EmitCommon &emit)
{
    requireOperands(instr, emit, 1);
    requireScalar(instr);
    if (!instr.result)
    {
        emit.invalid(instr, "const names no result");
    }
    const auto literal = emit.constantValue(instr.operands[0]);
    if (!literal)
    {
        emit.invalid(instr, "const operand " + instr.operands[0].toString() + " is not a literal");
    }
    ValueInfo info{};
    info.kind = ValueInfo::Kind::Constant;
    info.type = instr.type;
    info.bits = *literal;
    emit.context().setValue(*instr.result, info);
}

} // namespace kestrel::codegen::x64::lowering
