//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/Lowering.Arith.cpp
// Purpose: Emitters for the BinaryOp family: two-operand integer and scalar
//          SSE arithmetic, division through %rdx:%rax, shifts, and the
//          integer and floating-point comparisons.
// Key invariants: Integer arithmetic runs at 64 bits on normalised inputs and
//                 the result is renormalised to its type before it is stored.
//                 Float comparisons treat an unordered result (NaN) as false
//                 for every predicate except ne.
// Ownership/Lifetime: Stateless emitters operating through EmitCommon.
// Links: src/codegen/x86_64/LoweringRuleTable.hpp
//
//===----------------------------------------------------------------------===//

#include "Lowering.EmitCommon.hpp"
#include "LoweringRuleTable.hpp"

namespace kestrel::codegen::x64::lowering
{

namespace
{

/// @brief Require two operands of the instruction's register class.
void checkBinaryOperands(const ir::Instruction &instr, EmitCommon &emit)
{
    if (instr.operands.size() != 2)
    {
        emit.invalid(instr,
                     std::string(ir::binaryOpName(instr.op)) + " expects 2 operands, got " +
                         std::to_string(instr.operands.size()));
    }
    const RegClass expected = EmitCommon::classOf(instr.type);
    for (const auto &operand : instr.operands)
    {
        const ir::IrType type = emit.typeOf(operand);
        if (EmitCommon::classOf(type) != expected)
        {
            emit.invalid(instr,
                         "operand " + operand.toString() + " of type " + type.toString() +
                             " does not match " + instr.type.toString());
        }
    }
}

[[nodiscard]] MOpcode intArithOpcode(ir::BinaryOp op) noexcept
{
    switch (op)
    {
        case ir::BinaryOp::Sub:
            return MOpcode::SUBQ;
        case ir::BinaryOp::Mul:
            return MOpcode::IMULQ;
        case ir::BinaryOp::And:
            return MOpcode::ANDQ;
        case ir::BinaryOp::Or:
            return MOpcode::ORQ;
        case ir::BinaryOp::Xor:
            return MOpcode::XORQ;
        default:
            return MOpcode::ADDQ;
    }
}

[[nodiscard]] MOpcode floatArithOpcode(ir::BinaryOp op, bool single) noexcept
{
    switch (op)
    {
        case ir::BinaryOp::Sub:
            return single ? MOpcode::SUBSS : MOpcode::SUBSD;
        case ir::BinaryOp::Mul:
            return single ? MOpcode::MULSS : MOpcode::MULSD;
        case ir::BinaryOp::Div:
            return single ? MOpcode::DIVSS : MOpcode::DIVSD;
        default:
            return single ? MOpcode::ADDSS : MOpcode::ADDSD;
    }
}

/// @brief Condition code for an integer comparison; pointers, bools and
///        unsigned integers compare unsigned.
[[nodiscard]] CondCode intCondition(ir::BinaryOp op, bool isSigned) noexcept
{
    switch (op)
    {
        case ir::BinaryOp::Ne:
            return CondCode::NE;
        case ir::BinaryOp::Lt:
            return isSigned ? CondCode::L : CondCode::B;
        case ir::BinaryOp::Le:
            return isSigned ? CondCode::LE : CondCode::BE;
        case ir::BinaryOp::Gt:
            return isSigned ? CondCode::G : CondCode::A;
        case ir::BinaryOp::Ge:
            return isSigned ? CondCode::GE : CondCode::AE;
        default:
            return CondCode::E;
    }
}

const ir::IrType kBool = ir::IrType::scalar(ir::TypeKind::Bool);

} // namespace

void emitIntArith(const ir::Instruction &instr, EmitCommon &emit)
{
    checkBinaryOperands(instr, emit);
    const OpReg acc = emit.loadGpr(instr.operands[0]);
    const Operand rhs = emit.gprSource(instr.operands[1]);
    emit.emit(MInstr::make(intArithOpcode(instr.op), {rhs, acc}));
    emit.storeGprResult(instr, acc, instr.type);
}

/// @brief Lower integer division through the implicit %rdx:%rax pair.
/// @details The dividend is widened into %rdx with cqto (signed) or cleared
///          with xorl %edx, %edx (unsigned) before idivq/divq. The divide
///          instructions take no immediate, so a literal divisor is first
///          moved into a temporary.
void emitIntDiv(const ir::Instruction &instr, EmitCommon &emit)
{
    checkBinaryOperands(instr, emit);
    const OpReg rax = makePhysReg(PhysReg::RAX);
    emit.loadGprInto(instr.operands[0], rax);

    const bool isSigned = instr.type.isSigned();
    if (isSigned)
    {
        emit.emit(MInstr::make(MOpcode::CQTO));
    }
    else
    {
        const OpReg edx = makePhysReg(PhysReg::RDX, 4);
        emit.emit(MInstr::make(MOpcode::XORL, {edx, edx}));
    }

    Operand divisor = emit.gprSource(instr.operands[1]);
    if (std::holds_alternative<OpImm>(divisor))
    {
        const OpReg temp = emit.newTemp(RegClass::GPR);
        emit.emit(MInstr::make(MOpcode::MOVQ, {divisor, temp}));
        divisor = temp;
    }
    emit.emit(MInstr::make(isSigned ? MOpcode::IDIVQ : MOpcode::DIVQ, {divisor}));
    emit.storeGprResult(instr, rax, instr.type);
}

void emitShift(const ir::Instruction &instr, EmitCommon &emit)
{
    checkBinaryOperands(instr, emit);
    MOpcode opc = MOpcode::SHLQ;
    if (instr.op == ir::BinaryOp::Shr)
    {
        opc = instr.type.isSigned() ? MOpcode::SARQ : MOpcode::SHRQ;
    }

    const OpReg value = emit.loadGpr(instr.operands[0]);
    if (const auto count = emit.constantValue(instr.operands[1]))
    {
        emit.emit(MInstr::make(opc, {makeImmOperand(*count & 63), value}));
    }
    else
    {
        emit.loadGprInto(instr.operands[1], makePhysReg(PhysReg::RCX));
        emit.emit(MInstr::make(opc, {makePhysReg(PhysReg::RCX, 1), value}));
    }
    emit.storeGprResult(instr, value, instr.type);
}

void emitIntCompare(const ir::Instruction &instr, EmitCommon &emit)
{
    checkBinaryOperands(instr, emit);
    const CondCode cc = intCondition(instr.op, instr.type.isSigned());
    const OpReg lhs = emit.loadGpr(instr.operands[0]);
    const Operand rhs = emit.gprSource(instr.operands[1]);
    emit.emit(MInstr::make(MOpcode::CMPQ, {rhs, lhs}));
    if (emit.flagsOnly())
    {
        emit.context().pendingBranchCond = cc;
        return;
    }
    emit.emit(MInstr::makeCond(MOpcode::SETCC, cc, withWidth(lhs, 1)));
    emit.storeGprResult(instr, lhs, kBool);
}

void emitFloatArith(const ir::Instruction &instr, EmitCommon &emit)
{
    checkBinaryOperands(instr, emit);
    const bool single = instr.type.kind == ir::TypeKind::F32;
    const OpReg acc = emit.loadXmm(instr.operands[0]);
    const Operand rhs = emit.xmmSource(instr.operands[1]);
    emit.emit(MInstr::make(floatArithOpcode(instr.op, single), {rhs, acc}));
    emit.storeXmmResult(instr, acc, instr.type);
}

/// @brief Lower a floating-point comparison to a 0/1 boolean.
/// @details ucomis sets CF/ZF like an unsigned compare and PF on unordered
///          inputs. lt/le swap their operands so that they can use the
///          above/above-or-equal conditions, which are false on NaN. eq
///          combines sete with setnp; ne combines setne with setp.
void emitFloatCompare(const ir::Instruction &instr, EmitCommon &emit)
{
    checkBinaryOperands(instr, emit);
    const bool single = instr.type.kind == ir::TypeKind::F32;
    const bool swap = instr.op == ir::BinaryOp::Lt || instr.op == ir::BinaryOp::Le;
    const auto &first = instr.operands[swap ? 1 : 0];
    const auto &second = instr.operands[swap ? 0 : 1];

    const OpReg lhs = emit.loadXmm(first);
    const Operand rhs = emit.xmmSource(second);
    emit.emit(MInstr::make(single ? MOpcode::UCOMISS : MOpcode::UCOMISD, {rhs, lhs}));

    const OpReg result = emit.newTemp(RegClass::GPR);
    const OpReg resultByte = withWidth(result, 1);
    switch (instr.op)
    {
        case ir::BinaryOp::Eq:
        case ir::BinaryOp::Ne:
        {
            const bool eq = instr.op == ir::BinaryOp::Eq;
            const OpReg parity = withWidth(emit.newTemp(RegClass::GPR), 1);
            emit.emit(MInstr::makeCond(MOpcode::SETCC, eq ? CondCode::E : CondCode::NE, resultByte));
            emit.emit(MInstr::makeCond(MOpcode::SETCC, eq ? CondCode::NP : CondCode::P, parity));
            emit.emit(MInstr::make(eq ? MOpcode::ANDB : MOpcode::ORB, {parity, resultByte}));
            break;
        }
        case ir::BinaryOp::Lt:
        case ir::BinaryOp::Gt:
            emit.emit(MInstr::makeCond(MOpcode::SETCC, CondCode::A, resultByte));
            break;
        default:
            emit.emit(MInstr::makeCond(MOpcode::SETCC, CondCode::AE, resultByte));
            break;
    }
    emit.storeGprResult(instr, result, kBool);
}

} // namespace kestrel::codegen::x64::lowering
