//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Module.cpp
// Purpose: Implements the IR value helpers: type predicates, operand factories
//          and the textual renderings used in diagnostics.
// Key invariants: Renderings follow the syntax accepted by ir/Parser.
// Ownership/Lifetime: All helpers return new values.
// Links: src/ir/Module.hpp
//
//===----------------------------------------------------------------------===//

#include "ir/Module.hpp"

#include <bit>
#include <sstream>
#include <utility>

namespace kestrel::ir
{

IrType IrType::scalar(TypeKind kind)
{
    return IrType{kind, 0};
}

IrType IrType::aggregate(TypeKind kind, uint32_t bytes)
{
    return IrType{kind, bytes};
}

bool IrType::isIntegerClass() const
{
    switch (kind)
    {
        case TypeKind::I8:
        case TypeKind::I16:
        case TypeKind::I32:
        case TypeKind::I64:
        case TypeKind::U8:
        case TypeKind::U16:
        case TypeKind::U32:
        case TypeKind::U64:
        case TypeKind::Bool:
        case TypeKind::Ptr:
            return true;
        default:
            return false;
    }
}

bool IrType::isFloat() const
{
    return kind == TypeKind::F32 || kind == TypeKind::F64;
}

bool IrType::isSigned() const
{
    return kind == TypeKind::I8 || kind == TypeKind::I16 || kind == TypeKind::I32 ||
           kind == TypeKind::I64;
}

bool IrType::isAggregate() const
{
    return kind == TypeKind::Array || kind == TypeKind::Struct;
}

bool IrType::isVoid() const
{
    return kind == TypeKind::Void;
}

uint32_t IrType::sizeInBytes() const
{
    switch (kind)
    {
        case TypeKind::I8:
        case TypeKind::U8:
        case TypeKind::Bool:
            return 1;
        case TypeKind::I16:
        case TypeKind::U16:
            return 2;
        case TypeKind::I32:
        case TypeKind::U32:
        case TypeKind::F32:
            return 4;
        case TypeKind::I64:
        case TypeKind::U64:
        case TypeKind::F64:
        case TypeKind::Ptr:
            return 8;
        case TypeKind::Void:
            return 0;
        case TypeKind::Array:
        case TypeKind::Struct:
            return aggregateSize;
    }
    return 0;
}

std::string IrType::toString() const
{
    switch (kind)
    {
        case TypeKind::I8:
            return "i8";
        case TypeKind::I16:
            return "i16";
        case TypeKind::I32:
            return "i32";
        case TypeKind::I64:
            return "i64";
        case TypeKind::U8:
            return "u8";
        case TypeKind::U16:
            return "u16";
        case TypeKind::U32:
            return "u32";
        case TypeKind::U64:
            return "u64";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::F32:
            return "f32";
        case TypeKind::F64:
            return "f64";
        case TypeKind::Ptr:
            return "ptr";
        case TypeKind::Void:
            return "void";
        case TypeKind::Array:
            return "array<" + std::to_string(aggregateSize) + ">";
        case TypeKind::Struct:
            return "struct<" + std::to_string(aggregateSize) + ">";
    }
    return "?";
}

IrOperand IrOperand::value(uint32_t id)
{
    IrOperand op{};
    op.kind = Kind::Value;
    op.id = id;
    return op;
}

IrOperand IrOperand::param(uint32_t index)
{
    IrOperand op{};
    op.kind = Kind::Param;
    op.id = index;
    return op;
}

IrOperand IrOperand::constant(IrType type, int64_t value)
{
    IrOperand op{};
    op.kind = Kind::Constant;
    op.type = type;
    op.bits = value;
    return op;
}

IrOperand IrOperand::constantF64(double value)
{
    return constant(IrType::scalar(TypeKind::F64), std::bit_cast<int64_t>(value));
}

IrOperand IrOperand::constantF32(float value)
{
    return constant(IrType::scalar(TypeKind::F32),
                    static_cast<int64_t>(std::bit_cast<uint32_t>(value)));
}

IrOperand IrOperand::global(std::string name)
{
    IrOperand op{};
    op.kind = Kind::Global;
    op.name = std::move(name);
    op.type = IrType::scalar(TypeKind::Ptr);
    return op;
}

std::string IrOperand::toString() const
{
    switch (kind)
    {
        case Kind::Value:
            return "%" + std::to_string(id);
        case Kind::Param:
            return "%arg" + std::to_string(id);
        case Kind::Global:
            return "@" + name;
        case Kind::Constant:
            break;
    }
    std::ostringstream os;
    if (type.kind == TypeKind::F64)
    {
        os << std::bit_cast<double>(bits);
    }
    else if (type.kind == TypeKind::F32)
    {
        os << std::bit_cast<float>(static_cast<uint32_t>(bits));
    }
    else
    {
        os << bits;
    }
    return os.str();
}

Terminator Terminator::ret(std::optional<IrOperand> value)
{
    Terminator t{};
    t.kind = TerminatorKind::Return;
    t.value = std::move(value);
    return t;
}

Terminator Terminator::jump(uint32_t target)
{
    Terminator t{};
    t.kind = TerminatorKind::Jump;
    t.target = target;
    return t;
}

Terminator Terminator::condJump(IrOperand cond, uint32_t thenId, uint32_t elseId)
{
    Terminator t{};
    t.kind = TerminatorKind::ConditionalJump;
    t.value = std::move(cond);
    t.target = thenId;
    t.elseTarget = elseId;
    return t;
}

Terminator Terminator::unreachable()
{
    return Terminator{};
}

std::vector<uint32_t> Terminator::successors() const
{
    switch (kind)
    {
        case TerminatorKind::Jump:
            return {target};
        case TerminatorKind::ConditionalJump:
            return {target, elseTarget};
        case TerminatorKind::Return:
        case TerminatorKind::Unreachable:
            break;
    }
    return {};
}

const BasicBlock *IrFunction::findBlock(uint32_t id) const
{
    for (const auto &block : blocks)
    {
        if (block.id == id)
        {
            return &block;
        }
    }
    return nullptr;
}

const char *binaryOpName(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "add";
        case BinaryOp::Sub:
            return "sub";
        case BinaryOp::Mul:
            return "mul";
        case BinaryOp::Div:
            return "div";
        case BinaryOp::And:
            return "and";
        case BinaryOp::Or:
            return "or";
        case BinaryOp::Xor:
            return "xor";
        case BinaryOp::Shl:
            return "shl";
        case BinaryOp::Shr:
            return "shr";
        case BinaryOp::Eq:
            return "eq";
        case BinaryOp::Ne:
            return "ne";
        case BinaryOp::Lt:
            return "lt";
        case BinaryOp::Le:
            return "le";
        case BinaryOp::Gt:
            return "gt";
        case BinaryOp::Ge:
            return "ge";
    }
    return "?";
}

bool isComparison(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

std::string describe(const Instruction &instr)
{
    std::ostringstream os;
    if (instr.result)
    {
        os << '%' << *instr.result << " = ";
    }
    switch (instr.kind)
    {
        case InstructionKind::BinaryOp:
            os << binaryOpName(instr.op);
            break;
        case InstructionKind::Load:
            os << "load";
            break;
        case InstructionKind::Store:
            os << "store";
            break;
        case InstructionKind::Call:
            os << "call";
            break;
        case InstructionKind::Return:
            os << "ret";
            break;
        case InstructionKind::Allocate:
            os << "alloca";
            break;
        case InstructionKind::Constant:
            os << "const";
            break;
    }
    os << ' ' << instr.type.toString();
    if (instr.kind == InstructionKind::Call)
    {
        os << " @" << instr.callee << '(';
    }
    for (std::size_t i = 0; i < instr.operands.size(); ++i)
    {
        os << (i == 0 ? (instr.kind == InstructionKind::Call ? "" : " ") : ", ")
           << instr.operands[i].toString();
    }
    if (instr.kind == InstructionKind::Call)
    {
        os << ')';
    }
    return os.str();
}

std::string describe(const Terminator &term)
{
    switch (term.kind)
    {
        case TerminatorKind::Return:
            return term.value ? "ret " + term.value->toString() : "ret";
        case TerminatorKind::Jump:
            return "jmp bb" + std::to_string(term.target);
        case TerminatorKind::ConditionalJump:
            return "br " + (term.value ? term.value->toString() : std::string("?")) + ", bb" +
                   std::to_string(term.target) + ", bb" + std::to_string(term.elseTarget);
        case TerminatorKind::Unreachable:
            return "unreachable";
    }
    return "?";
}

} // namespace kestrel::ir
