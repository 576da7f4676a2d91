//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/LoweringRuleTable.hpp
// Purpose: Describe the declarative dispatch from IR instruction kinds and
//          binary sub-operations to their emitters.
// Key invariants: Tables are constexpr, indexed by enumerator value, and
//                 reference stateless emitters. A null emitter marks an
//                 operation/class pair with no rule; dispatching it raises
//                 UnsupportedInstruction instead of synthesising a fallback.
// Ownership/Lifetime: Shared across lowering translation units as inline
//                     constexpr data.
// Links: src/codegen/x86_64/InstructionTranslator.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"

#include <array>
#include <cstddef>

namespace kestrel::codegen::x64
{

class EmitCommon;

namespace lowering
{

using EmitFn = void (*)(const ir::Instruction &, EmitCommon &);

void emitIntArith(const ir::Instruction &instr, EmitCommon &emit);
void emitIntDiv(const ir::Instruction &instr, EmitCommon &emit);
void emitShift(const ir::Instruction &instr, EmitCommon &emit);
void emitIntCompare(const ir::Instruction &instr, EmitCommon &emit);
void emitFloatArith(const ir::Instruction &instr, EmitCommon &emit);
void emitFloatCompare(const ir::Instruction &instr, EmitCommon &emit);
void emitLoad(const ir::Instruction &instr, EmitCommon &emit);
void emitStore(const ir::Instruction &instr, EmitCommon &emit);
void emitAllocate(const ir::Instruction &instr, EmitCommon &emit);
void emitConstant(const ir::Instruction &instr, EmitCommon &emit);
void emitCall(const ir::Instruction &instr, EmitCommon &emit);
void emitReturn(const ir::Instruction &instr, EmitCommon &emit);

/// @brief Emitters for one binary sub-operation, per register class.
struct BinaryRule
{
    ir::BinaryOp op{ir::BinaryOp::Add};
    EmitFn emitInt{nullptr};
    EmitFn emitFloat{nullptr};
    const char *name{nullptr};
};

/// @brief Emitter for one instruction kind. BinaryOp dispatches further
///        through kBinaryRuleTable.
struct InstrRule
{
    ir::InstructionKind kind{ir::InstructionKind::Constant};
    EmitFn emit{nullptr};
    const char *name{nullptr};
};

inline constexpr auto kBinaryRuleTable = std::array<BinaryRule, 15>{
    BinaryRule{ir::BinaryOp::Add, &emitIntArith, &emitFloatArith, "add"},
    BinaryRule{ir::BinaryOp::Sub, &emitIntArith, &emitFloatArith, "sub"},
    BinaryRule{ir::BinaryOp::Mul, &emitIntArith, &emitFloatArith, "mul"},
    BinaryRule{ir::BinaryOp::Div, &emitIntDiv, &emitFloatArith, "div"},
    BinaryRule{ir::BinaryOp::And, &emitIntArith, nullptr, "and"},
    BinaryRule{ir::BinaryOp::Or, &emitIntArith, nullptr, "or"},
    BinaryRule{ir::BinaryOp::Xor, &emitIntArith, nullptr, "xor"},
    BinaryRule{ir::BinaryOp::Shl, &emitShift, nullptr, "shl"},
    BinaryRule{ir::BinaryOp::Shr, &emitShift, nullptr, "shr"},
    BinaryRule{ir::BinaryOp::Eq, &emitIntCompare, &emitFloatCompare, "eq"},
    BinaryRule{ir::BinaryOp::Ne, &emitIntCompare, &emitFloatCompare, "ne"},
    BinaryRule{ir::BinaryOp::Lt, &emitIntCompare, &emitFloatCompare, "lt"},
    BinaryRule{ir::BinaryOp::Le, &emitIntCompare, &emitFloatCompare, "le"},
    BinaryRule{ir::BinaryOp::Gt, &emitIntCompare, &emitFloatCompare, "gt"},
    BinaryRule{ir::BinaryOp::Ge, &emitIntCompare, &emitFloatCompare, "ge"},
};

inline constexpr auto kInstrRuleTable = std::array<InstrRule, 7>{
    InstrRule{ir::InstructionKind::BinaryOp, nullptr, "binary"},
    InstrRule{ir::InstructionKind::Load, &emitLoad, "load"},
    InstrRule{ir::InstructionKind::Store, &emitStore, "store"},
    InstrRule{ir::InstructionKind::Call, &emitCall, "call"},
    InstrRule{ir::InstructionKind::Return, &emitReturn, "ret"},
    InstrRule{ir::InstructionKind::Allocate, &emitAllocate, "alloca"},
    InstrRule{ir::InstructionKind::Constant, &emitConstant, "const"},
};

/// @brief Rule for @p op, or nullptr when the table has no entry.
[[nodiscard]] const BinaryRule *lookupBinaryRule(ir::BinaryOp op) noexcept;

/// @brief Rule for @p kind, or nullptr when the table has no entry.
[[nodiscard]] const InstrRule *lookupInstrRule(ir::InstructionKind kind) noexcept;

} // namespace lowering

} // namespace kestrel::codegen::x64
