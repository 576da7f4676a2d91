//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the in-memory IR consumed by the x86-64 translator: types,
// operands, instructions, terminators, blocks, functions, globals and modules.
//
// The IR is produced upstream (either constructed in memory or read by the
// text reader in ir/Parser.hpp) and is treated as immutable by the backend.
// Every instruction that produces a value assigns it to a function-unique
// result id; operands reference earlier results by that id, parameters by
// their index, module globals by name, or carry an inline constant.
//
// Ownership Model:
// - IrModule owns functions and globals by value
// - IrFunction owns its blocks; blocks own instructions and their terminator
// - Operands own their payload (including global names) by value
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_loc.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::ir
{

/// @brief Primitive and aggregate IR type kinds.
enum class TypeKind
{
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    Bool,
    F32,
    F64,
    Ptr,
    Void,
    Array,
    Struct
};

/// @brief Lightweight IR type value.
/// @invariant aggregateSize is only meaningful for Array and Struct kinds.
struct IrType
{
    TypeKind kind{TypeKind::I64}; ///< Discriminator.
    uint32_t aggregateSize{0};    ///< Byte size of an array/struct.

    /// @brief Construct a scalar (or void) type.
    [[nodiscard]] static IrType scalar(TypeKind kind);

    /// @brief Construct an array or struct type occupying @p bytes.
    [[nodiscard]] static IrType aggregate(TypeKind kind, uint32_t bytes);

    /// @brief True for integers, bool and pointers (values living in GPRs).
    [[nodiscard]] bool isIntegerClass() const;

    /// @brief True for f32 and f64.
    [[nodiscard]] bool isFloat() const;

    /// @brief True for the signed integer kinds.
    [[nodiscard]] bool isSigned() const;

    /// @brief True for array and struct kinds.
    [[nodiscard]] bool isAggregate() const;

    /// @brief True for the void kind.
    [[nodiscard]] bool isVoid() const;

    /// @brief Storage size in bytes (0 for void).
    [[nodiscard]] uint32_t sizeInBytes() const;

    /// @brief Lowercase mnemonic, e.g. "i64" or "struct<24>".
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const IrType &, const IrType &) = default;
};

/// @brief Sub-tag of the BinaryOp instruction kind.
enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    And,
    Or,
    Xor,
    Shl,
    Shr,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge
};

/// @brief Closed set of instruction kinds.
enum class InstructionKind
{
    BinaryOp,
    Load,
    Store,
    Call,
    Return,
    Allocate,
    Constant
};

/// @brief Tagged operand referencing a result, a parameter, a global or a literal.
struct IrOperand
{
    /// @brief Enumerates operand forms.
    enum class Kind
    {
        Value,
        Param,
        Constant,
        Global
    };

    Kind kind{Kind::Constant}; ///< Discriminant selecting the active payload.
    uint32_t id{0};            ///< Result id (Value) or parameter index (Param).
    IrType type{};             ///< Type of a Constant operand.
    int64_t bits{0};           ///< Constant payload; floats carry IEEE bit patterns.
    std::string name{};        ///< Global symbol name.

    /// @brief Reference the result of an earlier instruction.
    [[nodiscard]] static IrOperand value(uint32_t id);

    /// @brief Reference parameter @p index of the enclosing function.
    [[nodiscard]] static IrOperand param(uint32_t index);

    /// @brief Integer (or bool/pointer) literal of the given type.
    [[nodiscard]] static IrOperand constant(IrType type, int64_t value);

    /// @brief f64 literal stored as its bit pattern.
    [[nodiscard]] static IrOperand constantF64(double value);

    /// @brief f32 literal stored as its bit pattern.
    [[nodiscard]] static IrOperand constantF32(float value);

    /// @brief Address of module global @p name.
    [[nodiscard]] static IrOperand global(std::string name);

    /// @brief Render in the IR text syntax.
    [[nodiscard]] std::string toString() const;
};

/// @brief Single IR instruction.
/// @details @ref type is the result type for arithmetic, Load, Constant and
///          Call; the operand type for comparisons (whose result is bool); the
///          stored type for Store; the allocated type for Allocate; and the
///          returned type for Return.
struct Instruction
{
    uint32_t id{0};                     ///< Identity within the function.
    std::optional<uint32_t> result{};   ///< Produced value id, if any.
    InstructionKind kind{InstructionKind::Constant};
    BinaryOp op{BinaryOp::Add};         ///< Meaningful only for BinaryOp.
    IrType type{};
    std::vector<IrOperand> operands{};
    std::string callee{};               ///< Call target name.
    support::SourceLoc loc{};           ///< Location in the IR text.
};

/// @brief Closed set of terminator kinds.
enum class TerminatorKind
{
    Return,
    Jump,
    ConditionalJump,
    Unreachable
};

/// @brief Block-ending control transfer.
struct Terminator
{
    TerminatorKind kind{TerminatorKind::Unreachable};
    std::optional<IrOperand> value{}; ///< Return value (Return) or condition (ConditionalJump).
    uint32_t target{0};               ///< Jump target or "then" block id.
    uint32_t elseTarget{0};           ///< "else" block id for ConditionalJump.
    support::SourceLoc loc{};

    [[nodiscard]] static Terminator ret(std::optional<IrOperand> value = std::nullopt);
    [[nodiscard]] static Terminator jump(uint32_t target);
    [[nodiscard]] static Terminator condJump(IrOperand cond, uint32_t thenId, uint32_t elseId);
    [[nodiscard]] static Terminator unreachable();

    /// @brief Successor block ids in then/else order.
    [[nodiscard]] std::vector<uint32_t> successors() const;
};

/// @brief Basic block: ordered instructions closed by one terminator.
struct BasicBlock
{
    uint32_t id{0};
    std::vector<Instruction> instrs{};
    Terminator terminator{};
};

/// @brief Named, typed function parameter.
struct Param
{
    std::string name{};
    IrType type{};
};

/// @brief IR function; blocks[0] is the entry block.
struct IrFunction
{
    std::string name{};
    std::vector<Param> params{};
    IrType retType{IrType::scalar(TypeKind::Void)};
    std::vector<BasicBlock> blocks{};

    /// @brief Locate block @p id, or nullptr when absent.
    [[nodiscard]] const BasicBlock *findBlock(uint32_t id) const;
};

/// @brief Module-level variable or constant.
struct IrGlobal
{
    std::string name{};
    IrType type{};
    std::optional<int64_t> init{}; ///< Initial value; absent places the global in .bss.
    bool isConstant{false};
};

/// @brief Translation unit consumed by the backend.
struct IrModule
{
    std::string name{"module"};
    std::vector<IrGlobal> globals{};
    std::vector<std::string> externs{}; ///< Declared external functions.
    std::vector<IrFunction> functions{};
};

/// @brief Lowercase mnemonic of a binary sub-op, e.g. "add".
[[nodiscard]] const char *binaryOpName(BinaryOp op);

/// @brief True for Eq, Ne, Lt, Le, Gt and Ge.
[[nodiscard]] bool isComparison(BinaryOp op);

/// @brief Short textual rendering of an instruction for diagnostics.
[[nodiscard]] std::string describe(const Instruction &instr);

/// @brief Short textual rendering of a terminator for diagnostics.
[[nodiscard]] std::string describe(const Terminator &term);

} // namespace kestrel::ir
