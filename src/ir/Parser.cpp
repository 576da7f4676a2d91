//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the IR text reader. The reader is line oriented: module-level
// lines declare globals, externs and function headers, and function bodies
// contain block labels, instructions and terminators, one per line. A small
// cursor tokenizes each line while tracking the 1-based column so every
// diagnostic and every recorded IR location points at the right token.
//
//===----------------------------------------------------------------------===//

#include "ir/Parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <utility>

namespace kestrel::ir
{
namespace
{
using support::Diag;
using support::Expected;
using support::makeError;

/// @brief Character cursor over one input line.
struct LineCursor
{
    std::string_view text;
    std::size_t pos = 0;

    void skipSpace()
    {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
    }

    [[nodiscard]] bool atEnd()
    {
        skipSpace();
        return pos >= text.size();
    }

    [[nodiscard]] uint32_t column() const
    {
        return static_cast<uint32_t>(pos + 1);
    }

    /// @brief Consume @p ch after optional whitespace.
    bool consume(char ch)
    {
        skipSpace();
        if (pos < text.size() && text[pos] == ch)
        {
            ++pos;
            return true;
        }
        return false;
    }

    /// @brief Read the next token, stopping at whitespace or punctuation.
    std::string_view readToken()
    {
        skipSpace();
        const std::size_t start = pos;
        while (pos < text.size())
        {
            const char ch = text[pos];
            if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',' || ch == '(' ||
                ch == ')' || ch == ':' || ch == '{' || ch == '}' || ch == '=')
            {
                break;
            }
            ++pos;
        }
        return text.substr(start, pos - start);
    }
};

/// @brief Mutable reader state threaded through the line handlers.
struct ParserState
{
    IrModule &module;
    uint32_t fileId = 0;
    uint32_t lineNo = 0;
    std::optional<IrFunction> fn{};
    std::optional<BasicBlock> block{};
    bool blockTerminated = false;
    uint32_t nextInstrId = 0;

    [[nodiscard]] support::SourceLoc loc(uint32_t column) const
    {
        return support::SourceLoc{fileId, lineNo, column};
    }

    [[nodiscard]] Diag error(uint32_t column, std::string message) const
    {
        return makeError(loc(column), std::move(message));
    }
};

[[nodiscard]] bool isIdentifier(std::string_view text)
{
    if (text.empty())
    {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const auto ch = static_cast<unsigned char>(text[i]);
        const bool ok = std::isalpha(ch) || ch == '_' || ch == '.' || ch == '$' ||
                        (i > 0 && std::isdigit(ch));
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::optional<uint32_t> parseIndex(std::string_view digits)
{
    uint32_t value = 0;
    const auto *end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (digits.empty() || ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<int64_t> parseInteger(std::string_view text)
{
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+'))
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        base = 16;
        text.remove_prefix(2);
    }
    uint64_t magnitude = 0;
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, magnitude, base);
    if (text.empty() || ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    const auto bits = static_cast<int64_t>(negative ? (~magnitude + 1U) : magnitude);
    return bits;
}

/// @brief True when @p value is representable in the integer type @p type.
/// @details 64-bit kinds and pointers accept every value; narrower kinds use the
///          range of their signedness, and bool accepts only 0 and 1.
[[nodiscard]] bool fitsType(int64_t value, const IrType &type)
{
    switch (type.kind)
    {
        case TypeKind::I8:
            return value >= -128 && value <= 127;
        case TypeKind::I16:
            return value >= -32768 && value <= 32767;
        case TypeKind::I32:
            return value >= INT64_C(-2147483648) && value <= INT64_C(2147483647);
        case TypeKind::U8:
            return value >= 0 && value <= 255;
        case TypeKind::U16:
            return value >= 0 && value <= 65535;
        case TypeKind::U32:
            return value >= 0 && value <= INT64_C(4294967295);
        case TypeKind::Bool:
            return value == 0 || value == 1;
        default:
            return true;
    }
}

[[nodiscard]] std::optional<double> parseFloating(std::string_view text)
{
    const std::string copy(text);
    char *end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (copy.empty() || end != copy.c_str() + copy.size())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] bool looksFloating(std::string_view text)
{
    if (text.find("0x") != std::string_view::npos || text.find("0X") != std::string_view::npos)
    {
        return false;
    }
    return text.find_first_of(".eE") != std::string_view::npos || text == "inf" ||
           text == "-inf" || text == "nan";
}

Expected<IrOperand> parseOperand(ParserState &st,
                                 std::string_view tok,
                                 uint32_t col,
                                 std::optional<IrType> expected)
{
    if (tok.empty())
    {
        return st.error(col, "expected operand");
    }
    if (tok.front() == '%')
    {
        const std::string_view rest = tok.substr(1);
        if (auto id = parseIndex(rest))
        {
            return IrOperand::value(*id);
        }
        if (st.fn)
        {
            for (std::size_t i = 0; i < st.fn->params.size(); ++i)
            {
                if (st.fn->params[i].name == rest)
                {
                    return IrOperand::param(static_cast<uint32_t>(i));
                }
            }
        }
        return st.error(col, "unknown value '" + std::string(tok) + "'");
    }
    if (tok.front() == '@')
    {
        if (!isIdentifier(tok.substr(1)))
        {
            return st.error(col, "malformed global reference '" + std::string(tok) + "'");
        }
        return IrOperand::global(std::string(tok.substr(1)));
    }
    if (tok == "true" || tok == "false")
    {
        return IrOperand::constant(IrType::scalar(TypeKind::Bool), tok == "true" ? 1 : 0);
    }
    if (expected && expected->isFloat())
    {
        const auto value = parseFloating(tok);
        if (!value)
        {
            return st.error(col, "malformed floating-point literal '" + std::string(tok) + "'");
        }
        if (expected->kind == TypeKind::F32)
        {
            return IrOperand::constantF32(static_cast<float>(*value));
        }
        return IrOperand::constantF64(*value);
    }
    if (looksFloating(tok))
    {
        if (expected)
        {
            return st.error(col,
                            "floating-point literal used with type '" + expected->toString() + "'");
        }
        const auto value = parseFloating(tok);
        if (!value)
        {
            return st.error(col, "malformed floating-point literal '" + std::string(tok) + "'");
        }
        return IrOperand::constantF64(*value);
    }
    const auto value = parseInteger(tok);
    if (!value)
    {
        return st.error(col, "malformed operand '" + std::string(tok) + "'");
    }
    const IrType type = expected ? *expected : IrType::scalar(TypeKind::I64);
    if (!type.isIntegerClass())
    {
        return st.error(col, "integer literal used with type '" + type.toString() + "'");
    }
    if (!fitsType(*value, type))
    {
        return st.error(col,
                        "literal " + std::string(tok) + " is out of range for type '" +
                            type.toString() + "'");
    }
    return IrOperand::constant(type, *value);
}

Expected<IrType> expectType(ParserState &st, LineCursor &cur)
{
    cur.skipSpace();
    const uint32_t col = cur.column();
    const std::string_view tok = cur.readToken();
    if (auto type = parseType(tok))
    {
        return *type;
    }
    return st.error(col, "unknown type '" + std::string(tok) + "'");
}

Expected<uint32_t> expectBlockRef(ParserState &st, LineCursor &cur)
{
    cur.skipSpace();
    const uint32_t col = cur.column();
    const std::string_view tok = cur.readToken();
    if (tok.size() > 2 && tok.substr(0, 2) == "bb")
    {
        if (auto id = parseIndex(tok.substr(2)))
        {
            return *id;
        }
    }
    return st.error(col, "expected block reference, found '" + std::string(tok) + "'");
}

Expected<IrOperand> expectOperand(ParserState &st,
                                  LineCursor &cur,
                                  std::optional<IrType> expected)
{
    cur.skipSpace();
    const uint32_t col = cur.column();
    return parseOperand(st, cur.readToken(), col, expected);
}

Expected<void> expectComma(ParserState &st, LineCursor &cur)
{
    if (!cur.consume(','))
    {
        return st.error(cur.column(), "expected ','");
    }
    return {};
}

const std::unordered_map<std::string_view, BinaryOp> kBinaryOps = {
    {"add", BinaryOp::Add},
    {"sub", BinaryOp::Sub},
    {"mul", BinaryOp::Mul},
    {"div", BinaryOp::Div},
    {"and", BinaryOp::And},
    {"or", BinaryOp::Or},
    {"xor", BinaryOp::Xor},
    {"shl", BinaryOp::Shl},
    {"shr", BinaryOp::Shr},
    {"eq", BinaryOp::Eq},
    {"ne", BinaryOp::Ne},
    {"lt", BinaryOp::Lt},
    {"le", BinaryOp::Le},
    {"gt", BinaryOp::Gt},
    {"ge", BinaryOp::Ge},
};

/// @brief Finish the open block, turning a trailing `ret` into its terminator.
Expected<void> closeBlock(ParserState &st, uint32_t col)
{
    if (!st.block)
    {
        return {};
    }
    BasicBlock &bb = *st.block;
    if (!st.blockTerminated)
    {
        if (bb.instrs.empty() || bb.instrs.back().kind != InstructionKind::Return)
        {
            return st.error(col, "block bb" + std::to_string(bb.id) + " has no terminator");
        }
        Instruction last = std::move(bb.instrs.back());
        bb.instrs.pop_back();
        std::optional<IrOperand> value;
        if (!last.operands.empty())
        {
            value = last.operands.front();
        }
        bb.terminator = Terminator::ret(std::move(value));
        bb.terminator.loc = last.loc;
    }
    st.fn->blocks.push_back(std::move(bb));
    st.block.reset();
    st.blockTerminated = false;
    return {};
}

Expected<void> parseFunctionHeader(ParserState &st, LineCursor &cur)
{
    cur.skipSpace();
    const uint32_t nameCol = cur.column();
    const std::string_view name = cur.readToken();
    if (!isIdentifier(name))
    {
        return st.error(nameCol, "malformed function name '" + std::string(name) + "'");
    }
    IrFunction fn{};
    fn.name = std::string(name);
    if (!cur.consume('('))
    {
        return st.error(cur.column(), "expected '(' after function name");
    }
    if (!cur.consume(')'))
    {
        while (true)
        {
            cur.skipSpace();
            const uint32_t col = cur.column();
            const std::string_view paramName = cur.readToken();
            if (!isIdentifier(paramName))
            {
                return st.error(col, "malformed parameter name '" + std::string(paramName) + "'");
            }
            if (!cur.consume(':'))
            {
                return st.error(cur.column(), "expected ':' after parameter name");
            }
            auto type = expectType(st, cur);
            if (!type)
            {
                return type.error();
            }
            fn.params.push_back(Param{std::string(paramName), type.value()});
            if (cur.consume(')'))
            {
                break;
            }
            if (!cur.consume(','))
            {
                return st.error(cur.column(), "expected ',' or ')' in parameter list");
            }
        }
    }
    cur.skipSpace();
    const std::size_t save = cur.pos;
    if (cur.readToken() == "->")
    {
        auto type = expectType(st, cur);
        if (!type)
        {
            return type.error();
        }
        fn.retType = type.value();
    }
    else
    {
        cur.pos = save;
    }
    if (!cur.consume('{'))
    {
        return st.error(cur.column(), "expected '{' to open function body");
    }
    if (!cur.atEnd())
    {
        return st.error(cur.column(), "unexpected text after '{'");
    }
    st.fn = std::move(fn);
    st.nextInstrId = 0;
    return {};
}

Expected<void> parseGlobal(ParserState &st, LineCursor &cur, bool isConstant)
{
    cur.skipSpace();
    const uint32_t col = cur.column();
    const std::string_view name = cur.readToken();
    if (!isIdentifier(name))
    {
        return st.error(col, "malformed global name '" + std::string(name) + "'");
    }
    if (!cur.consume(':'))
    {
        return st.error(cur.column(), "expected ':' after global name");
    }
    auto type = expectType(st, cur);
    if (!type)
    {
        return type.error();
    }
    IrGlobal global{};
    global.name = std::string(name);
    global.type = type.value();
    global.isConstant = isConstant;
    if (cur.consume('='))
    {
        cur.skipSpace();
        const uint32_t initCol = cur.column();
        const auto value = parseInteger(cur.readToken());
        if (!value)
        {
            return st.error(initCol, "global initializer must be an integer literal");
        }
        if (global.type.isIntegerClass() && !fitsType(*value, global.type))
        {
            return st.error(initCol,
                            "initializer " + std::to_string(*value) +
                                " is out of range for type '" + global.type.toString() + "'");
        }
        global.init = *value;
    }
    else if (isConstant)
    {
        return st.error(cur.column(), "constant '" + global.name + "' requires an initializer");
    }
    if (!cur.atEnd())
    {
        return st.error(cur.column(), "unexpected trailing text");
    }
    st.module.globals.push_back(std::move(global));
    return {};
}

Expected<void> parseInstruction(ParserState &st, LineCursor &cur, uint32_t lineCol)
{
    std::optional<uint32_t> result;
    if (cur.text[cur.pos] == '%')
    {
        const std::string_view tok = cur.readToken();
        auto id = parseIndex(tok.substr(1));
        if (!id)
        {
            return st.error(lineCol, "result must be a numbered value such as %0");
        }
        if (!cur.consume('='))
        {
            return st.error(cur.column(), "expected '=' after result");
        }
        result = *id;
    }

    cur.skipSpace();
    const uint32_t opCol = cur.column();
    const std::string opcode(cur.readToken());

    if (!st.block)
    {
        return st.error(lineCol, "instruction outside of a block");
    }
    if (st.blockTerminated)
    {
        return st.error(lineCol,
                        "instruction after terminator in bb" + std::to_string(st.block->id));
    }

    const bool isTerminator = opcode == "jmp" || opcode == "br" || opcode == "unreachable";
    const bool needsResult = kBinaryOps.count(opcode) != 0 || opcode == "load" ||
                             opcode == "alloca" || opcode == "const";
    const bool forbidsResult = isTerminator || opcode == "store" || opcode == "ret";
    if (needsResult && !result)
    {
        return st.error(opCol, "'" + opcode + "' requires a result");
    }
    if (forbidsResult && result)
    {
        return st.error(opCol, "'" + opcode + "' does not produce a result");
    }

    if (isTerminator)
    {
        Terminator term{};
        if (opcode == "jmp")
        {
            auto target = expectBlockRef(st, cur);
            if (!target)
            {
                return target.error();
            }
            term = Terminator::jump(target.value());
        }
        else if (opcode == "br")
        {
            auto cond = expectOperand(st, cur, IrType::scalar(TypeKind::Bool));
            if (!cond)
            {
                return cond.error();
            }
            if (auto ok = expectComma(st, cur); !ok)
            {
                return ok.error();
            }
            auto thenId = expectBlockRef(st, cur);
            if (!thenId)
            {
                return thenId.error();
            }
            if (auto ok = expectComma(st, cur); !ok)
            {
                return ok.error();
            }
            auto elseId = expectBlockRef(st, cur);
            if (!elseId)
            {
                return elseId.error();
            }
            term = Terminator::condJump(cond.value(), thenId.value(), elseId.value());
        }
        else
        {
            term = Terminator::unreachable();
        }
        if (!cur.atEnd())
        {
            return st.error(cur.column(), "unexpected trailing text");
        }
        term.loc = st.loc(lineCol);
        st.block->terminator = std::move(term);
        st.blockTerminated = true;
        return {};
    }

    Instruction instr{};
    instr.id = st.nextInstrId++;
    instr.result = result;
    instr.loc = st.loc(lineCol);

    if (const auto it = kBinaryOps.find(opcode); it != kBinaryOps.end())
    {
        instr.kind = InstructionKind::BinaryOp;
        instr.op = it->second;
        auto type = expectType(st, cur);
        if (!type)
        {
            return type.error();
        }
        instr.type = type.value();
        auto lhs = expectOperand(st, cur, instr.type);
        if (!lhs)
        {
            return lhs.error();
        }
        if (auto ok = expectComma(st, cur); !ok)
        {
            return ok.error();
        }
        auto rhs = expectOperand(st, cur, instr.type);
        if (!rhs)
        {
            return rhs.error();
        }
        instr.operands = {lhs.value(), rhs.value()};
    }
    else if (opcode == "load" || opcode == "alloca" || opcode == "const")
    {
        auto type = expectType(st, cur);
        if (!type)
        {
            return type.error();
        }
        instr.type = type.value();
        if (opcode == "load")
        {
            instr.kind = InstructionKind::Load;
            auto addr = expectOperand(st, cur, IrType::scalar(TypeKind::Ptr));
            if (!addr)
            {
                return addr.error();
            }
            instr.operands = {addr.value()};
        }
        else if (opcode == "alloca")
        {
            instr.kind = InstructionKind::Allocate;
        }
        else
        {
            instr.kind = InstructionKind::Constant;
            auto lit = expectOperand(st, cur, instr.type);
            if (!lit)
            {
                return lit.error();
            }
            instr.operands = {lit.value()};
        }
    }
    else if (opcode == "store")
    {
        instr.kind = InstructionKind::Store;
        auto type = expectType(st, cur);
        if (!type)
        {
            return type.error();
        }
        instr.type = type.value();
        auto value = expectOperand(st, cur, instr.type);
        if (!value)
        {
            return value.error();
        }
        if (auto ok = expectComma(st, cur); !ok)
        {
            return ok.error();
        }
        auto addr = expectOperand(st, cur, IrType::scalar(TypeKind::Ptr));
        if (!addr)
        {
            return addr.error();
        }
        instr.operands = {value.value(), addr.value()};
    }
    else if (opcode == "call")
    {
        instr.kind = InstructionKind::Call;
        auto type = expectType(st, cur);
        if (!type)
        {
            return type.error();
        }
        instr.type = type.value();
        if (result && instr.type.isVoid())
        {
            return st.error(opCol, "void call cannot produce a result");
        }
        cur.skipSpace();
        const uint32_t calleeCol = cur.column();
        const std::string_view callee = cur.readToken();
        if (callee.size() < 2 || callee.front() != '@' || !isIdentifier(callee.substr(1)))
        {
            return st.error(calleeCol, "expected callee such as @name");
        }
        instr.callee = std::string(callee.substr(1));
        if (!cur.consume('('))
        {
            return st.error(cur.column(), "expected '(' after callee");
        }
        if (!cur.consume(')'))
        {
            while (true)
            {
                auto arg = expectOperand(st, cur, std::nullopt);
                if (!arg)
                {
                    return arg.error();
                }
                instr.operands.push_back(arg.value());
                if (cur.consume(')'))
                {
                    break;
                }
                if (!cur.consume(','))
                {
                    return st.error(cur.column(), "expected ',' or ')' in argument list");
                }
            }
        }
    }
    else if (opcode == "ret")
    {
        instr.kind = InstructionKind::Return;
        instr.type = st.fn->retType;
        if (!cur.atEnd())
        {
            if (st.fn->retType.isVoid())
            {
                return st.error(cur.column(), "void function cannot return a value");
            }
            auto value = expectOperand(st, cur, st.fn->retType);
            if (!value)
            {
                return value.error();
            }
            instr.operands = {value.value()};
        }
    }
    else
    {
        return st.error(opCol, "unknown opcode '" + opcode + "'");
    }

    if (!cur.atEnd())
    {
        return st.error(cur.column(), "unexpected trailing text");
    }
    st.block->instrs.push_back(std::move(instr));
    return {};
}

Expected<void> parseBodyLine(ParserState &st, LineCursor &cur)
{
    const uint32_t col = cur.column();
    const std::string_view rest = cur.text.substr(cur.pos);
    if (rest == "}")
    {
        if (auto ok = closeBlock(st, col); !ok)
        {
            return ok;
        }
        if (st.fn->blocks.empty())
        {
            return st.error(col, "function '" + st.fn->name + "' has no blocks");
        }
        st.module.functions.push_back(std::move(*st.fn));
        st.fn.reset();
        return {};
    }
    if (rest.size() > 3 && rest.substr(0, 2) == "bb" && rest.back() == ':')
    {
        auto id = parseIndex(rest.substr(2, rest.size() - 3));
        if (!id)
        {
            return st.error(col, "malformed block label '" + std::string(rest) + "'");
        }
        if (auto ok = closeBlock(st, col); !ok)
        {
            return ok;
        }
        BasicBlock bb{};
        bb.id = *id;
        st.block = std::move(bb);
        st.blockTerminated = false;
        return {};
    }
    return parseInstruction(st, cur, col);
}

Expected<void> parseModuleLine(ParserState &st, LineCursor &cur)
{
    const uint32_t col = cur.column();
    const std::string keyword(cur.readToken());
    if (keyword == "module")
    {
        cur.skipSpace();
        const uint32_t nameCol = cur.column();
        const std::string_view name = cur.readToken();
        if (!isIdentifier(name) || !cur.atEnd())
        {
            return st.error(nameCol, "malformed module name");
        }
        st.module.name = std::string(name);
        return {};
    }
    if (keyword == "global" || keyword == "const")
    {
        return parseGlobal(st, cur, keyword == "const");
    }
    if (keyword == "extern")
    {
        cur.skipSpace();
        const uint32_t nameCol = cur.column();
        const std::string_view name = cur.readToken();
        if (!isIdentifier(name) || !cur.atEnd())
        {
            return st.error(nameCol, "malformed extern name");
        }
        st.module.externs.emplace_back(name);
        return {};
    }
    if (keyword == "func")
    {
        return parseFunctionHeader(st, cur);
    }
    return st.error(col, "unexpected '" + keyword + "' at module level");
}

} // namespace

std::optional<IrType> parseType(std::string_view text)
{
    static const std::unordered_map<std::string_view, TypeKind> kScalars = {
        {"i8", TypeKind::I8},
        {"i16", TypeKind::I16},
        {"i32", TypeKind::I32},
        {"i64", TypeKind::I64},
        {"u8", TypeKind::U8},
        {"u16", TypeKind::U16},
        {"u32", TypeKind::U32},
        {"u64", TypeKind::U64},
        {"bool", TypeKind::Bool},
        {"f32", TypeKind::F32},
        {"f64", TypeKind::F64},
        {"ptr", TypeKind::Ptr},
        {"void", TypeKind::Void},
    };
    if (const auto it = kScalars.find(text); it != kScalars.end())
    {
        return IrType::scalar(it->second);
    }
    for (const auto &[prefix, kind] : {std::pair<std::string_view, TypeKind>{"array<", TypeKind::Array},
                                       std::pair<std::string_view, TypeKind>{"struct<", TypeKind::Struct}})
    {
        if (text.size() > prefix.size() + 1 && text.substr(0, prefix.size()) == prefix &&
            text.back() == '>')
        {
            const auto size =
                parseIndex(text.substr(prefix.size(), text.size() - prefix.size() - 1));
            if (size && *size > 0)
            {
                return IrType::aggregate(kind, *size);
            }
        }
    }
    return std::nullopt;
}

/// @brief Parse IR text line by line into @p m.
/// @details Blank lines and lines starting with '#' or "//" are skipped. Lines
///          outside a function body declare module items; lines inside a body
///          are labels, instructions or terminators.
Expected<void> Parser::parse(std::istream &is, IrModule &m, uint32_t fileId)
{
    ParserState st{m};
    st.fileId = fileId;
    std::string line;
    while (std::getline(is, line))
    {
        ++st.lineNo;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        LineCursor cur{line};
        if (cur.atEnd())
        {
            continue;
        }
        const std::string_view rest = cur.text.substr(cur.pos);
        if (rest.front() == '#' || rest.substr(0, 2) == "//")
        {
            continue;
        }
        // Trailing whitespace would otherwise defeat label and '}' matching.
        while (!cur.text.empty() && std::isspace(static_cast<unsigned char>(cur.text.back())))
        {
            cur.text.remove_suffix(1);
        }
        auto ok = st.fn ? parseBodyLine(st, cur) : parseModuleLine(st, cur);
        if (!ok)
        {
            return ok;
        }
    }
    if (st.fn)
    {
        return makeError(st.loc(1), "unterminated function '" + st.fn->name + "'");
    }
    return {};
}

} // namespace kestrel::ir
