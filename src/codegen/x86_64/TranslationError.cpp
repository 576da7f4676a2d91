//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/TranslationError.cpp
// Purpose: Implement error naming, diagnostic conversion and the throwing
//          helper shared by all translation components.
// Key invariants: Diagnostic text always starts with the error kind name.
// Ownership/Lifetime: Returned diagnostics own copies of the error text.
// Links: src/codegen/x86_64/TranslationError.hpp
//
//===----------------------------------------------------------------------===//

#include "TranslationError.hpp"

#include <utility>

namespace kestrel::codegen::x64
{

const char *errorKindName(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::UnsupportedInstruction:
            return "unsupported-instruction";
        case ErrorKind::UnsupportedType:
            return "unsupported-type";
        case ErrorKind::UnsupportedConstruct:
            return "unsupported-construct";
        case ErrorKind::RegisterAllocationFailed:
            return "register-allocation-failed";
        case ErrorKind::StackOverflow:
            return "stack-overflow";
        case ErrorKind::InvalidOperand:
            return "invalid-operand";
        case ErrorKind::AbiViolation:
            return "abi-violation";
        case ErrorKind::AssemblerFailure:
            return "assembler-failure";
    }
    return "unknown";
}

/// @brief Render as "<kind>: <message> in function '<f>' near '<construct>'".
support::Diagnostic TranslationError::toDiagnostic() const
{
    std::string text = std::string(errorKindName(kind)) + ": " + message;
    if (!function.empty())
    {
        text += " in function '" + function + "'";
    }
    if (!construct.empty())
    {
        text += " near '" + construct + "'";
    }
    return support::Diagnostic{support::Severity::Error, std::move(text), loc};
}

TranslationException::TranslationException(TranslationError error)
    : std::runtime_error(error.message), error_(std::move(error))
{
}

const TranslationError &TranslationException::error() const noexcept
{
    return error_;
}

TranslationError &TranslationException::error() noexcept
{
    return error_;
}

void raiseError(ErrorKind kind, std::string message, std::string construct, support::SourceLoc loc)
{
    TranslationError error{};
    error.kind = kind;
    error.message = std::move(message);
    error.construct = std::move(construct);
    error.loc = loc;
    throw TranslationException(std::move(error));
}

} // namespace kestrel::codegen::x64
