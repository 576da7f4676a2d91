//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TranslationError.hpp
// Purpose: Declare the structured error reported by the translator and the
//          exception used to carry it out of nested translation components.
// Key invariants: raiseError() never returns. Only the Translator facade
//                 catches TranslationException; every other component lets it
//                 propagate after (at most) annotating missing context.
// Ownership/Lifetime: Errors own their message and context strings.
// Links: src/codegen/x86_64/Translator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_loc.hpp"

#include <stdexcept>
#include <string>

namespace kestrel::codegen::x64
{

/// @brief Failure taxonomy of the translator.
enum class ErrorKind
{
    UnsupportedInstruction,
    UnsupportedType,
    UnsupportedConstruct,
    RegisterAllocationFailed,
    StackOverflow,
    InvalidOperand,
    AbiViolation,
    AssemblerFailure
};

/// @brief Hyphenated name of @p kind, e.g. "unsupported-instruction".
[[nodiscard]] const char *errorKindName(ErrorKind kind) noexcept;

/// @brief The single error returned by a failed translation.
struct TranslationError
{
    ErrorKind kind{ErrorKind::UnsupportedConstruct};
    std::string message{};   ///< Human-readable description.
    std::string function{};  ///< Enclosing IR function, when known.
    std::string construct{}; ///< Offending IR text, when known.
    support::SourceLoc loc{}; ///< IR location, when known.

    /// @brief Convert into the shared compiler diagnostic.
    [[nodiscard]] support::Diagnostic toDiagnostic() const;
};

/// @brief Exception carrying a TranslationError through the translator.
class TranslationException : public std::runtime_error
{
  public:
    explicit TranslationException(TranslationError error);

    [[nodiscard]] const TranslationError &error() const noexcept;
    [[nodiscard]] TranslationError &error() noexcept;

  private:
    TranslationError error_;
};

/// @brief Throw a TranslationException describing the failure.
/// @param kind Error category.
/// @param message Human-readable description.
/// @param construct Offending IR text, if available.
/// @param loc IR location, if available.
[[noreturn]] void raiseError(ErrorKind kind,
                             std::string message,
                             std::string construct = {},
                             support::SourceLoc loc = {});

} // namespace kestrel::codegen::x64
