//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/Translator.hpp
// Purpose: Declare the facade that translates a whole IR module into AT&T
//          x86-64 assembly text for the selected calling convention.
// Key invariants: Translation is all or nothing. A failed call returns exactly
//                 one TranslationError, the first in function, block and
//                 instruction order, and no assembly text at all.
// Ownership/Lifetime: The module is borrowed for the duration of the call;
//                     the result owns its strings.
// Links: src/codegen/x86_64/FunctionTranslator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "TranslationError.hpp"
#include "TranslatorOptions.hpp"
#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>

namespace kestrel::codegen::x64
{

/// \brief Successful translation result.
struct TranslationOutput
{
    std::string assembly{};                ///< Assembler-ready text.
    std::optional<std::string> sourceMap{}; ///< Present when requested.
};

using TranslationResult = support::Expected<TranslationOutput, TranslationError>;

/// \brief Module translator configured once and reusable across modules.
class Translator
{
  public:
    explicit Translator(TranslatorOptions options = {});

    [[nodiscard]] const TranslatorOptions &options() const noexcept;

    /// \brief Translate @p module.
    [[nodiscard]] TranslationResult translate(const ir::IrModule &module) const;

  private:
    TranslatorOptions options_;
};

/// \brief Translate @p module with @p options.
[[nodiscard]] TranslationResult translateModule(const ir::IrModule &module,
                                                const TranslatorOptions &options = {});

} // namespace kestrel::codegen::x64
