//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/Assembler.hpp
// Purpose: Declare the optional hand-off of translated text to the host
//          assembler through the C compiler driver.
// Key invariants: A non-zero exit of the driver becomes one AssemblerFailure
//                 carrying the driver's output.
// Ownership/Lifetime: Stateless.
// Links: src/common/RunProcess.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "TranslationError.hpp"
#include "support/diag_expected.hpp"

#include <string>

namespace kestrel::codegen::x64
{

/// \brief Write @p assembly to @p asmPath and assemble it into @p objectPath.
/// \param driver Compiler driver to invoke, "cc" unless overridden.
[[nodiscard]] support::Expected<void, TranslationError> assembleObject(
    const std::string &assembly,
    const std::string &asmPath,
    const std::string &objectPath,
    const std::string &driver = "cc");

} // namespace kestrel::codegen::x64
