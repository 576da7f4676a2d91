//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/FunctionTranslator.hpp
// Purpose: Declare the per-function driver: parameter homing, block
//          translation, frame layout, prologue/epilogue and the final rewrite
//          of temporaries into physical registers.
// Key invariants: The returned MFunction contains physical registers only.
//                 Errors leaving translate() name the function.
// Ownership/Lifetime: Borrows the TranslationContext.
// Links: src/codegen/x86_64/Translator.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "TranslationContext.hpp"
#include "ir/Module.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Translates one IR function into a machine function.
class FunctionTranslator
{
  public:
    explicit FunctionTranslator(TranslationContext &ctx) noexcept;

    [[nodiscard]] MFunction translate(const ir::IrFunction &fn);

    /// \brief Number of operands in @p fn reading each result id.
    [[nodiscard]] static std::unordered_map<uint32_t, uint32_t> countUses(
        const ir::IrFunction &fn);

  private:
    /// \brief Assign every parameter a home; returns the stores that spill
    ///        register parameters into theirs.
    [[nodiscard]] std::vector<MInstr> homeParameters(const ir::IrFunction &fn);

    TranslationContext *ctx_;
};

} // namespace kestrel::codegen::x64
