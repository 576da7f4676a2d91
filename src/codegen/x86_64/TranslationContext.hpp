//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TranslationContext.hpp
// Purpose: Declare the mutable state threaded through one module translation:
//          the selected ABI adapter, the symbol table, the temporary issuer,
//          and the per-function value homes, frame and label counter.
// Key invariants: beginFunction() resets the label counter, the temporaries,
//                 the value table and the frame. The symbol table and the ABI
//                 adapter persist for the whole module so later functions stay
//                 callable from earlier ones.
// Ownership/Lifetime: Owned by the Translator facade for exactly one
//                     translateModule call; never shared.
// Links: src/codegen/x86_64/Translator.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "AbiAdapter.hpp"
#include "FrameLowering.hpp"
#include "MachineIR.hpp"
#include "SymbolTable.hpp"
#include "TempRegisterAllocator.hpp"
#include "TranslatorOptions.hpp"
#include "ir/Module.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief How an IR value can be reached at run time.
struct ValueInfo
{
    enum class Kind
    {
        Home,     ///< Stored in the 8-byte slot at disp(%rbp).
        Address,  ///< The value is the address disp(%rbp) itself (Allocate).
        Constant  ///< Known immediate; no storage.
    };

    Kind kind{Kind::Home};
    ir::IrType type{};
    int32_t disp{0};
    int64_t bits{0};
};

/// \brief Module-wide translation state.
class TranslationContext
{
  public:
    TranslationContext(std::unique_ptr<AbiAdapter> abi, const TranslatorOptions &options);

    [[nodiscard]] const AbiAdapter &abi() const noexcept;
    [[nodiscard]] const TranslatorOptions &options() const noexcept;
    [[nodiscard]] SymbolTable &symbols() noexcept;
    [[nodiscard]] TempRegisterAllocator &temps() noexcept;
    [[nodiscard]] FrameState &frame() noexcept;

    /// \brief Enter @p fn; resets every per-function counter.
    void beginFunction(const ir::IrFunction &fn, std::string asmName);

    /// \brief The function being translated.
    /// \throws TranslationException (UnsupportedConstruct) outside a function.
    [[nodiscard]] const ir::IrFunction &function() const;

    /// \brief Assembly name of the current function.
    [[nodiscard]] const std::string &functionSymbol() const noexcept;

    /// \brief Label of block @p id of the current function.
    [[nodiscard]] std::string blockLabel(uint32_t id) const;

    /// \brief Label of the shared epilogue of the current function.
    [[nodiscard]] std::string epilogueLabel() const;

    /// \brief Fresh function-local label `.L<fn>_<hint><N>`.
    [[nodiscard]] std::string freshLabel(std::string_view hint);

    /// \brief Number of fresh labels issued in the current function.
    [[nodiscard]] uint32_t labelCount() const noexcept;

    /// \brief Record how parameter @p index is reached.
    void setParam(uint32_t index, ValueInfo info);

    /// \brief Record how result @p id is reached.
    void setValue(uint32_t id, ValueInfo info);

    /// \brief How parameter @p index is reached.
    /// \throws TranslationException (InvalidOperand) for an unknown index.
    [[nodiscard]] const ValueInfo &param(uint32_t index) const;

    /// \brief How result @p id is reached.
    /// \throws TranslationException (InvalidOperand) when not yet defined.
    [[nodiscard]] const ValueInfo &value(uint32_t id) const;

    /// \brief Number of operands across the function that read result @p id.
    [[nodiscard]] uint32_t useCount(uint32_t id) const;

    /// \brief Replace the per-function use counts.
    void setUseCounts(std::unordered_map<uint32_t, uint32_t> counts);

    /// \brief Condition left in the flags by a compare fused into the branch.
    std::optional<CondCode> pendingBranchCond{};

    /// \brief Set once any path of the current function returns.
    bool hasReturn{false};

  private:
    std::unique_ptr<AbiAdapter> abi_;
    const TranslatorOptions *options_;
    SymbolTable symbols_;
    TempRegisterAllocator temps_;
    FrameState frame_{};

    const ir::IrFunction *function_{nullptr};
    std::string functionSymbol_{};
    uint32_t labelCounter_{0};
    std::vector<ValueInfo> params_{};
    std::unordered_map<uint32_t, ValueInfo> values_{};
    std::unordered_map<uint32_t, uint32_t> useCounts_{};
};

} // namespace kestrel::codegen::x64
