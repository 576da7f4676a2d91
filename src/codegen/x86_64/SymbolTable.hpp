//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/SymbolTable.hpp
// Purpose: Declare the module-wide mapping from IR names to assembly symbols.
// Key invariants: The table only grows during one module translation; an IR
//                 name maps to exactly one SymbolInfo. A resolved address is
//                 present only for section-relative data symbols. Returned
//                 references stay valid for the lifetime of the table.
// Ownership/Lifetime: Owned by TranslationContext for one module translation.
// Links: src/codegen/x86_64/TranslationContext.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "AssemblyFile.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kestrel::codegen::x64
{

/// \brief Category of a module symbol.
enum class SymbolKind
{
    Function,
    Variable,
    Constant
};

/// \brief Statically known section-relative location.
struct SectionAddress
{
    Section section;
    uint64_t offset{0};
};

/// \brief Everything the translator knows about one symbol.
struct SymbolInfo
{
    std::string original{};                 ///< Name as written in the IR.
    std::string asmName{};                  ///< Name emitted in assembly.
    SymbolKind kind{SymbolKind::Function};
    bool defined{false};                    ///< Defined in this module (vs. extern).
    std::optional<SectionAddress> address{}; ///< Absent for externs and functions.
};

/// \brief Module-scoped symbol registry.
class SymbolTable
{
  public:
    /// \param prefix Prepended to every assembly name.
    explicit SymbolTable(std::string prefix = {});

    /// \brief Register a symbol defined by the module.
    /// \throws TranslationException (UnsupportedConstruct) on redefinition.
    const SymbolInfo &define(const std::string &original,
                             SymbolKind kind,
                             std::optional<SectionAddress> address = std::nullopt);

    /// \brief Register an external function; repeated declarations are merged.
    const SymbolInfo &declareExtern(const std::string &original);

    /// \brief Find a symbol by IR name.
    [[nodiscard]] const SymbolInfo *lookup(std::string_view original) const;

    /// \brief Resolve a call target, declaring unknown names as externs.
    /// \throws TranslationException (InvalidOperand) when the name is data.
    const SymbolInfo &resolveCallee(const std::string &original);

    /// \brief Resolve a data reference.
    /// \throws TranslationException (InvalidOperand) when unknown or a function.
    const SymbolInfo &resolveData(const std::string &original) const;

    /// \brief Number of registered symbols.
    [[nodiscard]] std::size_t size() const noexcept;

  private:
    std::string prefix_;
    std::deque<SymbolInfo> symbols_{};
    std::unordered_map<std::string, std::size_t> index_{};
};

} // namespace kestrel::codegen::x64
