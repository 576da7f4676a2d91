//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/AssemblyFile.hpp
// Purpose: Declare the append-only assembly file value populated during
//          translation and rendered once into assembler-ready text.
// Key invariants: Items are only appended; after render() the file is sealed
//                 and any further append throws std::logic_error.
// Ownership/Lifetime: The file owns its directives and instructions.
// Links: src/codegen/x86_64/AsmEmitter.hpp, src/codegen/x86_64/SourceMap.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "MachineIR.hpp"
#include "support/source_loc.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Output sections of the assembly file.
enum class Section
{
    Text,
    Data,
    Bss
};

/// \brief Associates one emitted instruction with the IR that produced it.
struct LineMapping
{
    support::SourceLoc irLoc{}; ///< IR line and column.
    std::size_t asmLine{0};     ///< 1-based line in the rendered text.
    std::string label{};        ///< Nearest preceding label.
};

/// \brief Result of sealing an AssemblyFile.
struct RenderedAssembly
{
    std::string text{};
    std::vector<LineMapping> lines{};
};

/// \brief Header directives plus text, data and bss sections.
class AssemblyFile
{
  public:
    /// \brief Append a line emitted before any section.
    void addHeaderDirective(std::string directive);

    /// \brief Append a directive line (without leading tab) to @p section.
    void appendDirective(Section section, std::string directive);

    /// \brief Append a label definition to @p section.
    void appendLabel(Section section, std::string label);

    /// \brief Append one instruction to @p section.
    void appendInstr(Section section, MInstr instr);

    /// \brief Append the complete machine function to the text section.
    void appendFunction(const MFunction &func);

    /// \brief Whether render() has been called.
    [[nodiscard]] bool sealed() const noexcept;

    /// \brief Seal the file and produce its text plus the instruction line map.
    /// \param withComments Whether instruction comments are printed.
    [[nodiscard]] RenderedAssembly render(bool withComments);

  private:
    struct Item
    {
        enum class Kind
        {
            Directive,
            Label,
            Instruction
        };

        Kind kind{Kind::Directive};
        std::string text{};
        MInstr instr{};
    };

    void checkOpen() const;

    std::vector<std::string> header_{};
    std::array<std::vector<Item>, 3> sections_{};
    bool sealed_{false};
};

} // namespace kestrel::codegen::x64
