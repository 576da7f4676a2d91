//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/AssemblyFile.cpp
// Purpose: Implement the append-only assembly file and its single render step.
// Key invariants: Sections render in text, data, bss order and only when
//                 non-empty; line numbers in the map are 1-based and match
//                 the rendered text exactly.
// Ownership/Lifetime: The rendered text is returned by value.
// Links: src/codegen/x86_64/AssemblyFile.hpp
//
//===----------------------------------------------------------------------===//

#include "AssemblyFile.hpp"

#include "AsmEmitter.hpp"

#include <stdexcept>
#include <utility>

namespace kestrel::codegen::x64
{

namespace
{
constexpr std::array<const char *, 3> kSectionDirectives{"\t.text", "\t.data", "\t.bss"};
} // namespace

void AssemblyFile::checkOpen() const
{
    if (sealed_)
    {
        throw std::logic_error("assembly file is sealed; no further appends are allowed");
    }
}

void AssemblyFile::addHeaderDirective(std::string directive)
{
    checkOpen();
    header_.push_back(std::move(directive));
}

void AssemblyFile::appendDirective(Section section, std::string directive)
{
    checkOpen();
    Item item{};
    item.kind = Item::Kind::Directive;
    item.text = std::move(directive);
    sections_[static_cast<std::size_t>(section)].push_back(std::move(item));
}

void AssemblyFile::appendLabel(Section section, std::string label)
{
    checkOpen();
    Item item{};
    item.kind = Item::Kind::Label;
    item.text = std::move(label);
    sections_[static_cast<std::size_t>(section)].push_back(std::move(item));
}

void AssemblyFile::appendInstr(Section section, MInstr instr)
{
    checkOpen();
    Item item{};
    item.kind = Item::Kind::Instruction;
    item.instr = std::move(instr);
    sections_[static_cast<std::size_t>(section)].push_back(std::move(item));
}

/// @brief Append a function as: symbol directives, entry label, prologue,
///        body blocks, and (when present) the shared epilogue.
void AssemblyFile::appendFunction(const MFunction &func)
{
    appendDirective(Section::Text, ".globl " + func.name);
    appendDirective(Section::Text, ".p2align 4");
    appendLabel(Section::Text, func.name);
    for (const auto &instr : func.prologue)
    {
        appendInstr(Section::Text, instr);
    }
    for (const auto &block : func.blocks)
    {
        appendLabel(Section::Text, block.label);
        for (const auto &instr : block.instructions)
        {
            appendInstr(Section::Text, instr);
        }
    }
    if (!func.epilogueLabel.empty())
    {
        appendLabel(Section::Text, func.epilogueLabel);
        for (const auto &instr : func.epilogue)
        {
            appendInstr(Section::Text, instr);
        }
    }
}

bool AssemblyFile::sealed() const noexcept
{
    return sealed_;
}

RenderedAssembly AssemblyFile::render(bool withComments)
{
    checkOpen();
    sealed_ = true;

    RenderedAssembly out{};
    std::size_t lineNo = 0;
    const auto emitLine = [&](const std::string &line)
    {
        out.text += line;
        out.text += '\n';
        ++lineNo;
    };

    for (const auto &directive : header_)
    {
        emitLine(directive);
    }

    for (std::size_t s = 0; s < sections_.size(); ++s)
    {
        const auto &items = sections_[s];
        if (items.empty())
        {
            continue;
        }
        emitLine(kSectionDirectives[s]);
        std::string currentLabel;
        for (const auto &item : items)
        {
            switch (item.kind)
            {
                case Item::Kind::Directive:
                    emitLine("\t" + item.text);
                    break;
                case Item::Kind::Label:
                    currentLabel = item.text;
                    emitLine(item.text + ":");
                    break;
                case Item::Kind::Instruction:
                    emitLine(AsmEmitter::formatInstruction(item.instr, withComments));
                    if (item.instr.origin.hasLine())
                    {
                        out.lines.push_back(LineMapping{item.instr.origin, lineNo, currentLabel});
                    }
                    break;
            }
        }
    }
    return out;
}

} // namespace kestrel::codegen::x64
