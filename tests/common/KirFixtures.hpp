// File: tests/common/KirFixtures.hpp
// Purpose: Shared helpers for tests that translate IR text and inspect the
//          rendered assembly.
// Key invariants: Helpers report parse or translation failures through
//                 GoogleTest rather than throwing.
// Ownership/Lifetime: Every helper returns values; nothing is cached.
// Links: src/codegen/x86_64/Translator.hpp, src/ir/Parser.hpp

#pragma once

#include "codegen/x86_64/Translator.hpp"
#include "ir/Parser.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel::test
{

/// @brief Parse @p text into a module, flagging a test failure on error.
[[nodiscard]] inline ir::IrModule parseKir(std::string_view text)
{
    std::istringstream in{std::string(text)};
    ir::IrModule module;
    const auto parsed = ir::Parser::parse(in, module, 1);
    if (!parsed)
    {
        ADD_FAILURE() << "IR did not parse: " << parsed.error().message << " at line "
                      << parsed.error().loc.line;
    }
    return module;
}

[[nodiscard]] inline codegen::x64::TranslatorOptions optionsFor(codegen::x64::AbiKind abi)
{
    codegen::x64::TranslatorOptions opts{};
    opts.abi = abi;
    return opts;
}

/// @brief Translate @p text and return its assembly, or "" after a failure.
[[nodiscard]] inline std::string translateKir(std::string_view text,
                                              const codegen::x64::TranslatorOptions &opts)
{
    const auto result = codegen::x64::translateModule(parseKir(text), opts);
    if (!result)
    {
        ADD_FAILURE() << "translation failed: " << result.error().message;
        return {};
    }
    return result.value().assembly;
}

[[nodiscard]] inline std::size_t countOccurrences(std::string_view text, std::string_view needle)
{
    std::size_t count = 0;
    for (std::size_t pos = text.find(needle); pos != std::string_view::npos;
         pos = text.find(needle, pos + needle.size()))
    {
        ++count;
    }
    return count;
}

[[nodiscard]] inline std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    return lines;
}

/// @brief Instruction lines, without directives and labels, from @p from
///        (a label such as "add:") up to the next function entry label.
[[nodiscard]] inline std::vector<std::string> instructionsOf(const std::string &text,
                                                             const std::string &from)
{
    std::vector<std::string> out;
    bool inside = false;
    for (const std::string &line : splitLines(text))
    {
        if (line == from)
        {
            inside = true;
            continue;
        }
        if (!inside)
        {
            continue;
        }
        const bool isLabel = !line.empty() && line.back() == ':';
        if (isLabel && line.front() != '.')
        {
            break;
        }
        if (line.size() > 1 && line[0] == '\t' && line[1] != '.')
        {
            out.push_back(line);
        }
        else if (line.rfind("\t.globl", 0) == 0)
        {
            break;
        }
    }
    return out;
}

} // namespace kestrel::test
