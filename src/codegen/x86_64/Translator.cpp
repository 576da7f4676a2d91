//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/Translator.cpp
// Purpose: Implement the module translation facade: structure check, symbol
//          registration, data sections, per-function translation and final
//          rendering.
// Key invariants: Every function is registered before the first one is
//                 translated, so calls may target functions defined later in
//                 the module. This is the only place a TranslationException
//                 is caught and turned into a returned error. Trace lines are
//                 buffered and reach the caller's stream only on success.
// Ownership/Lifetime: The TranslationContext and AssemblyFile live for one
//                     call only.
// Links: src/codegen/x86_64/Translator.hpp
//
//===----------------------------------------------------------------------===//

#include "Translator.hpp"

#include "AbiAdapter.hpp"
#include "AssemblyFile.hpp"
#include "FrameLowering.hpp"
#include "FunctionTranslator.hpp"
#include "SourceMap.hpp"
#include "StructureCheck.hpp"
#include "TranslationContext.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace kestrel::codegen::x64
{

std::optional<UnreachablePolicy> parseUnreachablePolicy(std::string_view text) noexcept
{
    if (text == "trap")
    {
        return UnreachablePolicy::Trap;
    }
    if (text == "none")
    {
        return UnreachablePolicy::None;
    }
    return std::nullopt;
}

namespace
{

/// @brief Data directive holding @p value in @p width bytes.
[[nodiscard]] std::string dataDirective(uint32_t width, int64_t value)
{
    switch (width)
    {
        case 1:
            return ".byte " + std::to_string(static_cast<int8_t>(value));
        case 2:
            return ".short " + std::to_string(static_cast<int16_t>(value));
        case 4:
            return ".long " + std::to_string(static_cast<int32_t>(value));
        default:
            return ".quad " + std::to_string(value);
    }
}

/// @brief Register and emit module globals into .data or .bss.
void emitGlobals(const ir::IrModule &module, TranslationContext &ctx, AssemblyFile &file)
{
    std::array<uint64_t, 3> offsets{};
    for (const ir::IrGlobal &global : module.globals)
    {
        const uint32_t size = global.type.sizeInBytes();
        if (size == 0)
        {
            raiseError(ErrorKind::UnsupportedType,
                       "global '@" + global.name + "' has no storage size",
                       global.name);
        }
        if (global.init && global.type.isAggregate() && *global.init != 0)
        {
            raiseError(ErrorKind::UnsupportedType,
                       "aggregate global '@" + global.name + "' can only be zero-initialised",
                       global.name);
        }

        const Section section = global.init ? Section::Data : Section::Bss;
        auto &offset = offsets[static_cast<std::size_t>(section)];
        offset = static_cast<uint64_t>(roundUp(static_cast<int64_t>(offset), kSlotSizeBytes));
        const SymbolInfo &sym =
            ctx.symbols().define(global.name,
                                 global.isConstant ? SymbolKind::Constant : SymbolKind::Variable,
                                 SectionAddress{section, offset});
        offset += size;

        file.appendDirective(section, ".globl " + sym.asmName);
        file.appendDirective(section, ".p2align 3");
        file.appendLabel(section, sym.asmName);
        if (global.init && !global.type.isAggregate())
        {
            file.appendDirective(section, dataDirective(size, *global.init));
        }
        else
        {
            file.appendDirective(section, ".zero " + std::to_string(size));
        }
    }
}

} // namespace

Translator::Translator(TranslatorOptions options) : options_(std::move(options)) {}

const TranslatorOptions &Translator::options() const noexcept
{
    return options_;
}

/// @brief Translate a module in one pass over its functions.
/// @details Order of work: structure check, globals, function and extern
///          symbols, header, then each function in declaration order. The
///          assembly file is rendered, and the trace flushed, only after every
///          function succeeded.
TranslationResult Translator::translate(const ir::IrModule &module) const
{
    std::ostringstream traceBuffer;
    TranslatorOptions effective = options_;
    if (options_.trace)
    {
        effective.trace = &traceBuffer;
    }
    try
    {
        checkModuleStructure(module);

        TranslationContext ctx(makeAbiAdapter(options_.abi), effective);
        AssemblyFile file;
        file.addHeaderDirective("\t.file \"" + module.name + "\"");
        if (options_.emitComments)
        {
            file.addHeaderDirective(std::string("# calling convention: ") +
                                    abiKindName(options_.abi));
        }

        emitGlobals(module, ctx, file);
        for (const ir::IrFunction &fn : module.functions)
        {
            ctx.symbols().define(fn.name, SymbolKind::Function);
        }
        for (const std::string &name : module.externs)
        {
            ctx.symbols().declareExtern(name);
        }

        FunctionTranslator functions(ctx);
        for (const ir::IrFunction &fn : module.functions)
        {
            file.appendFunction(functions.translate(fn));
        }

        RenderedAssembly rendered = file.render(options_.emitComments);
        TranslationOutput output{};
        output.assembly = std::move(rendered.text);
        if (options_.emitSourceMap)
        {
            SourceMap map{};
            map.module = module.name;
            map.entries = std::move(rendered.lines);
            output.sourceMap = map.render();
        }
        if (options_.trace)
        {
            *options_.trace << traceBuffer.str();
        }
        return output;
    }
    catch (const TranslationException &ex)
    {
        return ex.error();
    }
}

TranslationResult translateModule(const ir::IrModule &module, const TranslatorOptions &options)
{
    return Translator(options).translate(module);
}

} // namespace kestrel::codegen::x64
