//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/kestrelc/cli.cpp
// Purpose: Implement kestrelc argument parsing and the translate-and-write
//          driver.
// Key invariants: Output files are written only after translation succeeded,
//                 so a failed run leaves no partial assembly behind.
// Ownership/Lifetime: The SourceManager and module live for one driver run.
// Links: src/tools/kestrelc/cli.hpp
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "codegen/x86_64/Assembler.hpp"
#include "codegen/x86_64/Translator.hpp"
#include "ir/Parser.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace kestrel::tools::kestrelc
{

namespace
{

/// @brief Fetch the value following flag @p flag or record a diagnostic.
bool takeValue(const ArgvView &args,
               int &index,
               std::string_view flag,
               std::string &value,
               std::ostringstream &diag)
{
    if (index + 1 >= args.argc)
    {
        diag << "error: " << flag << " requires a value\n" << kUsage;
        return false;
    }
    value = std::string(args.at(++index));
    return true;
}

/// @brief Write @p text to @p path, reporting failures on @p err.
bool writeFile(const std::string &path, const std::string &text, std::ostream &err)
{
    std::ofstream os(path, std::ios::binary);
    if (!os)
    {
        err << "error: unable to open " << path << "\n";
        return false;
    }
    os << text;
    if (!os)
    {
        err << "error: failed to write " << path << "\n";
        return false;
    }
    return true;
}

} // namespace

ParseOutcome parseArgs(const ArgvView &args)
{
    ParseOutcome outcome{};
    if (args.empty())
    {
        outcome.diagnostics = std::string{kUsage};
        return outcome;
    }

    DriverOptions opts{};
    std::ostringstream diag;
    for (int index = 0; index < args.argc; ++index)
    {
        const std::string_view arg = args.at(index);
        std::string value;
        if (arg == "-S")
        {
            if (!takeValue(args, index, arg, opts.asmPath, diag))
                break;
            continue;
        }
        if (arg == "-c")
        {
            if (!takeValue(args, index, arg, opts.objectPath, diag))
                break;
            continue;
        }
        if (arg == "--emit-map")
        {
            if (!takeValue(args, index, arg, opts.mapPath, diag))
                break;
            opts.translator.emitSourceMap = true;
            continue;
        }
        if (arg == "--abi")
        {
            if (!takeValue(args, index, arg, value, diag))
                break;
            const auto abi = codegen::x64::parseAbiKind(value);
            if (!abi)
            {
                diag << "error: unknown calling convention '" << value << "'\n" << kUsage;
                break;
            }
            opts.translator.abi = *abi;
            continue;
        }
        if (arg == "--unreachable")
        {
            if (!takeValue(args, index, arg, value, diag))
                break;
            const auto policy = codegen::x64::parseUnreachablePolicy(value);
            if (!policy)
            {
                diag << "error: unknown unreachable policy '" << value << "'\n" << kUsage;
                break;
            }
            opts.translator.unreachable = *policy;
            continue;
        }
        if (arg == "--symbol-prefix")
        {
            if (!takeValue(args, index, arg, opts.translator.symbolPrefix, diag))
                break;
            continue;
        }
        if (arg == "--no-comments")
        {
            opts.translator.emitComments = false;
            continue;
        }
        if (arg == "--trace")
        {
            opts.trace = true;
            continue;
        }
        if (!arg.empty() && arg.front() == '-')
        {
            diag << "error: unknown flag '" << arg << "'\n" << kUsage;
            break;
        }
        if (!opts.inputPath.empty())
        {
            diag << "error: more than one input file\n" << kUsage;
            break;
        }
        opts.inputPath = std::string(arg);
    }

    if (diag.tellp() == 0 && opts.inputPath.empty())
    {
        diag << "error: no input file\n" << kUsage;
    }
    if (diag.tellp() != 0)
    {
        outcome.diagnostics = diag.str();
        return outcome;
    }
    outcome.opts = std::move(opts);
    return outcome;
}

int runDriver(const DriverOptions &opts, std::ostream &out, std::ostream &err)
{
    std::ifstream in(opts.inputPath);
    if (!in)
    {
        err << "error: unable to open " << opts.inputPath << "\n";
        return 1;
    }

    support::SourceManager sm;
    const uint32_t fileId = sm.addFile(opts.inputPath);
    ir::IrModule module;
    if (auto parsed = ir::Parser::parse(in, module, fileId); !parsed)
    {
        support::printDiag(parsed.error(), err, &sm);
        return 1;
    }

    codegen::x64::TranslatorOptions translatorOpts = opts.translator;
    if (opts.trace)
    {
        translatorOpts.trace = &err;
    }
    const codegen::x64::TranslationResult result =
        codegen::x64::Translator(translatorOpts).translate(module);
    if (!result)
    {
        support::printDiag(result.error().toDiagnostic(), err, &sm);
        return 1;
    }

    const codegen::x64::TranslationOutput &output = result.value();
    if (opts.asmPath.empty())
    {
        out << output.assembly;
    }
    else if (!writeFile(opts.asmPath, output.assembly, err))
    {
        return 1;
    }

    if (!opts.mapPath.empty() && output.sourceMap &&
        !writeFile(opts.mapPath, *output.sourceMap, err))
    {
        return 1;
    }

    if (!opts.objectPath.empty())
    {
        const std::string asmPath =
            opts.asmPath.empty() ? opts.objectPath + ".s" : opts.asmPath;
        if (auto assembled = codegen::x64::assembleObject(output.assembly, asmPath, opts.objectPath);
            !assembled)
        {
            support::printDiag(assembled.error().toDiagnostic(), err, &sm);
            return 1;
        }
    }
    return 0;
}

} // namespace kestrel::tools::kestrelc
