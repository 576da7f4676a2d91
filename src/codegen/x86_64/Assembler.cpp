//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/Assembler.cpp
// Purpose: Run `<driver> -c <asm> -o <obj>` on translated text.
// Key invariants: The assembly file is fully written and closed before the
//                 driver starts.
// Ownership/Lifetime: Stateless.
// Links: src/codegen/x86_64/Assembler.hpp
//
//===----------------------------------------------------------------------===//

#include "Assembler.hpp"

#include "common/RunProcess.hpp"

#include <fstream>
#include <vector>

namespace kestrel::codegen::x64
{

namespace
{

[[nodiscard]] TranslationError assemblerFailure(std::string message)
{
    TranslationError err{};
    err.kind = ErrorKind::AssemblerFailure;
    err.message = std::move(message);
    return err;
}

} // namespace

support::Expected<void, TranslationError> assembleObject(const std::string &assembly,
                                                         const std::string &asmPath,
                                                         const std::string &objectPath,
                                                         const std::string &driver)
{
    {
        std::ofstream os(asmPath, std::ios::binary);
        if (!os)
        {
            return assemblerFailure("unable to open " + asmPath);
        }
        os << assembly;
        if (!os)
        {
            return assemblerFailure("failed to write " + asmPath);
        }
    }

    const RunResult rr = run_process({driver, "-c", asmPath, "-o", objectPath});
    if (rr.exit_code != 0)
    {
        std::string message =
            driver + " exited with status " + std::to_string(rr.exit_code) + " on " + asmPath;
        if (!rr.out.empty())
        {
            message += ":\n" + rr.out;
        }
        return assemblerFailure(std::move(message));
    }
    return {};
}

} // namespace kestrel::codegen::x64
