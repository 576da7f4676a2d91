//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/kestrelc/main.cpp
// Purpose: Entry point of the kestrelc translator.
// Key invariants: Exit status is 0 on success and 1 on any error.
// Ownership/Lifetime: None beyond the process.
// Links: src/tools/kestrelc/cli.hpp
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    using namespace kestrel::tools::kestrelc;

    const ParseOutcome parsed = parseArgs(ArgvView{argc, argv}.drop_front());
    if (!parsed.opts)
    {
        std::cerr << parsed.diagnostics;
        return 1;
    }
    return runDriver(*parsed.opts, std::cout, std::cerr);
}
