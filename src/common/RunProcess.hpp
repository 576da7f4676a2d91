//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare the subprocess helper used to invoke the host assembler.
// Key invariants: RunResult captures the exit code and the merged
//                 stdout/stderr text of the child.
// Ownership/Lifetime: Callers own the argument vector; the helper copies it
//                     into a shell command line.
// Links: src/codegen/x86_64/Assembler.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code;   ///< Exit status of the child, or -1 when it could not be started.
    std::string out; ///< Captured standard output and standard error.
};

/// @brief Run @p argv (executable first) through the host shell and wait for it.
RunResult run_process(const std::vector<std::string> &argv);
