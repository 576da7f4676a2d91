//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Launches external tools for the command-line driver. The argument vector is
// quoted into a single shell command, run through the platform's popen, and
// its output collected for diagnostics.
//
//===----------------------------------------------------------------------===//

#include "common/RunProcess.hpp"

#include <cstddef>
#include <cstdio>

#ifndef _WIN32
#    include <sys/wait.h>
#endif

#ifdef _WIN32
#    define POPEN _popen
#    define PCLOSE _pclose
#else
#    define POPEN popen
#    define PCLOSE pclose
#endif

namespace
{

/// @brief Double-quote @p arg, escaping the characters the shell treats
///        specially inside double quotes.
std::string quote_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('"');
    for (const char ch : arg)
    {
#ifndef _WIN32
        if (ch == '\\' || ch == '"' || ch == '$' || ch == '`')
#else
        if (ch == '"')
#endif
        {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace

RunResult run_process(const std::vector<std::string> &argv)
{
    std::string cmd;
    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
        {
            cmd += ' ';
        }
        cmd += quote_argument(argv[i]);
    }
    cmd += " 2>&1";

    RunResult rr{0, ""};
    FILE *pipe = POPEN(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exit_code = -1;
        rr.out = "failed to start '" + (argv.empty() ? std::string() : argv.front()) + "'";
        return rr;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe))
    {
        rr.out += buffer;
    }

    const int status = PCLOSE(pipe);
#ifdef _WIN32
    rr.exit_code = status;
#else
    if (WIFEXITED(status))
    {
        rr.exit_code = WEXITSTATUS(status);
    }
    else
    {
        rr.exit_code = status;
    }
#endif
    return rr;
}

#undef POPEN
#undef PCLOSE
