// File: tests/unit/test_run_process_quotes.cpp
// Purpose: Verify run_process preserves shell-sensitive characters when
//          quoting arguments and reports the child's exit status.
// Key invariants: Quotes and backslashes inside arguments survive the trip
//                 through the helper.
// Ownership/Lifetime: The spawned processes terminate immediately.
// Links: src/common/RunProcess.cpp

#include "common/RunProcess.hpp"

#include <gtest/gtest.h>

#include <string>

namespace
{
std::string trim_trailing_newlines(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    {
        text.pop_back();
    }
    return text;
}
} // namespace

TEST(RunProcess, PreservesQuotesAndBackslashes)
{
    const std::string trickyArg = "value \"with quotes\" and backslash \\\\ tail";

    const RunResult result = run_process({"cmake", "-E", "echo", trickyArg});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(trickyArg, trim_trailing_newlines(result.out));
}

#ifndef _WIN32
TEST(RunProcess, EscapesPosixShellExpansions)
{
    const std::string trickyArg = "literal $PATH and `uname` markers";

    const RunResult result = run_process({"cmake", "-E", "echo", trickyArg});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(trickyArg, trim_trailing_newlines(result.out));
}

TEST(RunProcess, ReportsPosixExitStatus)
{
    const RunResult result = run_process({"sh", "-c", "exit 42"});

    EXPECT_EQ(42, result.exit_code);
}

TEST(RunProcess, MergesStandardError)
{
    const RunResult result = run_process({"sh", "-c", "echo kestrel-stderr-sample 1>&2"});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_NE(std::string::npos, result.out.find("kestrel-stderr-sample"));
}
#endif

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
