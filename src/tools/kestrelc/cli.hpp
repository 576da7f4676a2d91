//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/kestrelc/cli.hpp
// Purpose: Command-line parsing and driver entry for kestrelc.
// Key invariants: Parsing never touches the filesystem; the driver reads the
//                 input only after the whole command line was accepted.
// Ownership/Lifetime: ArgvView borrows the C runtime's argument storage.
// Links: src/codegen/x86_64/Translator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/TranslatorOptions.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace kestrel::tools::kestrelc
{

inline constexpr std::string_view kUsage =
    "usage: kestrelc <input.kir> [-S <out.s>] [-c <out.o>] [--abi sysv|win64]\n"
    "                [--emit-map <out.map>] [--unreachable trap|none]\n"
    "                [--no-comments] [--symbol-prefix <prefix>] [--trace]\n";

/// @brief Non-owning view over argv-style argument arrays.
struct ArgvView
{
    int argc;
    char **argv;

    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    [[nodiscard]] std::string_view front() const
    {
        return empty() ? std::string_view{} : std::string_view(argv[0]);
    }

    /// @brief Argument at @p index, or an empty view when out of range.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
        {
            return std::string_view{};
        }
        return std::string_view(argv[index]);
    }

    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
        {
            return ArgvView{0, nullptr};
        }
        return ArgvView{argc - count, argv + count};
    }
};

/// @brief Everything the driver needs after the command line was accepted.
struct DriverOptions
{
    std::string inputPath{};
    std::string asmPath{};    ///< Empty writes the assembly to stdout.
    std::string objectPath{}; ///< Non-empty assembles with the host driver.
    std::string mapPath{};    ///< Non-empty writes the source map side file.
    bool trace{false};
    codegen::x64::TranslatorOptions translator{};
};

/// @brief Parsed options or the diagnostic text explaining the rejection.
struct ParseOutcome
{
    std::optional<DriverOptions> opts{};
    std::string diagnostics{};
};

/// @brief Decode the arguments that follow the program name.
[[nodiscard]] ParseOutcome parseArgs(const ArgvView &args);

/// @brief Read, translate and write according to @p opts.
/// @return Process exit status: 0 on success, 1 on any failure.
int runDriver(const DriverOptions &opts, std::ostream &out, std::ostream &err);

} // namespace kestrel::tools::kestrelc
