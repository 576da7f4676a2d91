// File: tests/unit/test_kestrelc_cli.cpp
// Purpose: Exercise kestrelc argument parsing and the driver's file handling.
// Key invariants: Malformed command lines yield usage diagnostics; a failed
//                 translation prints one diagnostic and writes no assembly.
// Ownership/Lifetime: Temporary files live under the system temp directory
//                     and are removed by each test.
// Links: src/tools/kestrelc/cli.hpp

#include "tools/kestrelc/cli.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

using namespace kestrel;
using namespace kestrel::tools::kestrelc;

namespace
{

/// @brief Owns a mutable argv array built from string literals.
class Args
{
  public:
    Args(std::initializer_list<std::string> items) : storage_(items)
    {
        for (auto &item : storage_)
        {
            pointers_.push_back(item.data());
        }
    }

    [[nodiscard]] ArgvView view()
    {
        return ArgvView{static_cast<int>(pointers_.size()), pointers_.data()};
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

/// @brief Scratch directory removed on destruction.
class ScratchDir
{
  public:
    ScratchDir()
    {
        const auto suffix = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("kestrelc-cli-" + std::to_string(suffix));
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] std::string file(const std::string &name, const std::string &contents) const
    {
        const std::filesystem::path p = path_ / name;
        std::ofstream(p) << contents;
        return p.string();
    }

    [[nodiscard]] std::string path(const std::string &name) const
    {
        return (path_ / name).string();
    }

  private:
    std::filesystem::path path_;
};

std::string readFile(const std::string &path)
{
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

constexpr const char *kAddModule = "module demo\n"
                                   "func add(a: i64, b: i64) -> i64 {\n"
                                   "bb0:\n"
                                   "  %0 = add i64 %a, %b\n"
                                   "  ret %0\n"
                                   "}\n";

} // namespace

TEST(KestrelcCli, ParsesAllFlags)
{
    Args args{"in.kir",
              "-S",
              "out.s",
              "--abi",
              "win64",
              "--emit-map",
              "out.map",
              "--unreachable",
              "none",
              "--no-comments",
              "--symbol-prefix",
              "_",
              "-c",
              "out.o",
              "--trace"};
    const ParseOutcome parsed = parseArgs(args.view());
    ASSERT_TRUE(parsed.opts.has_value()) << parsed.diagnostics;

    const DriverOptions &opts = *parsed.opts;
    EXPECT_EQ(opts.inputPath, "in.kir");
    EXPECT_EQ(opts.asmPath, "out.s");
    EXPECT_EQ(opts.mapPath, "out.map");
    EXPECT_EQ(opts.objectPath, "out.o");
    EXPECT_TRUE(opts.trace);
    EXPECT_EQ(opts.translator.abi, codegen::x64::AbiKind::Win64);
    EXPECT_EQ(opts.translator.unreachable, codegen::x64::UnreachablePolicy::None);
    EXPECT_FALSE(opts.translator.emitComments);
    EXPECT_TRUE(opts.translator.emitSourceMap);
    EXPECT_EQ(opts.translator.symbolPrefix, "_");
}

TEST(KestrelcCli, DefaultsToHostConvention)
{
    Args args{"in.kir"};
    const ParseOutcome parsed = parseArgs(args.view());
    ASSERT_TRUE(parsed.opts.has_value());
    EXPECT_EQ(parsed.opts->translator.abi, codegen::x64::hostAbiKind());
    EXPECT_TRUE(parsed.opts->asmPath.empty());
    EXPECT_FALSE(parsed.opts->translator.emitSourceMap);
}

TEST(KestrelcCli, RejectsMalformedCommandLines)
{
    {
        Args args{"in.kir", "--abi", "aapcs"};
        const ParseOutcome parsed = parseArgs(args.view());
        EXPECT_FALSE(parsed.opts.has_value());
        EXPECT_NE(parsed.diagnostics.find("aapcs"), std::string::npos);
    }
    {
        Args args{"in.kir", "-S"};
        const ParseOutcome parsed = parseArgs(args.view());
        EXPECT_FALSE(parsed.opts.has_value());
        EXPECT_NE(parsed.diagnostics.find("-S requires a value"), std::string::npos);
    }
    {
        Args args{"--bogus"};
        const ParseOutcome parsed = parseArgs(args.view());
        EXPECT_FALSE(parsed.opts.has_value());
        EXPECT_NE(parsed.diagnostics.find("usage: kestrelc"), std::string::npos);
    }
    {
        Args args{"--trace"};
        const ParseOutcome parsed = parseArgs(args.view());
        EXPECT_FALSE(parsed.opts.has_value());
        EXPECT_NE(parsed.diagnostics.find("no input file"), std::string::npos);
    }
    {
        Args args{"a.kir", "b.kir"};
        EXPECT_FALSE(parseArgs(args.view()).opts.has_value());
    }
}

TEST(KestrelcCli, WritesAssemblyAndSourceMap)
{
    ScratchDir dir;
    DriverOptions opts{};
    opts.inputPath = dir.file("add.kir", kAddModule);
    opts.asmPath = dir.path("add.s");
    opts.mapPath = dir.path("add.map");
    opts.translator.abi = codegen::x64::AbiKind::SysV;
    opts.translator.emitSourceMap = true;

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runDriver(opts, out, err), 0) << err.str();
    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(readFile(opts.asmPath).find("add:"), std::string::npos);
    EXPECT_EQ(readFile(opts.mapPath).rfind("kestrel-srcmap 1\nmodule demo\n", 0), 0U);
}

TEST(KestrelcCli, PrintsToStdoutWithTrace)
{
    ScratchDir dir;
    DriverOptions opts{};
    opts.inputPath = dir.file("add.kir", kAddModule);
    opts.translator.abi = codegen::x64::AbiKind::SysV;
    opts.trace = true;

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runDriver(opts, out, err), 0);
    EXPECT_NE(out.str().find("\taddq "), std::string::npos);
    EXPECT_NE(err.str().find("[kestrel] function add: 1 block(s)"), std::string::npos);
}

TEST(KestrelcCli, TranslationErrorPrintsOneDiagnostic)
{
    ScratchDir dir;
    DriverOptions opts{};
    opts.inputPath = dir.file("bad.kir",
                              "func bad(x: f64, y: f64) -> f64 {\n"
                              "bb0:\n"
                              "  %0 = shl f64 %x, %y\n"
                              "  ret %0\n"
                              "}\n");
    opts.asmPath = dir.path("bad.s");

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runDriver(opts, out, err), 1);
    EXPECT_FALSE(std::filesystem::exists(opts.asmPath));
    EXPECT_NE(err.str().find("bad.kir:3:"), std::string::npos) << err.str();
    EXPECT_NE(err.str().find("error"), std::string::npos);
}

TEST(KestrelcCli, ParseErrorFailsRun)
{
    ScratchDir dir;
    DriverOptions opts{};
    opts.inputPath = dir.file("broken.kir", "func f( {\n");

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runDriver(opts, out, err), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_FALSE(err.str().empty());
}

TEST(KestrelcCli, MissingInputFailsRun)
{
    DriverOptions opts{};
    opts.inputPath = "/nonexistent/kestrel/input.kir";
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runDriver(opts, out, err), 1);
    EXPECT_NE(err.str().find("unable to open"), std::string::npos);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
