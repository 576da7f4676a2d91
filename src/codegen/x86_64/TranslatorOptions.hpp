//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/TranslatorOptions.hpp
// Purpose: Declare the knobs that configure one module translation.
// Key invariants: Options are read-only for the duration of a translation.
// Ownership/Lifetime: Plain value; the trace stream is borrowed.
// Links: src/codegen/x86_64/Translator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "TargetX64.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace kestrel::codegen::x64
{

/// \brief What an Unreachable terminator turns into.
enum class UnreachablePolicy
{
    Trap, ///< A single ud2.
    None  ///< No instruction at all.
};

/// \brief Parse "trap" or "none".
[[nodiscard]] std::optional<UnreachablePolicy> parseUnreachablePolicy(std::string_view text) noexcept;

/// \brief Options accepted by the translator facade.
struct TranslatorOptions
{
    AbiKind abi{hostAbiKind()};
    UnreachablePolicy unreachable{UnreachablePolicy::Trap};
    bool emitComments{true};
    bool emitSourceMap{false};
    /// \brief Largest frame, in bytes below the saved %rbp, a function may use.
    uint64_t maxFrameSize{uint64_t{1} << 20};
    /// \brief Prepended to every function and global symbol the module defines.
    std::string symbolPrefix{};
    /// \brief When set, receives one line per function and block translated.
    std::ostream *trace{nullptr};
};

} // namespace kestrel::codegen::x64
