//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_loc.hpp
// Purpose: Declares the lightweight source location POD shared by the IR,
//          the translator, and diagnostics.
// Key invariants: file_id == 0 denotes "no registered file"; line/column are
//                 1-based and 0 when unknown.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: src/support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace kestrel::support
{

/// @brief Absolute position within an IR text file.
/// @invariant file_id == 0 indicates the location is not tied to a file, which
///            is the case for modules constructed in memory.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when not file-backed.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Determine whether a concrete file identifier is attached.
    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

} // namespace kestrel::support
