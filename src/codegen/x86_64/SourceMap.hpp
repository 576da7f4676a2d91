//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/SourceMap.hpp
// Purpose: Declare the versioned side file mapping IR locations to lines of
//          the rendered assembly.
// Key invariants: Format version 1:
//                   kestrel-srcmap 1
//                   module <name>
//                   <irLine>:<irCol> -> <asmLine>:<label>   (one per entry)
//                 Entries appear in assembly order.
// Ownership/Lifetime: Plain value.
// Links: src/codegen/x86_64/AssemblyFile.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "AssemblyFile.hpp"

#include <string>
#include <vector>

namespace kestrel::codegen::x64
{

inline constexpr int kSourceMapVersion = 1;

/// \brief Source mapping for one rendered module.
struct SourceMap
{
    std::string module{};
    std::vector<LineMapping> entries{};

    /// \brief Text of the side file.
    [[nodiscard]] std::string render() const;
};

} // namespace kestrel::codegen::x64
