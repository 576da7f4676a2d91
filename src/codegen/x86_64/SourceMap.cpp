//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/SourceMap.cpp
// Purpose: Render the source mapping side file.
// Key invariants: See SourceMap.hpp for the format.
// Ownership/Lifetime: Returns a fresh string.
// Links: src/codegen/x86_64/SourceMap.hpp
//
//===----------------------------------------------------------------------===//

#include "SourceMap.hpp"

#include <sstream>

namespace kestrel::codegen::x64
{

std::string SourceMap::render() const
{
    std::ostringstream os;
    os << "kestrel-srcmap " << kSourceMapVersion << '\n';
    os << "module " << module << '\n';
    for (const LineMapping &entry : entries)
    {
        os << entry.irLoc.line << ':' << entry.irLoc.column << " -> " << entry.asmLine << ':'
           << entry.label << '\n';
    }
    return os.str();
}

} // namespace kestrel::codegen::x64
