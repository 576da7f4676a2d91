//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers that accompany the Expected container:
// severity naming, error construction, and the single printer used by every
// command-line entry point so that parse and translation failures read alike.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace kestrel::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided location and message.
Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When the location names a registered file the message is prefixed
///          with "<path>:<line>:<column>:". Locations without a file but with a
///          line (modules built in memory) print "<line>:<column>:" instead.
///          A trailing newline is always written.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    bool wrotePrefix = false;
    if (sm && diag.loc.hasFile())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            wrotePrefix = true;
        }
    }
    if (diag.loc.hasLine())
    {
        if (wrotePrefix)
        {
            os << ':';
        }
        os << diag.loc.line;
        if (diag.loc.column != 0)
        {
            os << ':' << diag.loc.column;
        }
        wrotePrefix = true;
    }
    if (wrotePrefix)
    {
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace kestrel::support
