//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the reader for the line-oriented IR text form consumed by
// the kestrelc driver. The format is the serialization of the in-memory module
// declared in ir/Module.hpp:
//
//   module demo
//   global counter: i64 = 0
//   const limit: i64 = 10
//   extern puts
//   func add(a: i64, b: i64) -> i64 {
//   bb0:
//     %0 = add i64 %a, %b
//     ret %0
//   }
//
// Every instruction and terminator records the line and column it was read
// from so that translation errors and the source map can point back at it.
// A `ret` that closes a block becomes the block terminator; a `ret` followed
// by further instructions stays an explicit Return instruction.
//
// Error Handling:
// The first malformed line stops the parse; the diagnostic carries the line
// and column of the offending token.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string_view>

namespace kestrel::ir
{

/// @brief Hand-rolled reader for the IR text form.
class Parser
{
  public:
    /// @brief Parse IR text from @p is into module @p m.
    /// @param is Input stream containing IR text.
    /// @param m Module to populate.
    /// @param fileId SourceManager id stamped into every recorded location.
    /// @return Success, or the diagnostic for the first malformed line.
    [[nodiscard]] static support::Expected<void> parse(std::istream &is,
                                                       IrModule &m,
                                                       uint32_t fileId = 0);
};

/// @brief Parse a type mnemonic such as "i32", "ptr" or "struct<24>".
[[nodiscard]] std::optional<IrType> parseType(std::string_view text);

} // namespace kestrel::ir
