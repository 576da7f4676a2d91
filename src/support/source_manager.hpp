//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping file identifiers to input paths.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings.
// Links: src/support/source_loc.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kestrel::support
{

/// Maintains the mapping between numeric file identifiers and the paths of the
/// IR files they were read from.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @details Registering the same path twice returns the original id.
    /// @return New file identifier (>0).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view if unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Index corresponds to file identifier minus one. A deque keeps string
    /// references stable as new files are added.
    std::deque<std::string> files_;
    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace kestrel::support
