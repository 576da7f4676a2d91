//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.cpp
// Purpose: Implements file id registration for IR inputs.
// Key invariants: Identifiers are assigned densely starting at 1.
// Ownership/Lifetime: Paths are copied into the manager.
// Links: src/support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <utility>

namespace kestrel::support
{

/// @brief Register a path, reusing the previous id for repeated paths.
/// @param path Path as given on the command line.
/// @return Identifier usable in SourceLoc::file_id.
uint32_t SourceManager::addFile(std::string path)
{
    if (const auto it = path_to_id_.find(path); it != path_to_id_.end())
    {
        return it->second;
    }
    files_.push_back(path);
    const auto id = static_cast<uint32_t>(files_.size());
    path_to_id_.emplace(std::move(path), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
    {
        return {};
    }
    return files_[file_id - 1];
}

} // namespace kestrel::support
