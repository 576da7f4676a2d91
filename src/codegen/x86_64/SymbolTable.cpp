//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/SymbolTable.cpp
// Purpose: Implement symbol registration and resolution for one module.
// Key invariants: Entries are appended to a deque and never erased, so
//                 returned references survive later insertions.
// Ownership/Lifetime: The table owns every SymbolInfo.
// Links: src/codegen/x86_64/SymbolTable.hpp
//
//===----------------------------------------------------------------------===//

#include "SymbolTable.hpp"

#include "TranslationError.hpp"

#include <utility>

namespace kestrel::codegen::x64
{

SymbolTable::SymbolTable(std::string prefix) : prefix_(std::move(prefix)) {}

const SymbolInfo &SymbolTable::define(const std::string &original,
                                      SymbolKind kind,
                                      std::optional<SectionAddress> address)
{
    if (const auto it = index_.find(original); it != index_.end())
    {
        SymbolInfo &existing = symbols_[it->second];
        // A forward extern declaration of a function is upgraded in place.
        if (!existing.defined && existing.kind == SymbolKind::Function &&
            kind == SymbolKind::Function)
        {
            existing.defined = true;
            existing.asmName = prefix_ + original;
            return existing;
        }
        raiseError(ErrorKind::UnsupportedConstruct,
                   "symbol '" + original + "' is defined more than once",
                   original);
    }
    SymbolInfo info{};
    info.original = original;
    info.asmName = prefix_ + original;
    info.kind = kind;
    info.defined = true;
    info.address = address;
    index_.emplace(original, symbols_.size());
    symbols_.push_back(std::move(info));
    return symbols_.back();
}

const SymbolInfo &SymbolTable::declareExtern(const std::string &original)
{
    if (const auto it = index_.find(original); it != index_.end())
    {
        return symbols_[it->second];
    }
    SymbolInfo info{};
    info.original = original;
    // External symbols keep their spelling so they link against the real thing.
    info.asmName = original;
    info.kind = SymbolKind::Function;
    info.defined = false;
    index_.emplace(original, symbols_.size());
    symbols_.push_back(std::move(info));
    return symbols_.back();
}

const SymbolInfo *SymbolTable::lookup(std::string_view original) const
{
    if (const auto it = index_.find(std::string(original)); it != index_.end())
    {
        return &symbols_[it->second];
    }
    return nullptr;
}

const SymbolInfo &SymbolTable::resolveCallee(const std::string &original)
{
    if (const SymbolInfo *info = lookup(original))
    {
        if (info->kind != SymbolKind::Function)
        {
            raiseError(ErrorKind::InvalidOperand,
                       "call target '" + original + "' is not a function",
                       original);
        }
        return *info;
    }
    return declareExtern(original);
}

const SymbolInfo &SymbolTable::resolveData(const std::string &original) const
{
    const SymbolInfo *info = lookup(original);
    if (!info)
    {
        raiseError(ErrorKind::InvalidOperand, "unknown global '@" + original + "'", original);
    }
    if (info->kind == SymbolKind::Function)
    {
        raiseError(ErrorKind::InvalidOperand,
                   "'@" + original + "' names a function, not data",
                   original);
    }
    return *info;
}

std::size_t SymbolTable::size() const noexcept
{
    return symbols_.size();
}

} // namespace kestrel::codegen::x64
