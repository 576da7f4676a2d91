//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/StructureCheck.cpp
// Purpose: Implement the module structure validation.
// Key invariants: Runs to completion before the assembly file is created.
// Ownership/Lifetime: Uses local sets only.
// Links: src/codegen/x86_64/StructureCheck.hpp
//
//===----------------------------------------------------------------------===//

#include "StructureCheck.hpp"

#include "TranslationError.hpp"

#include <string>
#include <unordered_set>

namespace kestrel::codegen::x64
{

namespace
{

[[noreturn]] void reject(const std::string &function,
                         std::string message,
                         std::string construct,
                         support::SourceLoc loc = {})
{
    TranslationError err{};
    err.kind = ErrorKind::UnsupportedConstruct;
    err.message = std::move(message);
    err.function = function;
    err.construct = std::move(construct);
    err.loc = loc;
    throw TranslationException(std::move(err));
}

void checkFunction(const ir::IrFunction &fn)
{
    if (fn.blocks.empty())
    {
        reject(fn.name, "function has no basic blocks", fn.name);
    }

    std::unordered_set<uint32_t> blockIds;
    for (const auto &block : fn.blocks)
    {
        if (!blockIds.insert(block.id).second)
        {
            reject(fn.name,
                   "block id " + std::to_string(block.id) + " is used more than once",
                   "bb" + std::to_string(block.id));
        }
    }

    std::unordered_set<uint32_t> results;
    for (const auto &block : fn.blocks)
    {
        for (const auto &instr : block.instrs)
        {
            if (instr.result && !results.insert(*instr.result).second)
            {
                reject(fn.name,
                       "value %" + std::to_string(*instr.result) + " is defined more than once",
                       ir::describe(instr),
                       instr.loc);
            }
        }
        for (const uint32_t target : block.terminator.successors())
        {
            if (blockIds.count(target) == 0)
            {
                reject(fn.name,
                       "branch target bb" + std::to_string(target) +
                           " does not exist in this function",
                       ir::describe(block.terminator),
                       block.terminator.loc);
            }
        }
    }
}

} // namespace

void checkModuleStructure(const ir::IrModule &module)
{
    std::unordered_set<std::string> names;
    for (const auto &global : module.globals)
    {
        if (!names.insert(global.name).second)
        {
            reject({}, "global '" + global.name + "' is defined more than once", global.name);
        }
    }
    for (const auto &fn : module.functions)
    {
        if (!names.insert(fn.name).second)
        {
            reject(fn.name, "symbol '" + fn.name + "' is defined more than once", fn.name);
        }
    }
    for (const auto &fn : module.functions)
    {
        checkFunction(fn);
    }
}

} // namespace kestrel::codegen::x64
