//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/LoweringRuleTable.cpp
// Purpose: Resolve table entries by enumerator.
// Key invariants: Entries are stored in enumerator order; the lookup checks
//                 the stored tag so a reordered table is caught as "no rule".
// Ownership/Lifetime: Stateless.
// Links: src/codegen/x86_64/LoweringRuleTable.hpp
//
//===----------------------------------------------------------------------===//

#include "LoweringRuleTable.hpp"

namespace kestrel::codegen::x64::lowering
{

const BinaryRule *lookupBinaryRule(ir::BinaryOp op) noexcept
{
    const auto index = static_cast<std::size_t>(op);
    if (index >= kBinaryRuleTable.size() || kBinaryRuleTable[index].op != op)
    {
        return nullptr;
    }
    return &kBinaryRuleTable[index];
}

const InstrRule *lookupInstrRule(ir::InstructionKind kind) noexcept
{
    const auto index = static_cast<std::size_t>(kind);
    if (index >= kInstrRuleTable.size() || kInstrRuleTable[index].kind != kind)
    {
        return nullptr;
    }
    return &kInstrRuleTable[index];
}

} // namespace kestrel::codegen::x64::lowering
