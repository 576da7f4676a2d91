//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/TranslationContext.cpp
// Purpose: Implement module-wide and per-function translation state.
// Key invariants: Labels derive from the function's assembly name, so they are
//                 unique across the module as long as symbols are.
// Ownership/Lifetime: Owns the ABI adapter, symbol table and temporaries.
// Links: src/codegen/x86_64/TranslationContext.hpp
//
//===----------------------------------------------------------------------===//

#include "TranslationContext.hpp"

#include "TranslationError.hpp"

#include <utility>

namespace kestrel::codegen::x64
{

TranslationContext::TranslationContext(std::unique_ptr<AbiAdapter> abi,
                                       const TranslatorOptions &options)
    : abi_(std::move(abi)), options_(&options), symbols_(options.symbolPrefix),
      temps_(abi_->target())
{
}

const AbiAdapter &TranslationContext::abi() const noexcept
{
    return *abi_;
}

const TranslatorOptions &TranslationContext::options() const noexcept
{
    return *options_;
}

SymbolTable &TranslationContext::symbols() noexcept
{
    return symbols_;
}

TempRegisterAllocator &TranslationContext::temps() noexcept
{
    return temps_;
}

FrameState &TranslationContext::frame() noexcept
{
    return frame_;
}

void TranslationContext::beginFunction(const ir::IrFunction &fn, std::string asmName)
{
    function_ = &fn;
    functionSymbol_ = std::move(asmName);
    labelCounter_ = 0;
    temps_.reset();
    frame_ = FrameState{};
    params_.assign(fn.params.size(), ValueInfo{});
    values_.clear();
    useCounts_.clear();
    pendingBranchCond.reset();
    hasReturn = false;
}

const ir::IrFunction &TranslationContext::function() const
{
    if (!function_)
    {
        raiseError(ErrorKind::UnsupportedConstruct, "no function is being translated");
    }
    return *function_;
}

const std::string &TranslationContext::functionSymbol() const noexcept
{
    return functionSymbol_;
}

std::string TranslationContext::blockLabel(uint32_t id) const
{
    return ".L" + functionSymbol_ + "_bb" + std::to_string(id);
}

std::string TranslationContext::epilogueLabel() const
{
    return ".L" + functionSymbol_ + "_epilogue";
}

std::string TranslationContext::freshLabel(std::string_view hint)
{
    return ".L" + functionSymbol_ + "_" + std::string(hint) + std::to_string(labelCounter_++);
}

uint32_t TranslationContext::labelCount() const noexcept
{
    return labelCounter_;
}

void TranslationContext::setParam(uint32_t index, ValueInfo info)
{
    if (index >= params_.size())
    {
        raiseError(ErrorKind::InvalidOperand,
                   "parameter index " + std::to_string(index) + " is out of range");
    }
    params_[index] = info;
}

void TranslationContext::setValue(uint32_t id, ValueInfo info)
{
    values_[id] = info;
}

const ValueInfo &TranslationContext::param(uint32_t index) const
{
    if (index >= params_.size())
    {
        raiseError(ErrorKind::InvalidOperand,
                   "function '" + function().name + "' has no parameter " +
                       std::to_string(index));
    }
    return params_[index];
}

const ValueInfo &TranslationContext::value(uint32_t id) const
{
    const auto it = values_.find(id);
    if (it == values_.end())
    {
        raiseError(ErrorKind::InvalidOperand,
                   "value %" + std::to_string(id) + " is used before it is defined",
                   "%" + std::to_string(id));
    }
    return it->second;
}

uint32_t TranslationContext::useCount(uint32_t id) const
{
    const auto it = useCounts_.find(id);
    return it == useCounts_.end() ? 0U : it->second;
}

void TranslationContext::setUseCounts(std::unordered_map<uint32_t, uint32_t> counts)
{
    useCounts_ = std::move(counts);
}

} // namespace kestrel::codegen::x64
