//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/AbiAdapter.cpp
// Purpose: Implement the convention-independent parts of AbiAdapter: register
//          queries, parameter type validation and result checking.
// Key invariants: Every location returned by mapParameters has been checked
//                 against the TargetInfo the adapter was built from.
// Ownership/Lifetime: Adapters borrow the singleton TargetInfo.
// Links: src/codegen/x86_64/AbiAdapter.hpp
//
//===----------------------------------------------------------------------===//

#include "AbiAdapter.hpp"

#include "TranslationError.hpp"

#include <algorithm>

namespace kestrel::codegen::x64
{

std::unique_ptr<AbiAdapter> makeSysVAdapter();
std::unique_ptr<AbiAdapter> makeWin64Adapter();

AbiAdapter::AbiAdapter(const TargetInfo &target) noexcept : target_(&target) {}

const TargetInfo &AbiAdapter::target() const noexcept
{
    return *target_;
}

std::optional<PhysReg> AbiAdapter::intParamRegister(std::size_t index) const noexcept
{
    if (index >= target_->maxIntRegArgs)
    {
        return std::nullopt;
    }
    return target_->intArgOrder[index];
}

std::optional<PhysReg> AbiAdapter::floatParamRegister(std::size_t index) const noexcept
{
    if (index >= target_->maxFloatRegArgs)
    {
        return std::nullopt;
    }
    return target_->floatArgOrder[index];
}

bool AbiAdapter::sharedParamIndexSpace() const noexcept
{
    return target_->sharedArgIndexSpace;
}

std::vector<ParamLocation> AbiAdapter::mapParameters(const std::vector<ir::IrType> &types) const
{
    for (std::size_t i = 0; i < types.size(); ++i)
    {
        const ir::IrType &type = types[i];
        if (type.isVoid() || type.isAggregate())
        {
            raiseError(ErrorKind::UnsupportedType,
                       "parameter " + std::to_string(i) + " of type " + type.toString() +
                           " has no passing rule under " + abiKindName(target_->abi),
                       type.toString());
        }
    }

    std::vector<ParamLocation> locations = assignLocations(types);
    if (locations.size() != types.size())
    {
        raiseError(ErrorKind::AbiViolation,
                   "adapter placed " + std::to_string(locations.size()) + " of " +
                       std::to_string(types.size()) + " parameters");
    }
    for (std::size_t i = 0; i < locations.size(); ++i)
    {
        const ParamLocation &loc = locations[i];
        const RegClass expected = types[i].isFloat() ? RegClass::XMM : RegClass::GPR;
        if (loc.cls != expected)
        {
            raiseError(ErrorKind::AbiViolation,
                       "parameter " + std::to_string(i) + " placed in the wrong register class");
        }
        if (loc.kind == ParamLocation::Kind::Stack)
        {
            if (loc.stackOffset < 0 || loc.stackOffset % kSlotSizeBytes != 0)
            {
                raiseError(ErrorKind::AbiViolation,
                           "parameter " + std::to_string(i) + " has misaligned stack offset " +
                               std::to_string(loc.stackOffset));
            }
            continue;
        }
        const auto &allowed =
            loc.cls == RegClass::GPR ? target_->intArgOrder : target_->floatArgOrder;
        if (std::find(allowed.begin(), allowed.end(), loc.reg) == allowed.end())
        {
            raiseError(ErrorKind::AbiViolation,
                       std::string("parameter ") + std::to_string(i) + " placed in " +
                           regName(loc.reg) + ", which is not a parameter register");
        }
    }
    return locations;
}

int64_t AbiAdapter::outgoingArgBytes(const std::vector<ParamLocation> &locations) const
{
    int64_t bytes = target_->shadowSpace;
    for (const ParamLocation &loc : locations)
    {
        if (loc.kind == ParamLocation::Kind::Stack)
        {
            bytes = std::max<int64_t>(bytes, loc.stackOffset + kSlotSizeBytes);
        }
    }
    return bytes;
}

std::unique_ptr<AbiAdapter> makeAbiAdapter(AbiKind abi)
{
    switch (abi)
    {
        case AbiKind::SysV:
            return makeSysVAdapter();
        case AbiKind::Win64:
            return makeWin64Adapter();
    }
    raiseError(ErrorKind::AbiViolation, "unknown calling convention");
}

} // namespace kestrel::codegen::x64
