//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/AbiWin64.cpp
// Purpose: Windows x64 adapter: one positional index shared by integer and
//          float parameters, stack arguments above the 32-byte shadow space,
//          and a shadow area reserved in every frame.
// Key invariants: The outgoing area of every Windows frame is at least the
//                 shadow space, so the prologue always reserves it and the
//                 epilogue always releases it.
// Ownership/Lifetime: Stateless apart from the borrowed TargetInfo.
// Links: src/codegen/x86_64/AbiAdapter.hpp
//
//===----------------------------------------------------------------------===//

#include "AbiAdapter.hpp"

#include <algorithm>

namespace kestrel::codegen::x64
{

namespace
{

class Win64Adapter final : public AbiAdapter
{
  public:
    Win64Adapter() noexcept : AbiAdapter(win64Target()) {}

    std::vector<MInstr> generatePrologue(const FrameInfo &frame) const override
    {
        std::vector<MInstr> out = buildStandardPrologue(frame);
        if (!out.empty() && frame.outgoingArgArea > 0)
        {
            out.back().comment = "shadow space and outgoing arguments";
        }
        return out;
    }

    std::vector<MInstr> generateEpilogue(const FrameInfo &frame) const override
    {
        std::vector<MInstr> out = buildStandardEpilogue(frame);
        if (!out.empty() && frame.outgoingArgArea > 0)
        {
            out.front().comment = "shadow space and outgoing arguments";
        }
        return out;
    }

    FrameInfo layoutFrame(const FrameState &state,
                          std::vector<PhysReg> calleeSaved,
                          uint64_t maxFrameSize) const override
    {
        FrameInfo frame{};
        frame.localsSize = state.localsSize();
        frame.outgoingArgArea =
            std::max<int64_t>(state.maxOutgoing(), static_cast<int64_t>(target().shadowSpace));
        frame.usedCalleeSaved = std::move(calleeSaved);
        frame.usesRedZone = false;
        finishFrameLayout(frame, target(), maxFrameSize);
        return frame;
    }

  protected:
    std::vector<ParamLocation> assignLocations(const std::vector<ir::IrType> &types) const override
    {
        std::vector<ParamLocation> out;
        out.reserve(types.size());
        for (std::size_t index = 0; index < types.size(); ++index)
        {
            ParamLocation loc{};
            loc.cls = types[index].isFloat() ? RegClass::XMM : RegClass::GPR;
            const std::optional<PhysReg> reg = loc.cls == RegClass::XMM
                                                   ? floatParamRegister(index)
                                                   : intParamRegister(index);
            if (reg)
            {
                loc.kind = ParamLocation::Kind::Register;
                loc.reg = *reg;
            }
            else
            {
                // Slot i sits at 8*i: the first four slots are the shadow space.
                loc.kind = ParamLocation::Kind::Stack;
                loc.stackOffset = static_cast<int32_t>(index) * kSlotSizeBytes;
            }
            out.push_back(loc);
        }
        return out;
    }
};

} // namespace

std::unique_ptr<AbiAdapter> makeWin64Adapter()
{
    return std::make_unique<Win64Adapter>();
}

} // namespace kestrel::codegen::x64
