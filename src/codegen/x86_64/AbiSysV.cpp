//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/x86_64/AbiSysV.cpp
// Purpose: System V AMD64 adapter: independent integer/float parameter
//          counters, stack arguments packed from 0(%rsp), and a red zone for
//          leaf functions.
// Key invariants: A frame uses the red zone only when it makes no calls,
//                 pushes no callee-saved register and its locals fit in the
//                 red zone.
// Ownership/Lifetime: Stateless apart from the borrowed TargetInfo.
// Links: src/codegen/x86_64/AbiAdapter.hpp
//
//===----------------------------------------------------------------------===//

#include "AbiAdapter.hpp"

namespace kestrel::codegen::x64
{

namespace
{

class SysVAdapter final : public AbiAdapter
{
  public:
    SysVAdapter() noexcept : AbiAdapter(sysvTarget()) {}

    std::vector<MInstr> generatePrologue(const FrameInfo &frame) const override
    {
        return buildStandardPrologue(frame);
    }

    std::vector<MInstr> generateEpilogue(const FrameInfo &frame) const override
    {
        return buildStandardEpilogue(frame);
    }

    FrameInfo layoutFrame(const FrameState &state,
                          std::vector<PhysReg> calleeSaved,
                          uint64_t maxFrameSize) const override
    {
        FrameInfo frame{};
        frame.localsSize = state.localsSize();
        frame.outgoingArgArea = state.maxOutgoing();
        frame.usedCalleeSaved = std::move(calleeSaved);
        frame.usesRedZone = target().hasRedZone && !state.hasCalls() &&
                            frame.usedCalleeSaved.empty() &&
                            state.localsSize() <= static_cast<int64_t>(target().redZoneSize);
        finishFrameLayout(frame, target(), maxFrameSize);
        return frame;
    }

  protected:
    std::vector<ParamLocation> assignLocations(const std::vector<ir::IrType> &types) const override
    {
        std::vector<ParamLocation> out;
        out.reserve(types.size());
        std::size_t nextInt = 0;
        std::size_t nextFloat = 0;
        int32_t nextStack = 0;
        for (const ir::IrType &type : types)
        {
            ParamLocation loc{};
            loc.cls = type.isFloat() ? RegClass::XMM : RegClass::GPR;
            const std::optional<PhysReg> reg = loc.cls == RegClass::XMM
                                                   ? floatParamRegister(nextFloat++)
                                                   : intParamRegister(nextInt++);
            if (reg)
            {
                loc.kind = ParamLocation::Kind::Register;
                loc.reg = *reg;
            }
            else
            {
                loc.kind = ParamLocation::Kind::Stack;
                loc.stackOffset = nextStack;
                nextStack += kSlotSizeBytes;
            }
            out.push_back(loc);
        }
        return out;
    }
};

} // namespace

std::unique_ptr<AbiAdapter> makeSysVAdapter()
{
    return std::make_unique<SysVAdapter>();
}

} // namespace kestrel::codegen::x64
