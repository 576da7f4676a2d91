//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/AbiAdapter.hpp
// Purpose: Declare the capability interface that isolates calling-convention
//          differences (parameter placement, frame shape, prologue and
//          epilogue) from the translators.
// Key invariants: mapParameters returns exactly one location per parameter,
//                 in declaration order, and never names a register outside
//                 the convention's parameter registers. The translators never
//                 test which convention is active; all such branching lives in
//                 the concrete adapters.
// Ownership/Lifetime: Adapters are created by makeAbiAdapter and owned by the
//                     TranslationContext for one module translation.
// Links: src/codegen/x86_64/AbiSysV.cpp, src/codegen/x86_64/AbiWin64.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "FrameLowering.hpp"
#include "MachineIR.hpp"
#include "TargetX64.hpp"
#include "ir/Module.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace kestrel::codegen::x64
{

/// \brief Where one parameter travels across a call boundary.
struct ParamLocation
{
    enum class Kind
    {
        Register,
        Stack
    };

    Kind kind{Kind::Register};
    PhysReg reg{PhysReg::RAX};   ///< Valid when kind == Register.
    int32_t stackOffset{0};      ///< Offset from %rsp at the call when kind == Stack.
    RegClass cls{RegClass::GPR}; ///< Register class the value belongs to.
};

/// \brief Per-convention adapter consumed by the translators.
class AbiAdapter
{
  public:
    virtual ~AbiAdapter() = default;

    AbiAdapter(const AbiAdapter &) = delete;
    AbiAdapter &operator=(const AbiAdapter &) = delete;

    /// \brief Register facts of the convention.
    [[nodiscard]] const TargetInfo &target() const noexcept;

    /// \brief Integer parameter register for positional @p index, if any.
    [[nodiscard]] std::optional<PhysReg> intParamRegister(std::size_t index) const noexcept;

    /// \brief Floating-point parameter register for positional @p index, if any.
    [[nodiscard]] std::optional<PhysReg> floatParamRegister(std::size_t index) const noexcept;

    /// \brief True when integer and float parameters share one index space.
    [[nodiscard]] bool sharedParamIndexSpace() const noexcept;

    /// \brief Frame setup emitted before the function body.
    [[nodiscard]] virtual std::vector<MInstr> generatePrologue(const FrameInfo &frame) const = 0;

    /// \brief Frame teardown ending in ret.
    [[nodiscard]] virtual std::vector<MInstr> generateEpilogue(const FrameInfo &frame) const = 0;

    /// \brief Place parameters of the given types.
    /// \details Validates the adapter's own answer: a location count differing
    ///          from the parameter count, or a register outside the
    ///          convention's parameter set, raises AbiViolation.
    /// \throws TranslationException (UnsupportedType) for void or aggregate
    ///         parameters, which have no passing rule.
    [[nodiscard]] std::vector<ParamLocation> mapParameters(
        const std::vector<ir::IrType> &types) const;

    /// \brief Bytes of outgoing space a call with @p locations needs at %rsp.
    [[nodiscard]] int64_t outgoingArgBytes(const std::vector<ParamLocation> &locations) const;

    /// \brief Turn the accumulated frame requirements into a final layout.
    /// \throws TranslationException (StackOverflow) above @p maxFrameSize.
    [[nodiscard]] virtual FrameInfo layoutFrame(const FrameState &state,
                                                std::vector<PhysReg> calleeSaved,
                                                uint64_t maxFrameSize) const = 0;

  protected:
    explicit AbiAdapter(const TargetInfo &target) noexcept;

    /// \brief Convention-specific placement; types are already validated.
    [[nodiscard]] virtual std::vector<ParamLocation> assignLocations(
        const std::vector<ir::IrType> &types) const = 0;

  private:
    const TargetInfo *target_;
};

/// \brief Create the adapter implementing @p abi.
[[nodiscard]] std::unique_ptr<AbiAdapter> makeAbiAdapter(AbiKind abi);

} // namespace kestrel::codegen::x64
