//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/StructureCheck.hpp
// Purpose: Declare the whole-module structural validation run before any
//          assembly is produced.
// Key invariants: Either the module is accepted unchanged or the first
//                 violation, in function then block order, is raised.
// Ownership/Lifetime: Stateless; borrows the module.
// Links: src/codegen/x86_64/Translator.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"

namespace kestrel::codegen::x64
{

/// \brief Reject modules the translators cannot walk safely.
/// \details Checks for duplicate or clashing symbol names, functions without
///          blocks, duplicate block ids, duplicate result ids and terminator
///          targets that name no block of the same function.
/// \throws TranslationException (UnsupportedConstruct) on the first violation.
void checkModuleStructure(const ir::IrModule &module);

} // namespace kestrel::codegen::x64
