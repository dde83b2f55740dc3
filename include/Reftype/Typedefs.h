//===-- Reftype/Typedefs.h - Index typedefs ---------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_TYPEDEFS_H
#define REFTYPE_TYPEDEFS_H

#include <cstdint>

namespace Reftype
{

typedef uint32_t         UInt32;

// Index Primitives

typedef UInt32           InstructionIndex;    // Instruction position within the function
typedef UInt32           RegisterIndex;       // Real or virtual register number
typedef UInt32           RangeFragmentIndex;  // Index into the fragment environment
typedef UInt32           RealRangeIndex;      // Index into the real range environment
typedef UInt32           VirtualRangeIndex;   // Index into the virtual range environment

//-----------------------------------------------------------------------------
//
// Description:
//
//    Some constants for the index primitives.
//
//-----------------------------------------------------------------------------

namespace TypeConstants
{

//--------------------------------------------------------------------------
//
// Description:
//
//    Max unsigned 32-bit integer.
//
//--------------------------------------------------------------------------
const uint32_t MaxUInt32 = static_cast<Reftype::UInt32>(0xFFFFFFFF);

} // namespace TypeConstants

} // namespace Reftype

#endif // end REFTYPE_TYPEDEFS_H
