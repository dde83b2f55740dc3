//===-- Reftype/LiveRange.h - Range fragments and live ranges ---*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Live ranges handed to the allocator by liveness. Real ranges (registers
// pinned by earlier coloring or by the target) share their fragments through
// a fragment environment; virtual ranges own their fragments inline.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_LIVERANGE_H
#define REFTYPE_LIVERANGE_H

#include "Reftype/Register.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallVector.h"
#include <vector>

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    A closed interval [First, Last] of instruction points over which a
//    register is live.
//
//-----------------------------------------------------------------------------

class RangeFragment
{

public:

   static Reftype::RangeFragment
   New
   (
      Reftype::InstructionPoint first,
      Reftype::InstructionPoint last
   );

public:

   bool
   Contains
   (
      Reftype::InstructionPoint point
   ) const
   {
      return (this->First <= point) && (point <= this->Last);
   }

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

public:

   Reftype::InstructionPoint First;
   Reftype::InstructionPoint Last;
};

typedef std::vector<Reftype::RangeFragment> RangeFragmentEnvironment;

//-----------------------------------------------------------------------------
//
// Description:
//
//    Fragments of a virtual range, held inline, sorted by position and
//    pairwise disjoint.
//
//-----------------------------------------------------------------------------

class SortedRangeFragments
{

public:

   SortedRangeFragments() {}

   explicit
   SortedRangeFragments
   (
      llvm::ArrayRef<Reftype::RangeFragment> fragments
   );

public:

   bool
   ContainsPoint
   (
      Reftype::InstructionPoint point
   ) const;

   bool IsSortedAndNonOverlapping() const;

public:

   llvm::SmallVector<Reftype::RangeFragment, 4> Fragments;
};

//-----------------------------------------------------------------------------
//
// Description:
//
//    Fragments of a real range, held as indices into the shared fragment
//    environment. The denoted fragments are sorted by position and pairwise
//    disjoint.
//
//-----------------------------------------------------------------------------

class SortedRangeFragmentIndices
{

public:

   SortedRangeFragmentIndices() {}

   SortedRangeFragmentIndices
   (
      llvm::ArrayRef<Reftype::RangeFragmentIndex> indices,
      const Reftype::RangeFragmentEnvironment &   fragmentEnvironment
   );

public:

   bool
   ContainsPoint
   (
      const Reftype::RangeFragmentEnvironment & fragmentEnvironment,
      Reftype::InstructionPoint                 point
   ) const;

   bool
   IsSortedAndNonOverlapping
   (
      const Reftype::RangeFragmentEnvironment & fragmentEnvironment
   ) const;

public:

   llvm::SmallVector<Reftype::RangeFragmentIndex, 4> Indices;
};

//-----------------------------------------------------------------------------
//
// Description:
//
//    A live range bound to a real register.
//
//-----------------------------------------------------------------------------

class RealRange
{

public:

   RealRange
   (
      Reftype::Register                   realRegister,
      Reftype::SortedRangeFragmentIndices sortedFragments
   );

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

public:

   Reftype::Register                   RealRegister;
   Reftype::SortedRangeFragmentIndices SortedFragments;
   bool                                IsRef;
};

#if 0
comment RealRange::IsRef
{
   // True if the range may hold a reference-typed value at some point and
   // must be reported to the collector.
}
#endif

//-----------------------------------------------------------------------------
//
// Description:
//
//    A live range of a virtual register, possibly already assigned a real
//    register by the allocator.
//
//-----------------------------------------------------------------------------

class VirtualRange
{

public:

   VirtualRange
   (
      Reftype::Register             virtualRegister,
      Reftype::SortedRangeFragments sortedFragments
   );

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

public:

   Reftype::Register                  VirtualRegister;
   llvm::Optional<Reftype::Register>  AssignedRegister;
   Reftype::SortedRangeFragments      SortedFragments;
   bool                               IsRef;
};

typedef std::vector<Reftype::RealRange>    RealRangeEnvironment;
typedef std::vector<Reftype::VirtualRange> VirtualRangeEnvironment;

//-----------------------------------------------------------------------------
//
// Description:
//
//    For each register, the ranges it participates in across the function.
//    Real and virtual registers are kept in separate maps, indexed by
//    register number.
//
//-----------------------------------------------------------------------------

class RegisterToRangesMaps
{

public:

   static Reftype::RegisterToRangesMaps
   Build
   (
      const Reftype::RealRangeEnvironment &    realRanges,
      const Reftype::VirtualRangeEnvironment & virtualRanges
   );

public:

   std::vector<llvm::SmallVector<Reftype::RealRangeIndex, 4>>    RealRegisterToRealRanges;
   std::vector<llvm::SmallVector<Reftype::VirtualRangeIndex, 4>> VirtualRegisterToVirtualRanges;
};

} // namespace Reftype

#endif // end REFTYPE_LIVERANGE_H
