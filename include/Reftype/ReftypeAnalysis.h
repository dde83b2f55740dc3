//===-- Reftype/ReftypeAnalysis.h - Reftype taint analysis ------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Starting from the virtual registers the client declares reference-typed,
// find every live range, real or virtual, to which a reference can flow
// through register to register moves, and set its IsRef flag.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_REFTYPEANALYSIS_H
#define REFTYPE_REFTYPEANALYSIS_H

#include "Reftype/LiveRange.h"
#include "Reftype/MoveInfo.h"
#include "Reftype/RangeId.h"
#include "Reftype/ReftypeError.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Access to live range storage needed by the reftype analysis.
//
// Remarks:
//
//    The analysis proper only ever talks to ranges through this class, so it
//    runs unchanged over the allocator's range environments or over a
//    lightweight table in tests.
//
//-----------------------------------------------------------------------------

class ReftypeAnalysis
{

public:

   virtual ~ReftypeAnalysis() {}

   // Find the range of `reg` that contains `point`. There must be one; if
   // not, liveness and the move list disagree and compilation is aborted.

   virtual Reftype::RangeId
   FindRangeIdForRegister
   (
      Reftype::InstructionPoint point,
      Reftype::Register         reg
   ) const = 0;

   // Add all the ranges of the virtual register `virtualRegister` to `set`.

   virtual void
   InsertReffyRanges
   (
      Reftype::Register     virtualRegister,
      Reftype::RangeIdSet * set
   ) const = 0;

   // Mark the range as holding references. Marking twice is harmless.

   virtual void
   MarkReffy
   (
      Reftype::RangeId rangeId
   ) = 0;
};

//-----------------------------------------------------------------------------
//
// Description:
//
//    Counts gathered by one run of the analysis.
//
//-----------------------------------------------------------------------------

class ReftypeAnalysisSummary
{

public:

   ReftypeAnalysisSummary()
      : MoveCount(0), ReftypeMoveCount(0), EdgeCount(0), SeedRangeCount(0),
        MarkedRealRangeCount(0), MarkedVirtualRangeCount(0) {}

   unsigned MarkedRangeCount() const
   {
      return (this->MarkedRealRangeCount + this->MarkedVirtualRangeCount);
   }

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

public:

   unsigned MoveCount;
   unsigned ReftypeMoveCount;
   unsigned EdgeCount;
   unsigned SeedRangeCount;
   unsigned MarkedRealRangeCount;
   unsigned MarkedVirtualRangeCount;
};

//-----------------------------------------------------------------------------
//
// Description:
//
//    Run the reftype analysis against any range storage.
//
// Arguments:
//
//    analysis                 - Range storage to resolve and mark ranges in
//    moveInfo                 - Moves found in the function
//    reftypeClass             - Register class that carries references
//    reftypedVirtualRegisters - Virtual registers known to hold references
//
// Returns:
//
//    The run summary, or a ReftypeError if the moves or the reftyped
//    registers violate the client contract. Nothing is marked on error.
//
//-----------------------------------------------------------------------------

llvm::Expected<Reftype::ReftypeAnalysisSummary>
CoreReftypesAnalysis
(
   Reftype::ReftypeAnalysis *          analysis,
   const Reftype::MoveInfo &           moveInfo,
   Reftype::RegisterClass              reftypeClass,
   llvm::ArrayRef<Reftype::Register>   reftypedVirtualRegisters
);

//-----------------------------------------------------------------------------
//
// Description:
//
//    Run the reftype analysis over the allocator's range environments,
//    setting IsRef on every range a reference can reach.
//
//-----------------------------------------------------------------------------

llvm::Expected<Reftype::ReftypeAnalysisSummary>
DoReftypesAnalysis
(
   Reftype::RealRangeEnvironment *          realRanges,
   Reftype::VirtualRangeEnvironment *       virtualRanges,
   const Reftype::RangeFragmentEnvironment & fragmentEnvironment,
   const Reftype::RegisterToRangesMaps &    registerToRangesMaps,
   const Reftype::MoveInfo &                moveInfo,
   const Reftype::StackmapRequestInfo &     stackmapRequest
);

} // namespace Reftype

#endif // end REFTYPE_REFTYPEANALYSIS_H
