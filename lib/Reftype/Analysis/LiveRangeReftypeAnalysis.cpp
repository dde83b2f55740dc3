//===-- Analysis/LiveRangeReftypeAnalysis.cpp -------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "LiveRangeReftypeAnalysis.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <cassert>
#include <string>

#define DEBUG_TYPE "reftypes"

namespace Reftype
{

namespace
{

// Liveness and the move list disagree. Nothing sensible can be produced
// from here on; a missed reference would corrupt the collector's view.

[[noreturn]] void
ReportMissingRange
(
   InstructionPoint point,
   Register         reg
)
{
   std::string text;
   llvm::raw_string_ostream os(text);

   os << "reftypes analysis: can't find range for " << reg << " at " << point;

   llvm::report_fatal_error(llvm::Twine(os.str()));
}

} // end anonymous namespace

LiveRangeReftypeAnalysis::LiveRangeReftypeAnalysis
(
   RealRangeEnvironment *           realRanges,
   VirtualRangeEnvironment *        virtualRanges,
   const RangeFragmentEnvironment & fragmentEnvironment,
   const RegisterToRangesMaps &     registerToRangesMaps
) : RealRanges(realRanges), VirtualRanges(virtualRanges),
    FragmentEnvironment(fragmentEnvironment), RangesMaps(registerToRangesMaps)
{
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Find the range of a register containing the given point.
//
// Arguments:
//
//    point - Use or def point of the instruction referencing the register
//    reg   - Real or virtual register
//
// Returns:
//
//    The id of the covering range. Does not return if there is none.
//
//-----------------------------------------------------------------------------

RangeId
LiveRangeReftypeAnalysis::FindRangeIdForRegister
(
   InstructionPoint point,
   Register         reg
) const
{
   RegisterIndex index = reg.GetIndex();

   if (reg.IsReal()) {
      if (index < this->RangesMaps.RealRegisterToRealRanges.size()) {
         for (RealRangeIndex rangeIndex : this->RangesMaps.RealRegisterToRealRanges[index])
         {
            const RealRange & range = (*this->RealRanges)[rangeIndex];

            if (range.SortedFragments.ContainsPoint(this->FragmentEnvironment, point)) {
               return RangeId::NewReal(rangeIndex);
            }
         }
      }
   } else {
      if (index < this->RangesMaps.VirtualRegisterToVirtualRanges.size()) {
         for (VirtualRangeIndex rangeIndex : this->RangesMaps.VirtualRegisterToVirtualRanges[index])
         {
            const VirtualRange & range = (*this->VirtualRanges)[rangeIndex];

            if (range.SortedFragments.ContainsPoint(point)) {
               return RangeId::NewVirtual(rangeIndex);
            }
         }
      }
   }

   ReportMissingRange(point, reg);
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Add every range of a reference-typed virtual register to the set.
//
// Remarks:
//
//    A register liveness never saw has no entry in the map and no ranges.
//
//-----------------------------------------------------------------------------

void
LiveRangeReftypeAnalysis::InsertReffyRanges
(
   Register     virtualRegister,
   RangeIdSet * set
) const
{
   assert(virtualRegister.IsVirtual());

   RegisterIndex index = virtualRegister.GetIndex();

   if (index >= this->RangesMaps.VirtualRegisterToVirtualRanges.size()) {
      LLVM_DEBUG(llvm::dbgs() << "reffy vreg " << virtualRegister << " has no ranges\n");
      return;
   }

   for (VirtualRangeIndex rangeIndex : this->RangesMaps.VirtualRegisterToVirtualRanges[index])
   {
      LLVM_DEBUG(llvm::dbgs() << "range VR" << rangeIndex << " is reffy due to reffy vreg "
                              << virtualRegister << '\n');
      set->insert(RangeId::NewVirtual(rangeIndex));
   }
}

void
LiveRangeReftypeAnalysis::MarkReffy
(
   RangeId rangeId
)
{
   if (rangeId.IsReal()) {
      (*this->RealRanges)[rangeId.ToReal()].IsRef = true;
   } else {
      (*this->VirtualRanges)[rangeId.ToVirtual()].IsRef = true;
   }
}

} // namespace Reftype
