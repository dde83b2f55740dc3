//===-- Analysis/LiveRangeReftypeAnalysis.h ---------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_ANALYSIS_LIVERANGEREFTYPEANALYSIS_H
#define REFTYPE_ANALYSIS_LIVERANGEREFTYPEANALYSIS_H

#include "Reftype/ReftypeAnalysis.h"

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Reftype analysis over the allocator's real and virtual range
//    environments, as produced by liveness.
//
// Remarks:
//
//    The range environments are borrowed for the duration of the analysis
//    and must not be touched by anyone else meanwhile.
//
//-----------------------------------------------------------------------------

class LiveRangeReftypeAnalysis : public Reftype::ReftypeAnalysis
{

public:

   LiveRangeReftypeAnalysis
   (
      Reftype::RealRangeEnvironment *           realRanges,
      Reftype::VirtualRangeEnvironment *        virtualRanges,
      const Reftype::RangeFragmentEnvironment & fragmentEnvironment,
      const Reftype::RegisterToRangesMaps &     registerToRangesMaps
   );

public:

   Reftype::RangeId
   FindRangeIdForRegister
   (
      Reftype::InstructionPoint point,
      Reftype::Register         reg
   ) const override;

   void
   InsertReffyRanges
   (
      Reftype::Register     virtualRegister,
      Reftype::RangeIdSet * set
   ) const override;

   void
   MarkReffy
   (
      Reftype::RangeId rangeId
   ) override;

private:

   Reftype::RealRangeEnvironment *           RealRanges;
   Reftype::VirtualRangeEnvironment *        VirtualRanges;
   const Reftype::RangeFragmentEnvironment & FragmentEnvironment;
   const Reftype::RegisterToRangesMaps &     RangesMaps;
};

} // namespace Reftype

#endif // end REFTYPE_ANALYSIS_LIVERANGEREFTYPEANALYSIS_H
