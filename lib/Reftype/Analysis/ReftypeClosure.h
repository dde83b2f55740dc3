//===-- Analysis/ReftypeClosure.h -------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// The three steps of the reftype analysis that follow the move graph
// construction: collect the seed ranges, close them over the move graph,
// and mark the result.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_ANALYSIS_REFTYPECLOSURE_H
#define REFTYPE_ANALYSIS_REFTYPECLOSURE_H

#include "Reftype/RangeId.h"
#include "Reftype/Register.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

namespace Reftype
{
class ReftypeAnalysis;

namespace Graphs
{
class MoveGraph;
}

namespace Closure
{

llvm::Error
CollectReftypedRanges
(
   const Reftype::ReftypeAnalysis *   analysis,
   llvm::ArrayRef<Reftype::Register>  reftypedVirtualRegisters,
   Reftype::RegisterClass             reftypeClass,
   Reftype::RangeIdSet *              reftypedRanges
);

Reftype::RangeIdSet
ComputeReffyClosure
(
   const Reftype::Graphs::MoveGraph & moveGraph,
   const Reftype::RangeIdSet &        reftypedRanges
);

void
MarkReffyRanges
(
   Reftype::ReftypeAnalysis *  analysis,
   const Reftype::RangeIdSet & reffyRanges
);

} // namespace Closure
} // namespace Reftype

#endif // end REFTYPE_ANALYSIS_REFTYPECLOSURE_H
