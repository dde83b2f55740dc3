//===-- Analysis/ReftypeClosure.cpp -----------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "ReftypeClosure.h"
#include "../Graphs/MoveGraph.h"
#include "Reftype/ReftypeAnalysis.h"
#include "Reftype/ReftypeError.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "reftypes"

namespace Reftype
{
namespace Closure
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Convert the registers the client declared reference-typed into the set
//    of ranges they occupy.
//
// Arguments:
//
//    analysis                 - Range storage
//    reftypedVirtualRegisters - Registers declared reference-typed
//    reftypeClass             - Register class that carries references
//    reftypedRanges           - [out] Seed ranges
//
// Returns:
//
//    A ReftypeError if any register is real or of another class than
//    reftypeClass. All registers are checked before any range is added.
//
//-----------------------------------------------------------------------------

llvm::Error
CollectReftypedRanges
(
   const ReftypeAnalysis *   analysis,
   llvm::ArrayRef<Register>  reftypedVirtualRegisters,
   RegisterClass             reftypeClass,
   RangeIdSet *              reftypedRanges
)
{
   for (Register reg : reftypedVirtualRegisters)
   {
      if (!reg.IsVirtual()) {
         std::string text;
         llvm::raw_string_ostream os(text);
         os << reg << " declared reference-typed";
         return llvm::make_error<ReftypeError>(ReftypeErrorCode::SeedNotVirtual, os.str());
      }

      if (reg.GetClass() != reftypeClass) {
         std::string text;
         llvm::raw_string_ostream os(text);
         os << reg << " declared reference-typed but reference class is "
            << GetRegisterClassName(reftypeClass);
         return llvm::make_error<ReftypeError>(ReftypeErrorCode::SeedClassMismatch, os.str());
      }
   }

   for (Register reg : reftypedVirtualRegisters)
   {
      analysis->InsertReffyRanges(reg, reftypedRanges);
   }

   return llvm::Error::success();
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Compute every range reachable from the seed ranges along move edges.
//
// Arguments:
//
//    moveGraph      - Move graph of the function
//    reftypedRanges - Seed ranges
//
// Returns:
//
//    The seed ranges plus every range reachable from them.
//
// Remarks:
//
//    Depth first search with an explicit stack. A range is added to the
//    visited set when it is pushed, so each range is pushed at most once and
//    the work is linear in ranges plus edges.
//
//-----------------------------------------------------------------------------

RangeIdSet
ComputeReffyClosure
(
   const Graphs::MoveGraph & moveGraph,
   const RangeIdSet &        reftypedRanges
)
{
   RangeIdSet visited(reftypedRanges);

   // Almost all chains of copies are shorter than this.
   llvm::SmallVector<RangeId, 64> stack(reftypedRanges.begin(), reftypedRanges.end());

   while (!stack.empty())
   {
      RangeId sourceRange = stack.pop_back_val();

      const Graphs::MoveGraph::SuccessorSet * successors = moveGraph.GetSuccessors(sourceRange);

      if (successors == nullptr) {
         continue;
      }

      for (RangeId destinationRange : *successors)
      {
         if (visited.insert(destinationRange).second) {
            stack.push_back(destinationRange);
         }
      }
   }

   return visited;
}

void
MarkReffyRanges
(
   ReftypeAnalysis *  analysis,
   const RangeIdSet & reffyRanges
)
{
   for (RangeId rangeId : reffyRanges)
   {
      LLVM_DEBUG(llvm::dbgs() << " -> range " << rangeId << " is reffy\n");
      analysis->MarkReffy(rangeId);
   }
}

} // namespace Closure
} // namespace Reftype
