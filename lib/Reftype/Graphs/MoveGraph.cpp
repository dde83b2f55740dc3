//===-- Graphs/MoveGraph.cpp ------------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "MoveGraph.h"
#include "Reftype/ReftypeAnalysis.h"
#include "Reftype/ReftypeError.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "reftypes"

namespace Reftype
{
namespace Graphs
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Add the edge sourceRange -> destinationRange.
//
// Returns:
//
//    True if the edge was not already present.
//
//-----------------------------------------------------------------------------

bool
MoveGraph::AddEdge
(
   RangeId sourceRange,
   RangeId destinationRange
)
{
   SuccessorSet & successors = this->Successors[sourceRange];

   if (!successors.insert(destinationRange)) {
      return false;
   }

   this->EdgeCount++;

   return true;
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Populate the graph from the moves of the function.
//
// Arguments:
//
//    analysis     - Range storage used to resolve registers to ranges
//    moveInfo     - Moves found in the function
//    reftypeClass - Register class that carries references
//
// Returns:
//
//    A ReftypeError if a move copies between registers of different
//    classes; the graph is then left partially built and must not be used.
//
// Remarks:
//
//    Moves of other classes are skipped before their registers are resolved;
//    they cannot carry references even when their register numbers coincide
//    with reference class registers. The source range is the one live at the
//    use point of the move and the destination range the one live at its def
//    point.
//
//-----------------------------------------------------------------------------

llvm::Error
MoveGraph::Build
(
   const ReftypeAnalysis * analysis,
   const MoveInfo &        moveInfo,
   RegisterClass           reftypeClass
)
{
   for (const MoveInfoElement & move : moveInfo)
   {
      this->MoveCount++;

      if (move.Destination.GetClass() != move.Source.GetClass()) {
         std::string text;
         llvm::raw_string_ostream os(text);
         os << "move " << move.Destination << " := " << move.Source
            << " at instruction " << move.Instruction;
         return llvm::make_error<ReftypeError>(ReftypeErrorCode::MoveClassMismatch, os.str());
      }

      if (move.Destination.GetClass() != reftypeClass) {
         continue;
      }

      this->ReftypeMoveCount++;

      RangeId sourceRange =
         analysis->FindRangeIdForRegister(InstructionPoint::NewUse(move.Instruction), move.Source);
      RangeId destinationRange =
         analysis->FindRangeIdForRegister(InstructionPoint::NewDef(move.Instruction), move.Destination);

      LLVM_DEBUG(llvm::dbgs() << "move from " << move.Source << " (range " << sourceRange
                              << ") to " << move.Destination << " (range " << destinationRange
                              << ") at inst " << move.Instruction << '\n');

      this->AddEdge(sourceRange, destinationRange);
   }

   return llvm::Error::success();
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Get the destinations reached from sourceRange by a single move, or
//    nullptr if there are none.
//
//-----------------------------------------------------------------------------

const MoveGraph::SuccessorSet *
MoveGraph::GetSuccessors
(
   RangeId sourceRange
) const
{
   SuccessorMap::const_iterator i = this->Successors.find(sourceRange);

   if (i == this->Successors.end()) {
      return nullptr;
   }

   return &i->second;
}

void
MoveGraph::print
(
   llvm::raw_ostream & os
) const
{
   os << "MoveGraph: " << this->NumNodes() << " sources, " << this->EdgeCount << " edges\n";

   for (const auto & entry : this->Successors)
   {
      os << "  " << entry.first << " ->";
      for (RangeId destinationRange : entry.second)
      {
         os << ' ' << destinationRange;
      }
      os << '\n';
   }
}

void
MoveGraph::dump() const
{
   this->print(llvm::dbgs());
}

} // namespace Graphs
} // namespace Reftype
