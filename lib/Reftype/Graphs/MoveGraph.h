//===-- Graphs/MoveGraph.h --------------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Directed graph over live ranges with an edge src -> dst for every
// reference class move `dst := src` in the function.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_GRAPHS_MOVEGRAPH_H
#define REFTYPE_GRAPHS_MOVEGRAPH_H

#include "Reftype/MoveInfo.h"
#include "Reftype/RangeId.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SetVector.h"
#include "llvm/Support/Error.h"

namespace Reftype
{
class ReftypeAnalysis;

namespace Graphs
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Successor sets keyed by source range.
//
// Remarks:
//
//    Most values are copied to only a handful of destinations, so the
//    successor sets keep four entries inline before touching the heap.
//
//-----------------------------------------------------------------------------

class MoveGraph
{

public:

   typedef llvm::SmallSetVector<Reftype::RangeId, 4>                  SuccessorSet;
   typedef llvm::DenseMap<Reftype::RangeId, Graphs::MoveGraph::SuccessorSet> SuccessorMap;

   MoveGraph() : EdgeCount(0), MoveCount(0), ReftypeMoveCount(0) {}

public:

   bool
   AddEdge
   (
      Reftype::RangeId sourceRange,
      Reftype::RangeId destinationRange
   );

   llvm::Error
   Build
   (
      const Reftype::ReftypeAnalysis * analysis,
      const Reftype::MoveInfo &        moveInfo,
      Reftype::RegisterClass           reftypeClass
   );

   const Graphs::MoveGraph::SuccessorSet *
   GetSuccessors
   (
      Reftype::RangeId sourceRange
   ) const;

   unsigned NumEdges() const { return this->EdgeCount; }

   unsigned NumNodes() const { return this->Successors.size(); }

   unsigned NumMoves() const { return this->MoveCount; }

   unsigned NumReftypeMoves() const { return this->ReftypeMoveCount; }

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

   void dump() const;

private:

   Graphs::MoveGraph::SuccessorMap Successors;
   unsigned                        EdgeCount;
   unsigned                        MoveCount;
   unsigned                        ReftypeMoveCount;
};

#if 0
comment MoveGraph::NumNodes
{
   // Number of ranges with at least one outgoing edge.
}

comment MoveGraph::MoveCount
{
   // Moves examined by Build, of any class.
}
#endif

} // namespace Graphs
} // namespace Reftype

#endif // end REFTYPE_GRAPHS_MOVEGRAPH_H
