//===-- Analysis/ReftypeAnalysis.cpp - Reftype taint analysis ---*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Starting with the reftyped virtual registers, find all the virtual and real
// ranges to which refness can flow via instructions the client considers to
// be moves. This is done in three stages:
//
// (1) Build the move graph: for each reference class move, an edge from the
//     range of its source to the range of its destination.
//
// (2) Convert the reftyped virtual registers into the set of ranges they
//     occupy.
//
// (3) Compute the closure of (2) over the graph of (1), and mark every range
//     in it.
//
//===----------------------------------------------------------------------===//

#include "Reftype/ReftypeAnalysis.h"
#include "LiveRangeReftypeAnalysis.h"
#include "ReftypeClosure.h"
#include "../Graphs/MoveGraph.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "reftypes"

static llvm::cl::opt<bool> DumpMoveGraph(
   "reftype-dump-move-graph", llvm::cl::Hidden, llvm::cl::init(false),
   llvm::cl::desc("Print the reference class move graph after it is built"));

static llvm::cl::opt<bool> PrintSummary(
   "reftype-print-summary", llvm::cl::Hidden, llvm::cl::init(false),
   llvm::cl::desc("Print the reftype analysis counts after each run"));

namespace Reftype
{

void
ReftypeAnalysisSummary::print
(
   llvm::raw_ostream & os
) const
{
   os << "reftypes: " << this->MoveCount << " moves, "
      << this->ReftypeMoveCount << " reference class moves, "
      << this->EdgeCount << " edges, "
      << this->SeedRangeCount << " seed ranges, marked "
      << this->MarkedRealRangeCount << " real and "
      << this->MarkedVirtualRangeCount << " virtual ranges\n";
}

llvm::Expected<ReftypeAnalysisSummary>
CoreReftypesAnalysis
(
   ReftypeAnalysis *        analysis,
   const MoveInfo &         moveInfo,
   RegisterClass            reftypeClass,
   llvm::ArrayRef<Register> reftypedVirtualRegisters
)
{
   ReftypeAnalysisSummary summary;

   // ====== (1) ======

   Graphs::MoveGraph moveGraph;

   if (llvm::Error error = moveGraph.Build(analysis, moveInfo, reftypeClass)) {
      return std::move(error);
   }

   if (DumpMoveGraph) {
      moveGraph.print(llvm::dbgs());
   }

   summary.MoveCount = moveGraph.NumMoves();
   summary.ReftypeMoveCount = moveGraph.NumReftypeMoves();
   summary.EdgeCount = moveGraph.NumEdges();

   // ====== (2) ======

   RangeIdSet reftypedRanges;

   if (llvm::Error error = Closure::CollectReftypedRanges(analysis, reftypedVirtualRegisters,
                                                          reftypeClass, &reftypedRanges)) {
      return std::move(error);
   }

   summary.SeedRangeCount = reftypedRanges.size();

   // ====== (3) ======

   RangeIdSet reffyRanges = Closure::ComputeReffyClosure(moveGraph, reftypedRanges);

   Closure::MarkReffyRanges(analysis, reffyRanges);

   for (RangeId rangeId : reffyRanges)
   {
      if (rangeId.IsReal()) {
         summary.MarkedRealRangeCount++;
      } else {
         summary.MarkedVirtualRangeCount++;
      }
   }

   if (PrintSummary) {
      summary.print(llvm::dbgs());
   }

   return summary;
}

llvm::Expected<ReftypeAnalysisSummary>
DoReftypesAnalysis
(
   RealRangeEnvironment *           realRanges,
   VirtualRangeEnvironment *        virtualRanges,
   const RangeFragmentEnvironment & fragmentEnvironment,
   const RegisterToRangesMaps &     registerToRangesMaps,
   const MoveInfo &                 moveInfo,
   const StackmapRequestInfo &      stackmapRequest
)
{
   LLVM_DEBUG(llvm::dbgs() << "********** REFTYPES ANALYSIS **********\n"
                           << "********** " << realRanges->size() << " real ranges, "
                           << virtualRanges->size() << " virtual ranges, "
                           << moveInfo.size() << " moves\n");

   LiveRangeReftypeAnalysis analysis(realRanges, virtualRanges, fragmentEnvironment,
                                     registerToRangesMaps);

   return CoreReftypesAnalysis(&analysis, moveInfo, stackmapRequest.ReftypeClass,
                               stackmapRequest.ReftypedVirtualRegisters);
}

} // namespace Reftype
