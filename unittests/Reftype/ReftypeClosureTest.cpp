//===- ReftypeClosureTest.cpp - Seed, closure and marking tests -----------===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Analysis/ReftypeClosure.h"
#include "Graphs/MoveGraph.h"
#include "ReftypeTestUtil.h"
#include "gtest/gtest.h"
#include <initializer_list>

using namespace Reftype;
using namespace Reftype::unittest;
using Reftype::Graphs::MoveGraph;

namespace {

RangeIdSet seeds(std::initializer_list<RangeId> Ids) {
  RangeIdSet Set;
  for (RangeId Id : Ids)
    Set.insert(Id);
  return Set;
}

class ReftypeClosureTest : public testing::Test {
protected:
  RangeId V(unsigned I) { return RangeId::NewVirtual(I); }
  RangeId R(unsigned I) { return RangeId::NewReal(I); }

  MoveGraph Graph;
};

TEST_F(ReftypeClosureTest, SeedsAreAlwaysIncluded) {
  Graph.AddEdge(V(0), V(1));

  RangeIdSet Reached = Closure::ComputeReffyClosure(Graph, seeds({V(5), R(2)}));

  EXPECT_EQ(2u, Reached.size());
  EXPECT_TRUE(Reached.count(V(5)));
  EXPECT_TRUE(Reached.count(R(2)));
}

TEST_F(ReftypeClosureTest, EmptySeedsGiveEmptyClosure) {
  Graph.AddEdge(V(0), V(1));
  EXPECT_TRUE(Closure::ComputeReffyClosure(Graph, RangeIdSet()).empty());
}

TEST_F(ReftypeClosureTest, FollowsChains) {
  Graph.AddEdge(V(0), V(1));
  Graph.AddEdge(V(1), R(0));
  Graph.AddEdge(R(0), V(2));
  Graph.AddEdge(V(3), V(4));

  RangeIdSet Reached = Closure::ComputeReffyClosure(Graph, seeds({V(0)}));

  EXPECT_EQ(4u, Reached.size());
  EXPECT_TRUE(Reached.count(V(1)));
  EXPECT_TRUE(Reached.count(R(0)));
  EXPECT_TRUE(Reached.count(V(2)));
  EXPECT_FALSE(Reached.count(V(3)));
  EXPECT_FALSE(Reached.count(V(4)));
}

TEST_F(ReftypeClosureTest, EdgesAreDirected) {
  Graph.AddEdge(V(0), V(1));

  RangeIdSet Reached = Closure::ComputeReffyClosure(Graph, seeds({V(1)}));

  EXPECT_EQ(1u, Reached.size());
  EXPECT_FALSE(Reached.count(V(0)));
}

TEST_F(ReftypeClosureTest, FanOut) {
  Graph.AddEdge(V(0), V(1));
  Graph.AddEdge(V(0), V(2));
  Graph.AddEdge(V(0), R(7));

  RangeIdSet Reached = Closure::ComputeReffyClosure(Graph, seeds({V(0)}));

  EXPECT_EQ(4u, Reached.size());
  EXPECT_TRUE(Reached.count(V(1)));
  EXPECT_TRUE(Reached.count(V(2)));
  EXPECT_TRUE(Reached.count(R(7)));
}

TEST_F(ReftypeClosureTest, CyclesDiamondsAndSelfEdges) {
  Graph.AddEdge(V(0), V(0));
  Graph.AddEdge(V(0), V(1));
  Graph.AddEdge(V(0), V(2));
  Graph.AddEdge(V(1), V(3));
  Graph.AddEdge(V(2), V(3));
  Graph.AddEdge(V(3), V(0));

  RangeIdSet Reached = Closure::ComputeReffyClosure(Graph, seeds({V(2)}));

  EXPECT_EQ(4u, Reached.size());
  for (unsigned I = 0; I != 4; ++I)
    EXPECT_TRUE(Reached.count(V(I))) << "VR" << I;
}

TEST_F(ReftypeClosureTest, IndependentOfSeedOrder) {
  for (unsigned I = 0; I != 20; ++I)
    Graph.AddEdge(V(I), V((I * 7 + 3) % 40));

  RangeIdSet Forward = seeds({V(0), V(5), V(11)});
  RangeIdSet Backward = seeds({V(11), V(5), V(0)});

  RangeIdSet A = Closure::ComputeReffyClosure(Graph, Forward);
  RangeIdSet B = Closure::ComputeReffyClosure(Graph, Backward);

  EXPECT_EQ(A.size(), B.size());
  for (RangeId Id : A)
    EXPECT_TRUE(B.count(Id));
}

TEST(ReftypeSeedTest, CollectsAllRangesOfEachRegister) {
  TableReftypeAnalysis Table;
  RangeId V1a = Table.addRange(vreg(1), 0, 3);
  RangeId V1b = Table.addRange(vreg(1), 6, 9);
  RangeId V2 = Table.addRange(vreg(2), 0, 9);
  Table.addRange(vreg(3), 0, 9);

  RangeIdSet Seeds;
  Register Regs[] = {vreg(1), vreg(2), vreg(1)};
  ASSERT_FALSE(bool(Closure::CollectReftypedRanges(&Table, Regs,
                                                   RegisterClass::I64, &Seeds)));

  EXPECT_EQ(3u, Seeds.size());
  EXPECT_TRUE(Seeds.count(V1a));
  EXPECT_TRUE(Seeds.count(V1b));
  EXPECT_TRUE(Seeds.count(V2));
}

TEST(ReftypeSeedTest, RejectsWrongClass) {
  TableReftypeAnalysis Table;
  Table.addRange(vreg(1), 0, 3);
  Table.addRange(vreg(2, RegisterClass::F64), 0, 3);

  RangeIdSet Seeds;
  Register Regs[] = {vreg(1), vreg(2, RegisterClass::F64)};
  EXPECT_EQ(ReftypeErrorCode::SeedClassMismatch,
            takeReftypeErrorCode(Closure::CollectReftypedRanges(
                &Table, Regs, RegisterClass::I64, &Seeds)));
  EXPECT_TRUE(Seeds.empty());
}

TEST(ReftypeSeedTest, RejectsRealRegisters) {
  TableReftypeAnalysis Table;
  Table.addRange(rreg(0), 0, 3);

  RangeIdSet Seeds;
  Register Regs[] = {rreg(0)};
  EXPECT_EQ(ReftypeErrorCode::SeedNotVirtual,
            takeReftypeErrorCode(Closure::CollectReftypedRanges(
                &Table, Regs, RegisterClass::I64, &Seeds)));
  EXPECT_TRUE(Seeds.empty());
}

TEST(ReftypeMarkTest, MarksEveryRangeOnce) {
  TableReftypeAnalysis Table;
  RangeId V1 = Table.addRange(vreg(1), 0, 3);
  RangeId R0 = Table.addRange(rreg(0), 0, 3);
  RangeId V2 = Table.addRange(vreg(2), 0, 3);

  Closure::MarkReffyRanges(&Table, seeds({V1, R0}));

  EXPECT_EQ(1u, Table.markCount(V1));
  EXPECT_EQ(1u, Table.markCount(R0));
  EXPECT_FALSE(Table.isMarked(V2));
}

} // end anonymous namespace
