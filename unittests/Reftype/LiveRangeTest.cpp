//===- LiveRangeTest.cpp - Range fragment and live range tests ------------===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Reftype/LiveRange.h"
#include "gtest/gtest.h"

using namespace Reftype;

namespace {

RangeFragment frag(InstructionIndex DefInst, InstructionIndex UseInst) {
  return RangeFragment::New(InstructionPoint::NewDef(DefInst),
                            InstructionPoint::NewUse(UseInst));
}

TEST(RangeFragmentTest, ContainsIsInclusive) {
  RangeFragment F = frag(2, 5);

  EXPECT_FALSE(F.Contains(InstructionPoint::NewUse(2)));
  EXPECT_TRUE(F.Contains(InstructionPoint::NewDef(2)));
  EXPECT_TRUE(F.Contains(InstructionPoint::NewReload(4)));
  EXPECT_TRUE(F.Contains(InstructionPoint::NewUse(5)));
  EXPECT_FALSE(F.Contains(InstructionPoint::NewDef(5)));
}

TEST(SortedRangeFragmentsTest, ContainsPointAcrossHoles) {
  RangeFragment Frags[] = {frag(0, 2), frag(5, 7), frag(10, 12)};
  SortedRangeFragments Sorted(Frags);

  EXPECT_TRUE(Sorted.IsSortedAndNonOverlapping());
  EXPECT_TRUE(Sorted.ContainsPoint(InstructionPoint::NewUse(1)));
  EXPECT_TRUE(Sorted.ContainsPoint(InstructionPoint::NewDef(5)));
  EXPECT_TRUE(Sorted.ContainsPoint(InstructionPoint::NewUse(12)));
  EXPECT_FALSE(Sorted.ContainsPoint(InstructionPoint::NewUse(0)));
  EXPECT_FALSE(Sorted.ContainsPoint(InstructionPoint::NewUse(3)));
  EXPECT_FALSE(Sorted.ContainsPoint(InstructionPoint::NewUse(8)));
  EXPECT_FALSE(Sorted.ContainsPoint(InstructionPoint::NewUse(20)));

  EXPECT_FALSE(SortedRangeFragments().ContainsPoint(InstructionPoint::NewUse(1)));
}

TEST(SortedRangeFragmentsTest, DetectsOverlap) {
  SortedRangeFragments Sorted;
  Sorted.Fragments.push_back(frag(0, 4));
  Sorted.Fragments.push_back(frag(3, 6));
  EXPECT_FALSE(Sorted.IsSortedAndNonOverlapping());

  SortedRangeFragments Reversed;
  Reversed.Fragments.push_back(frag(5, 6));
  Reversed.Fragments.push_back(frag(0, 1));
  EXPECT_FALSE(Reversed.IsSortedAndNonOverlapping());
}

TEST(SortedRangeFragmentIndicesTest, ContainsPointThroughEnvironment) {
  // Fragments of two different real ranges interleaved in one environment.
  RangeFragmentEnvironment Env = {frag(0, 1), frag(2, 3), frag(4, 6),
                                  frag(8, 9)};
  RangeFragmentIndex Indices[] = {0, 2, 3};
  SortedRangeFragmentIndices Sorted(Indices, Env);

  EXPECT_TRUE(Sorted.IsSortedAndNonOverlapping(Env));
  EXPECT_TRUE(Sorted.ContainsPoint(Env, InstructionPoint::NewUse(1)));
  EXPECT_TRUE(Sorted.ContainsPoint(Env, InstructionPoint::NewUse(5)));
  EXPECT_TRUE(Sorted.ContainsPoint(Env, InstructionPoint::NewDef(8)));
  EXPECT_FALSE(Sorted.ContainsPoint(Env, InstructionPoint::NewUse(3)));
  EXPECT_FALSE(Sorted.ContainsPoint(Env, InstructionPoint::NewUse(7)));
}

TEST(SortedRangeFragmentIndicesTest, DetectsBadIndices) {
  RangeFragmentEnvironment Env = {frag(0, 1), frag(2, 3)};

  SortedRangeFragmentIndices OutOfRange;
  OutOfRange.Indices.push_back(2);
  EXPECT_FALSE(OutOfRange.IsSortedAndNonOverlapping(Env));

  SortedRangeFragmentIndices Unsorted;
  Unsorted.Indices.push_back(1);
  Unsorted.Indices.push_back(0);
  EXPECT_FALSE(Unsorted.IsSortedAndNonOverlapping(Env));
}

TEST(LiveRangeTest, RangesStartUnmarked) {
  RangeFragmentEnvironment Env = {frag(0, 1)};
  RangeFragmentIndex Indices[] = {0};
  RealRange Real(Register::NewReal(RegisterClass::I64, 0),
                 SortedRangeFragmentIndices(Indices, Env));
  VirtualRange Virtual(Register::NewVirtual(RegisterClass::I64, 0),
                       SortedRangeFragments(frag(0, 1)));

  EXPECT_FALSE(Real.IsRef);
  EXPECT_FALSE(Virtual.IsRef);
  EXPECT_FALSE(Virtual.AssignedRegister.hasValue());
}

TEST(RegisterToRangesMapsTest, Build) {
  RangeFragmentEnvironment Env = {frag(0, 1), frag(4, 5)};
  RangeFragmentIndex First[] = {0};
  RangeFragmentIndex Second[] = {1};

  RealRangeEnvironment Reals;
  Reals.push_back(RealRange(Register::NewReal(RegisterClass::I64, 2),
                            SortedRangeFragmentIndices(First, Env)));
  Reals.push_back(RealRange(Register::NewReal(RegisterClass::I64, 2),
                            SortedRangeFragmentIndices(Second, Env)));

  VirtualRangeEnvironment Virtuals;
  Virtuals.push_back(VirtualRange(Register::NewVirtual(RegisterClass::I64, 1),
                                  SortedRangeFragments(frag(0, 2))));
  Virtuals.push_back(VirtualRange(Register::NewVirtual(RegisterClass::I64, 0),
                                  SortedRangeFragments(frag(0, 2))));
  Virtuals.push_back(VirtualRange(Register::NewVirtual(RegisterClass::I64, 1),
                                  SortedRangeFragments(frag(4, 6))));

  RegisterToRangesMaps Maps = RegisterToRangesMaps::Build(Reals, Virtuals);

  ASSERT_EQ(3u, Maps.RealRegisterToRealRanges.size());
  EXPECT_TRUE(Maps.RealRegisterToRealRanges[0].empty());
  EXPECT_TRUE(Maps.RealRegisterToRealRanges[1].empty());
  ASSERT_EQ(2u, Maps.RealRegisterToRealRanges[2].size());
  EXPECT_EQ(0u, Maps.RealRegisterToRealRanges[2][0]);
  EXPECT_EQ(1u, Maps.RealRegisterToRealRanges[2][1]);

  ASSERT_EQ(2u, Maps.VirtualRegisterToVirtualRanges.size());
  ASSERT_EQ(1u, Maps.VirtualRegisterToVirtualRanges[0].size());
  EXPECT_EQ(1u, Maps.VirtualRegisterToVirtualRanges[0][0]);
  ASSERT_EQ(2u, Maps.VirtualRegisterToVirtualRanges[1].size());
  EXPECT_EQ(0u, Maps.VirtualRegisterToVirtualRanges[1][0]);
  EXPECT_EQ(2u, Maps.VirtualRegisterToVirtualRanges[1][1]);
}

} // end anonymous namespace
