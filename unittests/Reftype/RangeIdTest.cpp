//===- RangeIdTest.cpp - Unified range identity tests ---------------------===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Reftype/RangeId.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"
#include <string>

using namespace Reftype;

namespace {

TEST(RangeIdTest, KindsAndIndices) {
  RangeId Real = RangeId::NewReal(7);
  RangeId Virtual = RangeId::NewVirtual(7);

  EXPECT_TRUE(Real.IsReal());
  EXPECT_FALSE(Real.IsVirtual());
  EXPECT_EQ(7u, Real.ToReal());
  EXPECT_TRUE(Virtual.IsVirtual());
  EXPECT_FALSE(Virtual.IsReal());
  EXPECT_EQ(7u, Virtual.ToVirtual());

  EXPECT_EQ(RangeId::MaxIndex, RangeId::NewReal(RangeId::MaxIndex).ToReal());
}

TEST(RangeIdTest, SameIndexDifferentKindIsDifferentRange) {
  EXPECT_NE(RangeId::NewReal(0), RangeId::NewVirtual(0));
  EXPECT_EQ(RangeId::NewVirtual(3), RangeId::NewVirtual(3));

  RangeIdSet Set;
  EXPECT_TRUE(Set.insert(RangeId::NewReal(0)).second);
  EXPECT_TRUE(Set.insert(RangeId::NewVirtual(0)).second);
  EXPECT_FALSE(Set.insert(RangeId::NewReal(0)).second);
  EXPECT_EQ(2u, Set.size());
  EXPECT_TRUE(Set.count(RangeId::NewVirtual(0)));
  EXPECT_FALSE(Set.count(RangeId::NewVirtual(1)));
}

TEST(RangeIdTest, UsableAsDenseMapKey) {
  llvm::DenseMap<RangeId, unsigned> Map;
  for (unsigned I = 0; I != 100; ++I) {
    Map[RangeId::NewReal(I)] = I;
    Map[RangeId::NewVirtual(I)] = I + 1000;
  }

  EXPECT_EQ(200u, Map.size());
  EXPECT_EQ(42u, Map.lookup(RangeId::NewReal(42)));
  EXPECT_EQ(1042u, Map.lookup(RangeId::NewVirtual(42)));
}

TEST(RangeIdTest, Print) {
  std::string Text;
  llvm::raw_string_ostream OS(Text);
  OS << RangeId::NewReal(4) << ' ' << RangeId::NewVirtual(9);
  EXPECT_EQ("RR4 VR9", OS.str());
}

} // end anonymous namespace
