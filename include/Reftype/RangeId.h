//===-- Reftype/RangeId.h - Unified range identity --------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// A single identity for both real and virtual live ranges, so that graph
// algorithms over ranges need only one vertex type.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_RANGEID_H
#define REFTYPE_RANGEID_H

#include "Reftype/Typedefs.h"
#include "llvm/ADT/DenseMapInfo.h"
#include "llvm/ADT/DenseSet.h"
#include <cassert>

namespace llvm
{
class raw_ostream;
}

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Tagged index of either a real range or a virtual range.
//
// Remarks:
//
//    The top bit tags real ranges; the remaining bits are the index into
//    the owning environment. The two highest encodings are reserved for the
//    DenseMap empty and tombstone keys.
//
//-----------------------------------------------------------------------------

class RangeId
{

public:

   static const Reftype::UInt32 RealTag = 0x80000000u;
   static const Reftype::UInt32 MaxIndex = 0x7FFFFFFDu;

   static Reftype::RangeId
   NewReal
   (
      Reftype::RealRangeIndex index
   )
   {
      assert(index <= MaxIndex && "Real range index out of range");
      return RangeId(index | RealTag);
   }

   static Reftype::RangeId
   NewVirtual
   (
      Reftype::VirtualRangeIndex index
   )
   {
      assert(index <= MaxIndex && "Virtual range index out of range");
      return RangeId(index);
   }

   static Reftype::RangeId
   FromBits
   (
      Reftype::UInt32 bits
   )
   {
      return RangeId(bits);
   }

public:

   bool IsReal() const { return ((this->Bits & RealTag) != 0); }

   bool IsVirtual() const { return ((this->Bits & RealTag) == 0); }

   Reftype::RealRangeIndex
   ToReal() const
   {
      assert(this->IsReal());
      return (this->Bits & ~RealTag);
   }

   Reftype::VirtualRangeIndex
   ToVirtual() const
   {
      assert(this->IsVirtual());
      return this->Bits;
   }

   Reftype::UInt32 GetBits() const { return this->Bits; }

   bool
   operator==
   (
      const Reftype::RangeId & other
   ) const
   {
      return (this->Bits == other.Bits);
   }

   bool
   operator!=
   (
      const Reftype::RangeId & other
   ) const
   {
      return (this->Bits != other.Bits);
   }

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

private:

   explicit RangeId(Reftype::UInt32 bits) : Bits(bits) {}

   Reftype::UInt32 Bits;
};

llvm::raw_ostream &
operator<<
(
   llvm::raw_ostream &      os,
   const Reftype::RangeId & rangeId
);

} // namespace Reftype

namespace llvm
{

template <> struct DenseMapInfo<Reftype::RangeId>
{
   static inline Reftype::RangeId getEmptyKey()
   {
      return Reftype::RangeId::FromBits(~0u);
   }

   static inline Reftype::RangeId getTombstoneKey()
   {
      return Reftype::RangeId::FromBits(~0u - 1);
   }

   static unsigned getHashValue(const Reftype::RangeId & rangeId)
   {
      return DenseMapInfo<unsigned>::getHashValue(rangeId.GetBits());
   }

   static bool isEqual(const Reftype::RangeId & lhs, const Reftype::RangeId & rhs)
   {
      return (lhs == rhs);
   }
};

} // namespace llvm

namespace Reftype
{

typedef llvm::DenseSet<Reftype::RangeId> RangeIdSet;

} // namespace Reftype

#endif // end REFTYPE_RANGEID_H
