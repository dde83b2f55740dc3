//===-- Data/RangeId.cpp ----------------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Reftype/RangeId.h"
#include "llvm/Support/raw_ostream.h"

namespace Reftype
{

const UInt32 RangeId::RealTag;
const UInt32 RangeId::MaxIndex;

void
RangeId::print
(
   llvm::raw_ostream & os
) const
{
   if (this->IsReal()) {
      os << "RR" << this->ToReal();
   } else {
      os << "VR" << this->ToVirtual();
   }
}

llvm::raw_ostream &
operator<<
(
   llvm::raw_ostream & os,
   const RangeId &     rangeId
)
{
   rangeId.print(os);
   return os;
}

} // namespace Reftype
