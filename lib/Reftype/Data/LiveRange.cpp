//===-- Data/LiveRange.cpp --------------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Reftype/LiveRange.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <cassert>
#include <utility>

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Create a fragment covering [first, last].
//
//-----------------------------------------------------------------------------

RangeFragment
RangeFragment::New
(
   InstructionPoint first,
   InstructionPoint last
)
{
   assert(first <= last && "Fragment ends before it starts");

   RangeFragment fragment;

   fragment.First = first;
   fragment.Last = last;

   return fragment;
}

void
RangeFragment::print
(
   llvm::raw_ostream & os
) const
{
   os << '[' << this->First << ", " << this->Last << ']';
}

SortedRangeFragments::SortedRangeFragments
(
   llvm::ArrayRef<RangeFragment> fragments
) : Fragments(fragments.begin(), fragments.end())
{
   assert(this->IsSortedAndNonOverlapping());
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Test whether any fragment of the range covers the given point.
//
// Remarks:
//
//    Binary search for the last fragment starting at or before the point;
//    only that one can contain it.
//
//-----------------------------------------------------------------------------

bool
SortedRangeFragments::ContainsPoint
(
   InstructionPoint point
) const
{
   auto f = std::upper_bound(this->Fragments.begin(), this->Fragments.end(), point,
      [](InstructionPoint p, const RangeFragment & fragment) {
         return p < fragment.First;
      });

   if (f == this->Fragments.begin()) {
      return false;
   }

   --f;

   return f->Contains(point);
}

bool
SortedRangeFragments::IsSortedAndNonOverlapping() const
{
   for (unsigned i = 1, e = this->Fragments.size(); i < e; ++i)
   {
      if (!(this->Fragments[i - 1].Last < this->Fragments[i].First)) {
         return false;
      }
   }

   return true;
}

SortedRangeFragmentIndices::SortedRangeFragmentIndices
(
   llvm::ArrayRef<RangeFragmentIndex> indices,
   const RangeFragmentEnvironment &   fragmentEnvironment
) : Indices(indices.begin(), indices.end())
{
   assert(this->IsSortedAndNonOverlapping(fragmentEnvironment));
   (void)fragmentEnvironment;
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Test whether any fragment of the range covers the given point.
//
// Arguments:
//
//    fragmentEnvironment - Fragments the indices refer to
//    point               - Point to test
//
//-----------------------------------------------------------------------------

bool
SortedRangeFragmentIndices::ContainsPoint
(
   const RangeFragmentEnvironment & fragmentEnvironment,
   InstructionPoint                 point
) const
{
   auto i = std::upper_bound(this->Indices.begin(), this->Indices.end(), point,
      [&fragmentEnvironment](InstructionPoint p, RangeFragmentIndex index) {
         return p < fragmentEnvironment[index].First;
      });

   if (i == this->Indices.begin()) {
      return false;
   }

   --i;

   return fragmentEnvironment[*i].Contains(point);
}

bool
SortedRangeFragmentIndices::IsSortedAndNonOverlapping
(
   const RangeFragmentEnvironment & fragmentEnvironment
) const
{
   for (unsigned i = 0, e = this->Indices.size(); i < e; ++i)
   {
      if (this->Indices[i] >= fragmentEnvironment.size()) {
         return false;
      }

      if (i == 0) {
         continue;
      }

      const RangeFragment & previous = fragmentEnvironment[this->Indices[i - 1]];
      const RangeFragment & current = fragmentEnvironment[this->Indices[i]];

      if (!(previous.Last < current.First)) {
         return false;
      }
   }

   return true;
}

RealRange::RealRange
(
   Register                   realRegister,
   SortedRangeFragmentIndices sortedFragments
) : RealRegister(realRegister), SortedFragments(std::move(sortedFragments)), IsRef(false)
{
   assert(realRegister.IsReal());
}

void
RealRange::print
(
   llvm::raw_ostream & os
) const
{
   os << "(RR: " << this->RealRegister << ", frags {";
   for (RangeFragmentIndex index : this->SortedFragments.Indices)
   {
      os << ' ' << index;
   }
   os << " }" << (this->IsRef ? ", ref" : "") << ')';
}

VirtualRange::VirtualRange
(
   Register             virtualRegister,
   SortedRangeFragments sortedFragments
) : VirtualRegister(virtualRegister), SortedFragments(std::move(sortedFragments)), IsRef(false)
{
   assert(virtualRegister.IsVirtual());
}

void
VirtualRange::print
(
   llvm::raw_ostream & os
) const
{
   os << "(VR: " << this->VirtualRegister;
   if (this->AssignedRegister.hasValue()) {
      os << " -> " << this->AssignedRegister.getValue();
   }
   os << ", frags {";
   for (const RangeFragment & fragment : this->SortedFragments.Fragments)
   {
      os << ' ';
      fragment.print(os);
   }
   os << " }" << (this->IsRef ? ", ref" : "") << ')';
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Derive the register to ranges maps from the range environments.
//
// Arguments:
//
//    realRanges    - Ranges bound to real registers
//    virtualRanges - Ranges of virtual registers
//
// Returns:
//
//    Maps sized to the highest register number seen, with each register's
//    ranges listed in environment order.
//
//-----------------------------------------------------------------------------

RegisterToRangesMaps
RegisterToRangesMaps::Build
(
   const RealRangeEnvironment &    realRanges,
   const VirtualRangeEnvironment & virtualRanges
)
{
   RegisterToRangesMaps maps;

   for (RealRangeIndex ix = 0, e = realRanges.size(); ix < e; ++ix)
   {
      RegisterIndex reg = realRanges[ix].RealRegister.GetIndex();

      if (reg >= maps.RealRegisterToRealRanges.size()) {
         maps.RealRegisterToRealRanges.resize(reg + 1);
      }

      maps.RealRegisterToRealRanges[reg].push_back(ix);
   }

   for (VirtualRangeIndex ix = 0, e = virtualRanges.size(); ix < e; ++ix)
   {
      RegisterIndex reg = virtualRanges[ix].VirtualRegister.GetIndex();

      if (reg >= maps.VirtualRegisterToVirtualRanges.size()) {
         maps.VirtualRegisterToVirtualRanges.resize(reg + 1);
      }

      maps.VirtualRegisterToVirtualRanges[reg].push_back(ix);
   }

   return maps;
}

} // namespace Reftype
