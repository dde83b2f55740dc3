//===-- Reftype/MoveInfo.h - Moves and stackmap requests --------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_MOVEINFO_H
#define REFTYPE_MOVEINFO_H

#include "Reftype/Register.h"
#include <vector>

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    One instruction the client classified as a register to register copy,
//    `Destination := Source`, at instruction `Instruction`.
//
//-----------------------------------------------------------------------------

class MoveInfoElement
{

public:

   static Reftype::MoveInfoElement
   New
   (
      Reftype::Register         destination,
      Reftype::Register         source,
      Reftype::InstructionIndex instruction,
      unsigned                  estimatedFrequency = 1
   )
   {
      Reftype::MoveInfoElement element;

      element.Destination = destination;
      element.Source = source;
      element.Instruction = instruction;
      element.EstimatedFrequency = estimatedFrequency;

      return element;
   }

public:

   Reftype::Register         Destination;
   Reftype::Register         Source;
   Reftype::InstructionIndex Instruction;
   unsigned                  EstimatedFrequency;
};

#if 0
comment MoveInfoElement::EstimatedFrequency
{
   // Estimated execution count of the move; used by coalescing, not by the
   // reftype analysis.
}
#endif

typedef std::vector<Reftype::MoveInfoElement> MoveInfo;

//-----------------------------------------------------------------------------
//
// Description:
//
//    What the client asks of the allocator for stackmap emission: which
//    register class carries references and which virtual registers hold
//    them.
//
//-----------------------------------------------------------------------------

class StackmapRequestInfo
{

public:

   Reftype::RegisterClass          ReftypeClass;
   std::vector<Reftype::Register>  ReftypedVirtualRegisters;
};

} // namespace Reftype

#endif // end REFTYPE_MOVEINFO_H
