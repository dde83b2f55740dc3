//===-- Reftype/Register.h - Registers and instruction points ---*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Registers as seen by the allocator: real (fixed hardware) and virtual
// (not yet assigned) registers, each carrying a register class, and the
// instruction points at which a register is used or defined.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_REGISTER_H
#define REFTYPE_REGISTER_H

#include "Reftype/Typedefs.h"

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
//    Register classes. Any one class may be designated by the client as the
//    class that carries reference-typed values.
//
//-----------------------------------------------------------------------------

enum class RegisterClass
{
   I32 = 0,
   F32,
   I64,
   F64,
   V128,
   Invalid
};

const char *
GetRegisterClassName
(
   RegisterClass registerClass
);

//-----------------------------------------------------------------------------
//
// Description:
//
//    A real or virtual register.
//
// Remarks:
//
//    Registers compare equal only if kind, class and index all agree. Moves
//    and seeds are validated against the class, not the index: the same
//    index is routinely reused across classes.
//
//-----------------------------------------------------------------------------

class Register
{

public:

   static Reftype::Register
   NewReal
   (
      Reftype::RegisterClass registerClass,
      Reftype::RegisterIndex index
   );

   static Reftype::Register
   NewVirtual
   (
      Reftype::RegisterClass registerClass,
      Reftype::RegisterIndex index
   );

   static Reftype::Register NewInvalid();

public:

   Reftype::RegisterClass GetClass() const { return this->Class; }

   Reftype::RegisterIndex GetIndex() const { return this->Index; }

   bool IsInvalid() const { return (this->Class == RegisterClass::Invalid); }

   bool IsReal() const { return this->IsRealRegister; }

   bool IsVirtual() const { return !this->IsRealRegister; }

   bool
   operator==
   (
      const Reftype::Register & other
   ) const
   {
      return (this->IsRealRegister == other.IsRealRegister)
         && (this->Class == other.Class)
         && (this->Index == other.Index);
   }

   bool
   operator!=
   (
      const Reftype::Register & other
   ) const
   {
      return !(*this == other);
   }

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

   void dump() const;

private:

   Reftype::RegisterClass  Class;
   Reftype::RegisterIndex  Index;
   bool                    IsRealRegister;
};

llvm::raw_ostream &
operator<<
(
   llvm::raw_ostream &       os,
   const Reftype::Register & reg
);

//-----------------------------------------------------------------------------
//
// Description:
//
//    Sub-points within a single instruction, in program order. Reloads happen
//    before the uses, spills after the defs.
//
//-----------------------------------------------------------------------------

enum class InstructionSubPoint
{
   Reload = 0,
   Use    = 1,
   Def    = 2,
   Spill  = 3
};

//-----------------------------------------------------------------------------
//
// Description:
//
//    A position in the instruction stream: an instruction index and a sub
//    point within that instruction. Points are totally ordered by index
//    first, then sub point.
//
//-----------------------------------------------------------------------------

class InstructionPoint
{

public:

   static Reftype::InstructionPoint
   New
   (
      Reftype::InstructionIndex    instruction,
      Reftype::InstructionSubPoint subPoint
   );

   static Reftype::InstructionPoint
   NewReload
   (
      Reftype::InstructionIndex instruction
   )
   {
      return New(instruction, InstructionSubPoint::Reload);
   }

   static Reftype::InstructionPoint
   NewUse
   (
      Reftype::InstructionIndex instruction
   )
   {
      return New(instruction, InstructionSubPoint::Use);
   }

   static Reftype::InstructionPoint
   NewDef
   (
      Reftype::InstructionIndex instruction
   )
   {
      return New(instruction, InstructionSubPoint::Def);
   }

   static Reftype::InstructionPoint
   NewSpill
   (
      Reftype::InstructionIndex instruction
   )
   {
      return New(instruction, InstructionSubPoint::Spill);
   }

public:

   Reftype::InstructionIndex GetInstruction() const { return this->Instruction; }

   Reftype::InstructionSubPoint GetSubPoint() const { return this->SubPoint; }

   bool
   operator==
   (
      const Reftype::InstructionPoint & other
   ) const
   {
      return (this->Instruction == other.Instruction) && (this->SubPoint == other.SubPoint);
   }

   bool
   operator!=
   (
      const Reftype::InstructionPoint & other
   ) const
   {
      return !(*this == other);
   }

   bool
   operator<
   (
      const Reftype::InstructionPoint & other
   ) const
   {
      if (this->Instruction != other.Instruction) {
         return (this->Instruction < other.Instruction);
      }

      return (static_cast<unsigned>(this->SubPoint) < static_cast<unsigned>(other.SubPoint));
   }

   bool
   operator<=
   (
      const Reftype::InstructionPoint & other
   ) const
   {
      return !(other < *this);
   }

   void
   print
   (
      llvm::raw_ostream & os
   ) const;

private:

   Reftype::InstructionIndex    Instruction;
   Reftype::InstructionSubPoint SubPoint;
};

llvm::raw_ostream &
operator<<
(
   llvm::raw_ostream &               os,
   const Reftype::InstructionPoint & point
);

} // namespace Reftype

#endif // end REFTYPE_REGISTER_H
