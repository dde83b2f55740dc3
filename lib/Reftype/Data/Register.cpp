//===-- Data/Register.cpp ---------------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Reftype/Register.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

namespace Reftype
{

//-----------------------------------------------------------------------------
//
// Description:
//
//    Get the printable name of a register class.
//
//-----------------------------------------------------------------------------

const char *
GetRegisterClassName
(
   RegisterClass registerClass
)
{
   switch (registerClass)
   {
      case RegisterClass::I32:
         return "I32";
      case RegisterClass::F32:
         return "F32";
      case RegisterClass::I64:
         return "I64";
      case RegisterClass::F64:
         return "F64";
      case RegisterClass::V128:
         return "V128";
      case RegisterClass::Invalid:
         return "Invalid";
   }

   llvm_unreachable("Unknown register class.");
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Create a real (hardware) register.
//
// Arguments:
//
//    registerClass - Class of the register
//    index         - Target register number
//
//-----------------------------------------------------------------------------

Register
Register::NewReal
(
   RegisterClass registerClass,
   RegisterIndex index
)
{
   Register reg;

   reg.Class = registerClass;
   reg.Index = index;
   reg.IsRealRegister = true;

   return reg;
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Create a virtual register.
//
// Arguments:
//
//    registerClass - Class of the register
//    index         - Virtual register number
//
//-----------------------------------------------------------------------------

Register
Register::NewVirtual
(
   RegisterClass registerClass,
   RegisterIndex index
)
{
   Register reg;

   reg.Class = registerClass;
   reg.Index = index;
   reg.IsRealRegister = false;

   return reg;
}

Register
Register::NewInvalid()
{
   return Register::NewVirtual(RegisterClass::Invalid, TypeConstants::MaxUInt32);
}

void
Register::print
(
   llvm::raw_ostream & os
) const
{
   if (this->IsInvalid()) {
      os << "<invalid>";
      return;
   }

   os << (this->IsRealRegister ? 'r' : 'v') << this->Index << ':'
      << GetRegisterClassName(this->Class);
}

void
Register::dump() const
{
   this->print(llvm::dbgs());
   llvm::dbgs() << '\n';
}

llvm::raw_ostream &
operator<<
(
   llvm::raw_ostream & os,
   const Register &    reg
)
{
   reg.print(os);
   return os;
}

//-----------------------------------------------------------------------------
//
// Description:
//
//    Create an instruction point.
//
// Arguments:
//
//    instruction - Owning instruction index
//    subPoint    - Position within the instruction
//
//-----------------------------------------------------------------------------

InstructionPoint
InstructionPoint::New
(
   InstructionIndex    instruction,
   InstructionSubPoint subPoint
)
{
   InstructionPoint point;

   point.Instruction = instruction;
   point.SubPoint = subPoint;

   return point;
}

void
InstructionPoint::print
(
   llvm::raw_ostream & os
) const
{
   static const char SubPointNames[] = { 'r', 'u', 'd', 's' };

   os << this->Instruction << '/' << SubPointNames[static_cast<unsigned>(this->SubPoint)];
}

llvm::raw_ostream &
operator<<
(
   llvm::raw_ostream &      os,
   const InstructionPoint & point
)
{
   point.print(os);
   return os;
}

} // namespace Reftype
