//===-- Analysis/ReftypeError.cpp -------------------------------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Reftype/ReftypeError.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

namespace Reftype
{

char ReftypeError::ID = 0;

ReftypeError::ReftypeError
(
   ReftypeErrorCode    code,
   const llvm::Twine & message
) : Code(code), Message(message.str())
{
}

void
ReftypeError::log
(
   llvm::raw_ostream & os
) const
{
   os << GetReftypeErrorCodeName(this->Code) << ": " << this->Message;
}

std::error_code
ReftypeError::convertToErrorCode() const
{
   return llvm::inconvertibleErrorCode();
}

const char *
GetReftypeErrorCodeName
(
   ReftypeErrorCode code
)
{
   switch (code)
   {
      case ReftypeErrorCode::MoveClassMismatch:
         return "move class mismatch";
      case ReftypeErrorCode::SeedClassMismatch:
         return "reftyped register class mismatch";
      case ReftypeErrorCode::SeedNotVirtual:
         return "reftyped register is not virtual";
   }

   llvm_unreachable("Unknown reftype error code.");
}

} // namespace Reftype
