//===-- Reftype/ReftypeError.h - Client contract errors ---------*- C++ -*-===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Errors returned when the client hands the analysis inconsistent input.
// Internal inconsistencies between liveness and the move list are not
// errors of this kind; they are reported with llvm::report_fatal_error.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_REFTYPEERROR_H
#define REFTYPE_REFTYPEERROR_H

#include "llvm/Support/Error.h"
#include <string>

namespace Reftype
{

enum class ReftypeErrorCode
{
   MoveClassMismatch = 1,
   SeedClassMismatch,
   SeedNotVirtual
};

//-----------------------------------------------------------------------------
//
// Description:
//
//    llvm::Error payload describing a client contract violation.
//
//-----------------------------------------------------------------------------

class ReftypeError : public llvm::ErrorInfo<ReftypeError>
{

public:

   static char ID;

   ReftypeError
   (
      Reftype::ReftypeErrorCode code,
      const llvm::Twine &       message
   );

   void log(llvm::raw_ostream & os) const override;

   std::error_code convertToErrorCode() const override;

public:

   Reftype::ReftypeErrorCode GetCode() const { return this->Code; }

   const std::string & GetMessage() const { return this->Message; }

private:

   Reftype::ReftypeErrorCode Code;
   std::string               Message;
};

const char *
GetReftypeErrorCodeName
(
   Reftype::ReftypeErrorCode code
);

} // namespace Reftype

#endif // end REFTYPE_REFTYPEERROR_H
