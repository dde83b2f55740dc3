//===- ReftypeTestUtil.h - Helpers for the reftype unit tests -------------===//
//
//                     The LLVM Compiler Infrastructure
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef REFTYPE_UNITTESTS_REFTYPETESTUTIL_H
#define REFTYPE_UNITTESTS_REFTYPETESTUTIL_H

#include "Reftype/ReftypeAnalysis.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace Reftype {
namespace unittest {

// Reftype analysis over a flat table of (register, live interval, range id)
// rows. Stands in for the allocator's range environments.
class TableReftypeAnalysis : public ReftypeAnalysis {
public:
  TableReftypeAnalysis() : NextRealIndex(0), NextVirtualIndex(0) {}

  // Add a range of Reg live from the def point of FirstInst to the use point
  // of LastInst.
  RangeId addRange(Register Reg, InstructionIndex FirstInst,
                   InstructionIndex LastInst) {
    RangeId Id = Reg.IsReal() ? RangeId::NewReal(NextRealIndex++)
                              : RangeId::NewVirtual(NextVirtualIndex++);
    Row R = {Reg, InstructionPoint::NewDef(FirstInst),
             InstructionPoint::NewUse(LastInst), Id};
    Rows.push_back(R);
    return Id;
  }

  RangeId FindRangeIdForRegister(InstructionPoint Point,
                                 Register Reg) const override {
    for (const Row &R : Rows)
      if (R.Reg == Reg && R.First <= Point && Point <= R.Last)
        return R.Id;

    std::string Text;
    llvm::raw_string_ostream OS(Text);
    OS << "no table range for " << Reg << " at " << Point;
    llvm::report_fatal_error(llvm::Twine(OS.str()));
  }

  void InsertReffyRanges(Register VirtualRegister,
                         RangeIdSet *Set) const override {
    for (const Row &R : Rows)
      if (R.Reg == VirtualRegister)
        Set->insert(R.Id);
  }

  void MarkReffy(RangeId Id) override { ++MarkCounts[Id]; }

  bool isMarked(RangeId Id) const { return MarkCounts.count(Id) != 0; }

  unsigned markCount(RangeId Id) const { return MarkCounts.lookup(Id); }

  unsigned numMarked() const { return MarkCounts.size(); }

  void clearMarks() { MarkCounts.clear(); }

private:
  struct Row {
    Register Reg;
    InstructionPoint First;
    InstructionPoint Last;
    RangeId Id;
  };

  std::vector<Row> Rows;
  llvm::DenseMap<RangeId, unsigned> MarkCounts;
  RealRangeIndex NextRealIndex;
  VirtualRangeIndex NextVirtualIndex;
};

inline Register vreg(RegisterIndex Index,
                     RegisterClass Class = RegisterClass::I64) {
  return Register::NewVirtual(Class, Index);
}

inline Register rreg(RegisterIndex Index,
                     RegisterClass Class = RegisterClass::I64) {
  return Register::NewReal(Class, Index);
}

// Consume Err, which must hold a ReftypeError, and return its code.
inline ReftypeErrorCode takeReftypeErrorCode(llvm::Error Err) {
  ReftypeErrorCode Code = ReftypeErrorCode::MoveClassMismatch;
  bool Found = false;
  llvm::handleAllErrors(std::move(Err), [&](const ReftypeError &E) {
    Code = E.GetCode();
    Found = true;
  });
  if (!Found)
    llvm::report_fatal_error("expected a ReftypeError");
  return Code;
}

} // end namespace unittest
} // end namespace Reftype

#endif // REFTYPE_UNITTESTS_REFTYPETESTUTIL_H
