/*
 * 설명: 투구 원장. 추가/절단만 허용하며 되돌린 항목은 재실행 버퍼에 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/ledger_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "scorer/types.hpp"

namespace scorer {

class BallLedger {
 public:
  // 새 항목이 추가되면 재실행 버퍼는 비워진다(분기 이력 미지원).
  void Append(LedgerEntry entry);
  std::optional<LedgerEntry> Truncate();
  std::optional<LedgerEntry> Reappend();

  const std::vector<LedgerEntry>& Entries() const { return entries_; }
  std::size_t Size() const { return entries_.size(); }
  std::size_t RedoDepth() const { return redo_.size(); }
  bool CanUndo() const { return !entries_.empty(); }
  bool CanRedo() const { return !redo_.empty(); }

 private:
  std::vector<LedgerEntry> entries_;
  std::vector<LedgerEntry> redo_;
};

}  // namespace scorer
