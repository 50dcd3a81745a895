/*
 * 설명: 투구 원장의 추가/절단/재추가를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/ledger_test.cpp
 */
#include "scorer/ledger.hpp"

#include <utility>

namespace scorer {

void BallLedger::Append(LedgerEntry entry) {
  entries_.push_back(std::move(entry));
  redo_.clear();
}

std::optional<LedgerEntry> BallLedger::Truncate() {
  if (entries_.empty()) {
    return std::nullopt;
  }
  LedgerEntry last = std::move(entries_.back());
  entries_.pop_back();
  redo_.push_back(last);
  return last;
}

std::optional<LedgerEntry> BallLedger::Reappend() {
  if (redo_.empty()) {
    return std::nullopt;
  }
  LedgerEntry next = std::move(redo_.back());
  redo_.pop_back();
  entries_.push_back(next);
  return next;
}

}  // namespace scorer
