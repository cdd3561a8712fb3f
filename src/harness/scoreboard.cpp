#include "harness/scoreboard.h"

#include <format>

#include "common/diagnostic.h"

namespace alucheck {

VerdictRecord Scoreboard::Compare(const Transaction& txn,
                                  const Observation& obs) {
  auto expected = model_.Evaluate(txn.a, txn.b, txn.control);
  bool diverged = !(expected == txn.prediction);
  if (diverged) {
    diag_.Fatal("scoreboard",
                std::format("golden model divergence on transaction {}: "
                            "generator predicted {}, scoreboard computed {}",
                            txn.seq, txn.prediction.result, expected.result));
  }

  auto want = ObservationFromPrediction(expected, txn.width);
  bool pass = !diverged && CaseEqual(obs.result, want.result) &&
              CaseEqual(obs.zero, want.zero);
  if (model_.HasOverflowOutput()) {
    pass = pass && CaseEqual(obs.overflow, want.overflow);
  }
  return {txn, expected, obs, pass};
}

const VerdictRecord& Scoreboard::Record(VerdictRecord verdict) {
  if (verdict.transaction.seq != next_seq_) {
    diag_.Error("scoreboard",
                std::format("transaction {} compared out of order "
                            "(expected {})",
                            verdict.transaction.seq, next_seq_));
  }
  next_seq_ = verdict.transaction.seq + 1;

  if (verdict.pass) {
    ++passed_;
  } else {
    ++failed_;
  }
  log_.push_back(std::move(verdict));
  const auto& rec = log_.back();
  if (report_) {
    report_->WriteLine(FormatVerdict(rec, model_.HasOverflowOutput()));
  }
  return rec;
}

RunSummary Scoreboard::Summary() const {
  return {passed_ + failed_, passed_, failed_, dropped_};
}

}  // namespace alucheck
