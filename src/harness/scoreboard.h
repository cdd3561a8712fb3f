#pragma once

#include <cstdint>
#include <vector>

#include "harness/report.h"
#include "harness/transaction.h"
#include "model/alu_model.h"

namespace alucheck {

class DiagEngine;

// =============================================================================
// Scoreboard: compares observations against the golden model
// =============================================================================
//
// The prediction is recomputed for every transaction; the one the generator
// attached is only used to detect a divergence between the two. Comparison
// is 4-state case equality, so an x or z bit never matches.

class Scoreboard {
 public:
  Scoreboard(const AluModel& model, ReportWriter* report, DiagEngine& diag)
      : model_(model), report_(report), diag_(diag) {}

  /// Builds the verdict without recording it.
  VerdictRecord Compare(const Transaction& txn, const Observation& obs);

  /// Appends the verdict to the log and the report.
  const VerdictRecord& Record(VerdictRecord verdict);

  const VerdictRecord& Check(const Transaction& txn, const Observation& obs) {
    return Record(Compare(txn, obs));
  }

  void AddDropped(uint64_t n) { dropped_ += n; }

  const std::vector<VerdictRecord>& Log() const { return log_; }
  uint64_t PassCount() const { return passed_; }
  uint64_t FailCount() const { return failed_; }
  RunSummary Summary() const;

 private:
  const AluModel& model_;
  ReportWriter* report_;
  DiagEngine& diag_;
  std::vector<VerdictRecord> log_;
  uint64_t next_seq_ = 0;
  uint64_t passed_ = 0;
  uint64_t failed_ = 0;
  uint64_t dropped_ = 0;
};

}  // namespace alucheck
