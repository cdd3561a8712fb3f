#pragma once

#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <string>
#include <string_view>

#include "harness/transaction.h"

namespace alucheck {

class DiagEngine;

struct RunSummary {
  uint64_t total = 0;  // Transactions compared.
  uint64_t passed = 0;
  uint64_t failed = 0;
  uint64_t dropped = 0;  // Issued but never compared.

  bool Green() const { return failed == 0; }
};

/// "PASS: a=5 b=3 opcode=0 result=8" or
/// "FAIL: a=5 b=3 opcode=0 DUT=7 Expected=8", with flag fields appended on
/// a flag mismatch. The overflow flag is only reported when compared.
std::string FormatVerdict(const VerdictRecord& v, bool compare_overflow);

std::string FormatSummary(const RunSummary& s);

// =============================================================================
// ReportWriter: append-only verdict log mirrored to a console stream
// =============================================================================

class ReportWriter {
 public:
  ReportWriter(std::ostream& console, DiagEngine& diag)
      : console_(console), diag_(diag) {}

  /// Opens (truncates) the report file. On failure the error is reported and
  /// the writer keeps going console-only.
  bool Open(const std::string& path);

  void WriteLine(std::string_view line);

  bool HasFile() const { return file_.is_open(); }
  uint64_t LinesWritten() const { return lines_; }

 private:
  std::ostream& console_;
  DiagEngine& diag_;
  std::ofstream file_;
  std::string path_;
  uint64_t lines_ = 0;
};

}  // namespace alucheck
