#include "harness/report.h"

#include <format>
#include <ostream>

#include "common/diagnostic.h"

namespace alucheck {

static std::string FormatObserved(const Logic4Value& v) {
  if (v.IsKnown()) return std::to_string(v.ToUint64());
  return "b" + v.ToString();
}

static std::string FormatFlag(const Logic4Value& v) {
  if (v.IsKnown()) return v.ToUint64() ? "1" : "0";
  return v.ToString();
}

std::string FormatVerdict(const VerdictRecord& v, bool compare_overflow) {
  const auto& txn = v.transaction;
  auto head = std::format("a={} b={} opcode={}", txn.a, txn.b,
                          PackControl(txn.control));
  if (v.pass) {
    return std::format("PASS: {} result={}", head,
                       FormatObserved(v.observed.result));
  }

  auto line = std::format("FAIL: {} DUT={} Expected={}", head,
                          FormatObserved(v.observed.result), v.expected.result);
  auto exp_zero = MakeLogic4Value(1, v.expected.zero ? 1 : 0);
  if (!CaseEqual(v.observed.zero, exp_zero)) {
    line += std::format(" DUT_zero={} Expected_zero={}",
                        FormatFlag(v.observed.zero), v.expected.zero ? 1 : 0);
  }
  auto exp_ovf = MakeLogic4Value(1, v.expected.overflow ? 1 : 0);
  if (compare_overflow && !CaseEqual(v.observed.overflow, exp_ovf)) {
    line += std::format(" DUT_overflow={} Expected_overflow={}",
                        FormatFlag(v.observed.overflow),
                        v.expected.overflow ? 1 : 0);
  }
  return line;
}

std::string FormatSummary(const RunSummary& s) {
  return std::format("SUMMARY: total={} pass={} fail={} dropped={}", s.total,
                     s.passed, s.failed, s.dropped);
}

// =============================================================================
// ReportWriter
// =============================================================================

bool ReportWriter::Open(const std::string& path) {
  path_ = path;
  file_.open(path, std::ios::out | std::ios::trunc);
  if (!file_) {
    diag_.Error("report", std::format("cannot open report file '{}'; "
                                      "continuing with console output only",
                                      path));
    return false;
  }
  return true;
}

void ReportWriter::WriteLine(std::string_view line) {
  console_ << line << '\n';
  ++lines_;
  if (!file_.is_open()) return;
  file_ << line << '\n';
  file_.flush();
  if (!file_) {
    diag_.Error("report", std::format("write to report file '{}' failed; "
                                      "continuing with console output only",
                                      path_));
    file_.close();
  }
}

}  // namespace alucheck
