#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace alucheck {

enum class DiagSeverity : uint8_t {
  kNote,
  kWarning,
  kError,
  kFatal,
};

struct Diagnostic {
  DiagSeverity severity = DiagSeverity::kError;
  std::string component;
  std::string message;
};

// Collects and prints diagnostics as "<component>: <severity>: <message>".
// Output goes to std::cerr unless another stream is supplied.
class DiagEngine {
 public:
  DiagEngine();
  explicit DiagEngine(std::ostream& out) : out_(&out) {}

  void Note(std::string_view component, std::string msg);
  void Warning(std::string_view component, std::string msg);
  void Error(std::string_view component, std::string msg);
  void Fatal(std::string_view component, std::string msg);

  uint32_t ErrorCount() const { return error_count_; }
  uint32_t WarningCount() const { return warning_count_; }
  bool HasErrors() const { return error_count_ > 0; }

  const std::vector<Diagnostic>& Diagnostics() const { return diags_; }

  void SetWarningsAsErrors(bool val) { warnings_as_errors_ = val; }
  void SetQuiet(bool val) { quiet_ = val; }

 private:
  void Emit(DiagSeverity sev, std::string_view component, std::string msg);

  std::ostream* out_;
  std::vector<Diagnostic> diags_;
  uint32_t error_count_ = 0;
  uint32_t warning_count_ = 0;
  bool warnings_as_errors_ = false;
  bool quiet_ = false;
};

const char* SeverityLabel(DiagSeverity sev);

}  // namespace alucheck
