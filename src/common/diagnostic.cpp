#include "common/diagnostic.h"

#include <format>
#include <iostream>

namespace alucheck {

const char* SeverityLabel(DiagSeverity sev) {
  switch (sev) {
    case DiagSeverity::kNote:
      return "note";
    case DiagSeverity::kWarning:
      return "warning";
    case DiagSeverity::kError:
      return "error";
    case DiagSeverity::kFatal:
      return "fatal error";
  }
  return "unknown";
}

DiagEngine::DiagEngine() : out_(&std::cerr) {}

void DiagEngine::Note(std::string_view component, std::string msg) {
  Emit(DiagSeverity::kNote, component, std::move(msg));
}

void DiagEngine::Warning(std::string_view component, std::string msg) {
  if (warnings_as_errors_) {
    Emit(DiagSeverity::kError, component, std::move(msg));
    return;
  }
  Emit(DiagSeverity::kWarning, component, std::move(msg));
}

void DiagEngine::Error(std::string_view component, std::string msg) {
  Emit(DiagSeverity::kError, component, std::move(msg));
}

void DiagEngine::Fatal(std::string_view component, std::string msg) {
  Emit(DiagSeverity::kFatal, component, std::move(msg));
}

void DiagEngine::Emit(DiagSeverity sev, std::string_view component,
                      std::string msg) {
  if (sev == DiagSeverity::kError || sev == DiagSeverity::kFatal) {
    ++error_count_;
  } else if (sev == DiagSeverity::kWarning) {
    ++warning_count_;
  }

  if (!quiet_) {
    *out_ << std::format("{}: {}: {}\n", component, SeverityLabel(sev), msg);
  }

  diags_.push_back({sev, std::string(component), std::move(msg)});
}

}  // namespace alucheck
