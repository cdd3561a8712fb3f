#include "harness/config.h"

#include <format>

#include "common/diagnostic.h"
#include "common/types.h"

namespace alucheck {

bool ValidateConfig(const HarnessConfig& cfg, DiagEngine& diag) {
  bool ok = true;
  if (cfg.count < 0) {
    diag.Error("config", std::format("invalid configuration: transaction "
                                     "count {} is negative",
                                     cfg.count));
    ok = false;
  }
  if (!IsSupportedWidth(cfg.width)) {
    diag.Error("config", std::format("invalid configuration: unsupported "
                                     "width {} (expected 8, 16, 32 or 64)",
                                     cfg.width));
    ok = false;
  }
  if (cfg.variant != AluVariant::kFlat && cfg.variant != AluVariant::kMips) {
    diag.Error("config", "invalid configuration: unknown ALU variant");
    ok = false;
  }
  if (cfg.max_run.count() < 0) {
    diag.Error("config", "invalid configuration: negative maximum run time");
    ok = false;
  }
  if (cfg.grace.count() < 0) {
    diag.Error("config", "invalid configuration: negative grace period");
    ok = false;
  }
  return ok;
}

std::string_view JoinPolicyName(JoinPolicy join) {
  switch (join) {
    case JoinPolicy::kDrain:
      return "drain";
    case JoinPolicy::kFirstFinish:
      return "first-finish";
  }
  return "unknown";
}

bool ParseJoinPolicy(std::string_view str, JoinPolicy& out) {
  if (str == "drain") {
    out = JoinPolicy::kDrain;
  } else if (str == "first-finish") {
    out = JoinPolicy::kFirstFinish;
  } else {
    return false;
  }
  return true;
}

}  // namespace alucheck
