#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "model/alu_op.h"

namespace alucheck {

class DiagEngine;

enum class PipelineMode : uint8_t {
  kSequential,  // One transaction at a time on the calling thread.
  kThreaded,    // Generator and driver on worker threads.
};

// What happens to in-flight transactions when the generator finishes.
enum class JoinPolicy : uint8_t {
  kDrain,        // Compare everything that was issued.
  kFirstFinish,  // Stop after the grace period; the rest is dropped.
};

struct HarnessConfig {
  int64_t count = 20;
  uint32_t width = 8;
  AluVariant variant = AluVariant::kFlat;
  std::optional<uint32_t> seed;  // Unset: drawn from std::random_device.
  std::string report_path;       // Empty: console only.
  PipelineMode mode = PipelineMode::kSequential;
  JoinPolicy join = JoinPolicy::kDrain;
  size_t channel_bound = 0;              // 0 means unbounded.
  std::chrono::milliseconds max_run{0};  // 0 means no limit.
  std::chrono::milliseconds grace{100};
};

/// Reports every problem found and returns false if there was any.
bool ValidateConfig(const HarnessConfig& cfg, DiagEngine& diag);

std::string_view JoinPolicyName(JoinPolicy join);
bool ParseJoinPolicy(std::string_view str, JoinPolicy& out);

}  // namespace alucheck
