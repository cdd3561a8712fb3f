#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string_view>

#include "harness/config.h"
#include "harness/generator.h"
#include "harness/observer.h"
#include "harness/report.h"
#include "harness/scoreboard.h"
#include "model/alu_model.h"

namespace alucheck {

class DiagEngine;

enum class HarnessState : uint8_t {
  kIdle,
  kGenerating,
  kComparing,
  kReporting,
  kDone,
};

// =============================================================================
// Harness: generate -> drive -> observe -> compare -> report
// =============================================================================
//
// Owns the transaction stream, the scoreboard and the report. The observer
// is borrowed and must outlive the harness. Verdicts are always recorded in
// issue order, in either pipeline mode.

class Harness {
  // Restricts construction to Create().
  struct CreateKey {
    explicit CreateKey() = default;
  };

 public:
  /// Returns null, after reporting the problems through `diag`, when the
  /// configuration is invalid. An unopenable report file is reported but is
  /// not a construction failure.
  static std::unique_ptr<Harness> Create(const HarnessConfig& cfg,
                                         Observer& observer, DiagEngine& diag,
                                         std::ostream& console);

  Harness(CreateKey, const HarnessConfig& cfg, const AluModel& model,
          Observer& observer, DiagEngine& diag, std::ostream& console,
          uint32_t seed);

  Harness(const Harness&) = delete;
  Harness& operator=(const Harness&) = delete;

  /// Queue a directed vector ahead of the random stream. Only meaningful
  /// before Run(). A control word for the other ALU variant is reported and
  /// rejected.
  bool AddDirected(uint64_t a, uint64_t b, const AluControl& control);

  RunSummary Run();

  HarnessState State() const { return state_; }
  /// How many times the harness has entered `state`.
  uint64_t StateVisits(HarnessState state) const {
    return visits_[static_cast<size_t>(state)];
  }
  const Scoreboard& GetScoreboard() const { return scoreboard_; }
  const AluModel& Model() const { return model_; }
  const ReportWriter& Report() const { return report_; }
  uint32_t Seed() const { return seed_; }

 private:
  void Enter(HarnessState state);
  void RunSequential();
  void RunThreaded();
  void Score(const Transaction& txn, const Observation& obs);

  HarnessConfig cfg_;
  AluModel model_;
  Observer& observer_;
  DiagEngine& diag_;
  ReportWriter report_;
  Generator generator_;
  Scoreboard scoreboard_;
  uint32_t seed_;
  HarnessState state_ = HarnessState::kIdle;
  std::array<uint64_t, 5> visits_ = {1, 0, 0, 0, 0};
};

std::string_view HarnessStateName(HarnessState state);

}  // namespace alucheck
