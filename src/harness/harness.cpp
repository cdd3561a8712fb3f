#include "harness/harness.h"

#include <atomic>
#include <chrono>
#include <format>
#include <optional>
#include <random>
#include <stop_token>
#include <thread>
#include <utility>

#include "common/diagnostic.h"
#include "harness/channel.h"

namespace alucheck {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollInterval = std::chrono::milliseconds(10);

struct ObservedTransaction {
  Transaction txn;
  Observation obs;
};

}  // namespace

std::string_view HarnessStateName(HarnessState state) {
  switch (state) {
    case HarnessState::kIdle:
      return "idle";
    case HarnessState::kGenerating:
      return "generating";
    case HarnessState::kComparing:
      return "comparing";
    case HarnessState::kReporting:
      return "reporting";
    case HarnessState::kDone:
      return "done";
  }
  return "unknown";
}

std::unique_ptr<Harness> Harness::Create(const HarnessConfig& cfg,
                                         Observer& observer, DiagEngine& diag,
                                         std::ostream& console) {
  if (!ValidateConfig(cfg, diag)) return nullptr;
  auto model = AluModel::Create(cfg.variant, cfg.width, diag);
  if (!model) return nullptr;

  uint32_t seed = 0;
  if (cfg.seed) {
    seed = *cfg.seed;
  } else {
    std::random_device rd;
    seed = rd();
    diag.Note("generator", std::format("no seed given; using seed {}", seed));
  }

  auto harness = std::make_unique<Harness>(CreateKey(), cfg, *model, observer,
                                           diag, console, seed);
  if (!cfg.report_path.empty()) {
    harness->report_.Open(cfg.report_path);
  }
  return harness;
}

Harness::Harness(CreateKey, const HarnessConfig& cfg, const AluModel& model,
                 Observer& observer, DiagEngine& diag, std::ostream& console,
                 uint32_t seed)
    : cfg_(cfg),
      model_(model),
      observer_(observer),
      diag_(diag),
      report_(console, diag),
      generator_(model_, static_cast<uint64_t>(cfg.count), seed),
      scoreboard_(model_, &report_, diag),
      seed_(seed) {}

bool Harness::AddDirected(uint64_t a, uint64_t b, const AluControl& control) {
  if (control.variant != model_.Variant()) {
    diag_.Error("harness",
                std::format("directed vector uses a {} control word on the {} "
                            "ALU; vector ignored",
                            VariantName(control.variant),
                            VariantName(model_.Variant())));
    return false;
  }
  generator_.AddDirected(a, b, control);
  return true;
}

void Harness::Enter(HarnessState state) {
  state_ = state;
  ++visits_[static_cast<size_t>(state)];
}

RunSummary Harness::Run() {
  if (state_ != HarnessState::kIdle) {
    diag_.Warning("harness",
                  std::format("run already completed (state {}); not running "
                              "again",
                              HarnessStateName(state_)));
    return scoreboard_.Summary();
  }
  diag_.Note("harness",
             std::format("{} transactions, {} ALU, width {}, observer {}, "
                         "seed {}",
                         generator_.Total(), VariantName(model_.Variant()),
                         model_.Width(), observer_.Name(), seed_));

  if (cfg_.mode == PipelineMode::kThreaded) {
    RunThreaded();
  } else {
    RunSequential();
  }

  auto summary = scoreboard_.Summary();
  report_.WriteLine(FormatSummary(summary));
  Enter(HarnessState::kDone);
  return summary;
}

void Harness::Score(const Transaction& txn, const Observation& obs) {
  Enter(HarnessState::kComparing);
  auto verdict = scoreboard_.Compare(txn, obs);
  Enter(HarnessState::kReporting);
  scoreboard_.Record(std::move(verdict));
}

// --- Sequential pipeline ---

void Harness::RunSequential() {
  auto start = Clock::now();
  while (true) {
    if (cfg_.max_run.count() > 0 && Clock::now() - start >= cfg_.max_run) {
      diag_.Warning("harness",
                    std::format("maximum run time of {} ms elapsed after {} "
                                "transactions",
                                cfg_.max_run.count(), generator_.Issued()));
      break;
    }
    Enter(HarnessState::kGenerating);
    auto txn = generator_.Next();
    if (!txn) break;
    auto obs = observer_.Observe(*txn);
    Score(*txn, obs);
  }
}

// --- Threaded pipeline ---
// generator thread -> to_driver -> driver thread -> to_scoreboard -> here.

void Harness::RunThreaded() {
  Channel<Transaction> to_driver(cfg_.channel_bound);
  Channel<ObservedTransaction> to_scoreboard(cfg_.channel_bound);
  std::atomic<bool> generator_done{false};

  // Generation runs on its own thread; the scoreboard side moves through
  // comparing and reporting as observations arrive.
  Enter(HarnessState::kGenerating);

  std::jthread generator_thread([&](std::stop_token stop) {
    while (!stop.stop_requested()) {
      auto txn = generator_.Next();
      if (!txn || !to_driver.Put(std::move(*txn), stop)) break;
    }
    to_driver.Close();
    generator_done = true;
  });

  std::jthread driver_thread([&](std::stop_token stop) {
    while (auto txn = to_driver.Get(stop)) {
      auto obs = observer_.Observe(*txn);
      if (!to_scoreboard.Put({std::move(*txn), obs}, stop)) break;
    }
    to_scoreboard.Close();
  });

  auto start = Clock::now();
  std::optional<Clock::time_point> run_deadline;
  if (cfg_.max_run.count() > 0) run_deadline = start + cfg_.max_run;
  std::optional<Clock::time_point> flush_deadline;
  bool timed_out = false;

  while (true) {
    auto now = Clock::now();
    if (!timed_out && run_deadline && now >= *run_deadline) {
      timed_out = true;
      generator_thread.request_stop();
      diag_.Warning("harness",
                    std::format("maximum run time of {} ms elapsed; stopping "
                                "generation",
                                cfg_.max_run.count()));
      flush_deadline = now + cfg_.grace;
    }
    if (!flush_deadline && cfg_.join == JoinPolicy::kFirstFinish &&
        generator_done) {
      flush_deadline = now + cfg_.grace;
    }
    if (flush_deadline && now >= *flush_deadline) break;

    auto wait_until = now + kPollInterval;
    if (flush_deadline && *flush_deadline < wait_until) {
      wait_until = *flush_deadline;
    }
    if (!timed_out && run_deadline && *run_deadline < wait_until) {
      wait_until = *run_deadline;
    }

    auto item = to_scoreboard.GetUntil(wait_until);
    if (!item) {
      if (to_scoreboard.IsClosed() && to_scoreboard.Num() == 0) break;
      continue;
    }
    Score(item->txn, item->obs);
  }

  generator_thread.request_stop();
  driver_thread.request_stop();
  to_driver.Close();
  to_scoreboard.Close();
  generator_thread.join();
  driver_thread.join();

  uint64_t compared = scoreboard_.Summary().total;
  if (generator_.Issued() > compared) {
    uint64_t dropped = generator_.Issued() - compared;
    scoreboard_.AddDropped(dropped);
    diag_.Warning("harness",
                  std::format("{} in-flight transactions dropped at end of run "
                              "(join policy {})",
                              dropped, JoinPolicyName(cfg_.join)));
  }
}

}  // namespace alucheck
