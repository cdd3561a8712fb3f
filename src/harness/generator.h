#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <random>

#include "harness/transaction.h"
#include "model/alu_model.h"

namespace alucheck {

// =============================================================================
// Generator: produces predicted transactions
// =============================================================================
//
// Directed vectors queued with AddDirected() are issued first, in the order
// they were added, followed by `count` random transactions. Random operands
// are uniform over the full width and operations uniform over the variant's
// valid set. The same seed always yields the same stream.

class Generator {
 public:
  Generator(const AluModel& model, uint64_t count, uint32_t seed);

  void AddDirected(uint64_t a, uint64_t b, const AluControl& control);

  /// Next transaction with its prediction attached, or nullopt once the
  /// stream is exhausted.
  std::optional<Transaction> Next();

  bool Exhausted() const { return directed_.empty() && random_left_ == 0; }
  uint64_t Issued() const { return next_seq_; }
  uint64_t Total() const;

 private:
  struct Stimulus {
    uint64_t a = 0;
    uint64_t b = 0;
    AluControl control;
  };

  Stimulus RandomStimulus();
  Transaction Annotate(const Stimulus& stim);

  const AluModel& model_;
  uint64_t random_left_;
  uint64_t next_seq_ = 0;
  std::deque<Stimulus> directed_;
  std::mt19937 rng_;
};

}  // namespace alucheck
