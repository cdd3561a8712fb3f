#include "harness/generator.h"

#include "common/types.h"

namespace alucheck {

Generator::Generator(const AluModel& model, uint64_t count, uint32_t seed)
    : model_(model), random_left_(count), rng_(seed) {}

void Generator::AddDirected(uint64_t a, uint64_t b, const AluControl& control) {
  directed_.push_back({a, b, control});
}

uint64_t Generator::Total() const {
  return next_seq_ + directed_.size() + random_left_;
}

std::optional<Transaction> Generator::Next() {
  if (!directed_.empty()) {
    auto stim = directed_.front();
    directed_.pop_front();
    return Annotate(stim);
  }
  if (random_left_ == 0) return std::nullopt;
  --random_left_;
  return Annotate(RandomStimulus());
}

Generator::Stimulus Generator::RandomStimulus() {
  uint64_t mask = WidthMask(model_.Width());
  std::uniform_int_distribution<uint64_t> operand(0, mask);
  const auto& ops = ValidOps(model_.Variant());
  std::uniform_int_distribution<size_t> pick(0, ops.size() - 1);

  Stimulus stim;
  stim.a = operand(rng_);
  stim.b = operand(rng_);
  auto op = ops[pick(rng_)];
  // Every op in ValidOps() has an encoding in its own variant.
  stim.control = *EncodeOp(op, model_.Variant());

  if (model_.Variant() == AluVariant::kMips &&
      (op == AluOp::kSll || op == AluOp::kSrl || op == AluOp::kSra)) {
    std::uniform_int_distribution<uint32_t> shamt(0, 31);
    std::bernoulli_distribution variable(0.5);
    stim.control.mips.shamt = static_cast<uint8_t>(shamt(rng_));
    stim.control.mips.variable_shift = variable(rng_);
  }
  return stim;
}

Transaction Generator::Annotate(const Stimulus& stim) {
  Transaction txn;
  txn.seq = next_seq_++;
  txn.width = model_.Width();
  txn.a = stim.a & WidthMask(txn.width);
  txn.b = stim.b & WidthMask(txn.width);
  txn.control = stim.control;
  txn.prediction = model_.Evaluate(txn.a, txn.b, txn.control);
  return txn;
}

}  // namespace alucheck
