#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

#include "harness/transaction.h"
#include "model/alu_model.h"

namespace alucheck {

// =============================================================================
// Observer: the system under evaluation
// =============================================================================
//
// Applies a transaction's inputs and returns what came out. The harness calls
// Observe() from a single thread, in issue order.

class Observer {
 public:
  virtual ~Observer() = default;

  virtual Observation Observe(const Transaction& txn) = 0;
  virtual std::string_view Name() const = 0;
};

// Re-evaluates through its own AluModel instance.
class ModelObserver : public Observer {
 public:
  explicit ModelObserver(const AluModel& model) : model_(model) {}

  Observation Observe(const Transaction& txn) override;
  std::string_view Name() const override { return "model"; }

 private:
  AluModel model_;
};

// Evaluates one bit at a time on 4-state bits: ripple-carry add/subtract,
// overflow from the carries into and out of the sign bit, SLT from the
// sign of the difference, shifts as bit moves and zero as a NOR reduction.
class BitSerialObserver : public Observer {
 public:
  Observation Observe(const Transaction& txn) override;
  std::string_view Name() const override { return "bitserial"; }
};

enum class FaultKind : uint8_t {
  kStuckAt0,
  kStuckAt1,
  kFlip,
  kUnknown,  // Drive the bit to x.
};

// Wraps another observer and corrupts one result bit whenever the decoded
// operation matches `target` (kNone matches every operation). The zero flag
// is re-derived from the corrupted result.
class FaultInjectingObserver : public Observer {
 public:
  FaultInjectingObserver(std::unique_ptr<Observer> inner, AluOp target,
                         FaultKind kind, uint32_t bit)
      : inner_(std::move(inner)), target_(target), kind_(kind), bit_(bit) {}

  Observation Observe(const Transaction& txn) override;
  std::string_view Name() const override { return "fault"; }

  uint64_t InjectedCount() const { return injected_; }

 private:
  std::unique_ptr<Observer> inner_;
  AluOp target_;
  FaultKind kind_;
  uint32_t bit_;
  uint64_t injected_ = 0;
};

class CallbackObserver : public Observer {
 public:
  using Callback = std::function<Observation(const Transaction&)>;

  explicit CallbackObserver(Callback fn) : fn_(std::move(fn)) {}

  Observation Observe(const Transaction& txn) override { return fn_(txn); }
  std::string_view Name() const override { return "callback"; }

 private:
  Callback fn_;
};

/// 4-state zero detection: 1 when every bit is 0, 0 when any bit is 1,
/// x otherwise.
Logic4Value ZeroFlag(const Logic4Value& value);

}  // namespace alucheck
