#include "harness/observer.h"

#include "common/types.h"

namespace alucheck {

namespace {

constexpr Logic4Word kBit0 = {0, 0};
constexpr Logic4Word kBit1 = {1, 0};

Logic4Word BitOf(uint64_t val, uint32_t i) { return {(val >> i) & 1, 0}; }

Logic4Word BitOf(const Logic4Value& val, uint32_t i) {
  return {(val.word.aval >> i) & 1, (val.word.bval >> i) & 1};
}

// Logic4Not flips every bit of the word; keep only bit 0.
Logic4Word Low(Logic4Word w) { return {w.aval & 1, w.bval & 1}; }

void SetBit(Logic4Value& val, uint32_t i, Logic4Word bit) {
  uint64_t m = uint64_t{1} << i;
  val.word.aval = (val.word.aval & ~m) | ((bit.aval & 1) << i);
  val.word.bval = (val.word.bval & ~m) | ((bit.bval & 1) << i);
}

Logic4Value OneBit(Logic4Word bit) {
  Logic4Value v = MakeLogic4Value(1, 0);
  SetBit(v, 0, bit);
  return v;
}

struct RippleResult {
  Logic4Value sum;
  Logic4Word carry_into_msb;
  Logic4Word carry_out;
};

// a + b, or a + ~b + 1 when subtracting.
RippleResult RippleAdd(uint64_t a, uint64_t b, bool subtract, uint32_t width) {
  RippleResult r{MakeLogic4Value(width, 0), kBit0, kBit0};
  Logic4Word carry = subtract ? kBit1 : kBit0;
  for (uint32_t i = 0; i < width; ++i) {
    auto ai = BitOf(a, i);
    auto bi = subtract ? Low(Logic4Not(BitOf(b, i))) : BitOf(b, i);
    auto p = Logic4Xor(ai, bi);
    if (i == width - 1) r.carry_into_msb = carry;
    SetBit(r.sum, i, Logic4Xor(p, carry));
    carry = Low(Logic4Or(Logic4And(ai, bi), Logic4And(carry, p)));
  }
  r.carry_out = carry;
  return r;
}

using BitOp = Logic4Word (*)(Logic4Word, Logic4Word);

Logic4Value Bitwise(uint64_t a, uint64_t b, uint32_t width, BitOp fn,
                    bool invert) {
  auto out = MakeLogic4Value(width, 0);
  for (uint32_t i = 0; i < width; ++i) {
    auto bit = fn(BitOf(a, i), BitOf(b, i));
    SetBit(out, i, invert ? Low(Logic4Not(bit)) : Low(bit));
  }
  return out;
}

Logic4Value ShiftBits(AluOp op, uint64_t val, uint32_t amount, uint32_t width) {
  auto out = MakeLogic4Value(width, 0);
  auto sign = BitOf(val, width - 1);
  for (uint32_t i = 0; i < width; ++i) {
    Logic4Word bit = kBit0;
    if (op == AluOp::kSll) {
      if (i >= amount) bit = BitOf(val, i - amount);
    } else if (i + amount < width) {
      bit = BitOf(val, i + amount);
    } else if (op == AluOp::kSra) {
      bit = sign;
    }
    SetBit(out, i, bit);
  }
  return out;
}

}  // namespace

Logic4Value ZeroFlag(const Logic4Value& value) {
  Logic4Word any = kBit0;
  for (uint32_t i = 0; i < value.width; ++i) {
    any = Low(Logic4Or(any, BitOf(value, i)));
  }
  return OneBit(Low(Logic4Not(any)));
}

// =============================================================================
// ModelObserver
// =============================================================================

Observation ModelObserver::Observe(const Transaction& txn) {
  auto p = model_.Evaluate(txn.a, txn.b, txn.control);
  return ObservationFromPrediction(p, txn.width);
}

// =============================================================================
// BitSerialObserver
// =============================================================================

Observation BitSerialObserver::Observe(const Transaction& txn) {
  uint32_t w = txn.width;
  auto op = DecodeOp(txn.control);
  Observation obs;
  obs.result = MakeLogic4Value(w, 0);
  obs.overflow = OneBit(kBit0);

  switch (op) {
    case AluOp::kAdd:
    case AluOp::kSub: {
      auto r = RippleAdd(txn.a, txn.b, op == AluOp::kSub, w);
      obs.result = r.sum;
      obs.overflow = OneBit(Logic4Xor(r.carry_into_msb, r.carry_out));
      break;
    }
    case AluOp::kSlt: {
      // Less-than is the sign of a - b corrected by its overflow.
      auto r = RippleAdd(txn.a, txn.b, true, w);
      auto v = Logic4Xor(r.carry_into_msb, r.carry_out);
      SetBit(obs.result, 0, Logic4Xor(BitOf(r.sum, w - 1), v));
      break;
    }
    case AluOp::kAnd:
      obs.result = Bitwise(txn.a, txn.b, w, Logic4And, false);
      break;
    case AluOp::kOr:
      obs.result = Bitwise(txn.a, txn.b, w, Logic4Or, false);
      break;
    case AluOp::kXor:
      obs.result = Bitwise(txn.a, txn.b, w, Logic4Xor, false);
      break;
    case AluOp::kNor:
      obs.result = Bitwise(txn.a, txn.b, w, Logic4Or, true);
      break;
    case AluOp::kNot:
      obs.result = Bitwise(txn.a, 0, w, Logic4Or, true);
      break;
    case AluOp::kSll:
    case AluOp::kSrl:
    case AluOp::kSra: {
      uint64_t amount_mask = (uint64_t{1} << ShiftAmountBits(w)) - 1;
      uint64_t value = txn.a;
      uint64_t amount = txn.b;
      if (txn.control.variant == AluVariant::kMips) {
        value = txn.b;
        // The shamt field is five bits wide.
        amount = txn.control.mips.variable_shift
                     ? txn.a
                     : uint64_t{txn.control.mips.shamt & 0x1Fu};
      }
      obs.result =
          ShiftBits(op, value, static_cast<uint32_t>(amount & amount_mask), w);
      break;
    }
    case AluOp::kNone:
      break;
  }
  obs.zero = ZeroFlag(obs.result);
  return obs;
}

// =============================================================================
// FaultInjectingObserver
// =============================================================================

Observation FaultInjectingObserver::Observe(const Transaction& txn) {
  auto obs = inner_->Observe(txn);
  if (target_ != AluOp::kNone && DecodeOp(txn.control) != target_) {
    return obs;
  }
  if (bit_ >= obs.result.width) return obs;

  auto bit = BitOf(obs.result, bit_);
  switch (kind_) {
    case FaultKind::kStuckAt0:
      bit = kBit0;
      break;
    case FaultKind::kStuckAt1:
      bit = kBit1;
      break;
    case FaultKind::kFlip:
      bit = Low(Logic4Not(bit));
      break;
    case FaultKind::kUnknown:
      bit = {0, 1};
      break;
  }
  SetBit(obs.result, bit_, bit);
  obs.zero = ZeroFlag(obs.result);
  ++injected_;
  return obs;
}

}  // namespace alucheck
