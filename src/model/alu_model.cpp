#include "model/alu_model.h"

#include <format>

#include "common/diagnostic.h"
#include "common/types.h"

namespace alucheck {

// --- Overflow rules (two's-complement, not carry-out) ---

bool AddOverflows(uint64_t a, uint64_t b, uint64_t sum, uint32_t width) {
  bool sa = SignBit(a, width);
  return sa == SignBit(b, width) && SignBit(sum, width) != sa;
}

bool SubOverflows(uint64_t a, uint64_t b, uint64_t diff, uint32_t width) {
  bool sa = SignBit(a, width);
  return sa != SignBit(b, width) && SignBit(diff, width) != sa;
}

// --- Reduction ---

static bool ReduceOr(uint64_t val, uint32_t width) {
  return (val & WidthMask(width)) != 0;
}

// --- Execution ---

static uint64_t ShiftRightArith(uint64_t val, uint32_t amount, uint32_t width) {
  auto sv = SignExtend(val, width);
  return static_cast<uint64_t>(sv >> amount) & WidthMask(width);
}

Prediction ExecuteOp(AluOp op, uint64_t a, uint64_t b, uint32_t width) {
  uint64_t mask = WidthMask(width);
  a &= mask;
  b &= mask;
  uint64_t result = 0;
  bool overflow = false;

  switch (op) {
    case AluOp::kAdd:
      result = (a + b) & mask;
      overflow = AddOverflows(a, b, result, width);
      break;
    case AluOp::kSub:
      // Subtraction is addition of the two's-complement negation.
      result = (a + ((~b + 1) & mask)) & mask;
      overflow = SubOverflows(a, b, result, width);
      break;
    case AluOp::kAnd:
      result = a & b;
      break;
    case AluOp::kOr:
      result = a | b;
      break;
    case AluOp::kXor:
      result = a ^ b;
      break;
    case AluOp::kNor:
      result = ~(a | b) & mask;
      break;
    case AluOp::kNot:
      result = ~a & mask;
      break;
    case AluOp::kSll:
      result = (a << (b & (width - 1))) & mask;
      break;
    case AluOp::kSrl:
      result = a >> (b & (width - 1));
      break;
    case AluOp::kSra:
      result = ShiftRightArith(a, static_cast<uint32_t>(b & (width - 1)),
                               width);
      break;
    case AluOp::kSlt:
      result = (SignExtend(a, width) < SignExtend(b, width)) ? 1 : 0;
      break;
    case AluOp::kNone:
      break;
  }
  return {result, !ReduceOr(result, width), overflow};
}

// =============================================================================
// AluModel
// =============================================================================

std::optional<AluModel> AluModel::Create(AluVariant variant, uint32_t width,
                                         DiagEngine& diag) {
  if (variant != AluVariant::kFlat && variant != AluVariant::kMips) {
    diag.Error("model", "invalid configuration: unknown ALU variant");
    return std::nullopt;
  }
  if (!IsSupportedWidth(width)) {
    diag.Error("model",
               std::format("invalid configuration: unsupported width {} "
                           "(expected 8, 16, 32 or 64)",
                           width));
    return std::nullopt;
  }
  return AluModel(variant, width);
}

ShiftOperands AluModel::RouteShift(uint64_t a, uint64_t b,
                                   const AluControl& control) const {
  uint32_t amount_mask = width_ - 1;
  if (control.variant == AluVariant::kFlat) {
    return {a, static_cast<uint32_t>(b) & amount_mask};
  }
  uint32_t amount = control.mips.variable_shift
                        ? static_cast<uint32_t>(a)
                        : static_cast<uint32_t>(control.mips.shamt & 0x1F);
  return {b, amount & amount_mask};
}

Prediction AluModel::Evaluate(uint64_t a, uint64_t b,
                              const AluControl& control) const {
  // A control word for the other variant is an unrecognized encoding.
  if (control.variant != variant_) return ExecuteOp(AluOp::kNone, 0, 0, width_);

  auto op = DecodeOp(control);
  switch (op) {
    case AluOp::kSll:
    case AluOp::kSrl:
    case AluOp::kSra: {
      auto shift = RouteShift(a, b, control);
      return ExecuteOp(op, shift.value, shift.amount, width_);
    }
    default:
      return ExecuteOp(op, a, b, width_);
  }
}

}  // namespace alucheck
