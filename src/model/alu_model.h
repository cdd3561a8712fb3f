#pragma once

#include <cstdint>
#include <optional>

#include "model/alu_op.h"

namespace alucheck {

class DiagEngine;

// Golden-model output for one evaluation. Always fully known (2-state).
struct Prediction {
  uint64_t result = 0;
  bool zero = true;
  bool overflow = false;

  bool operator==(const Prediction& o) const {
    return result == o.result && zero == o.zero && overflow == o.overflow;
  }
};

// Shift operands after the variant's operand routing has been applied.
struct ShiftOperands {
  uint64_t value = 0;
  uint32_t amount = 0;
};

// =============================================================================
// AluModel: stateless golden model of one ALU variant at one width
// =============================================================================
//
// All arithmetic wraps modulo 2^width. Evaluate() is total: any control word
// that does not decode to an operation yields result 0, zero set, overflow
// clear. The object holds only its configuration, so one instance may be
// shared by any number of threads.

class AluModel {
 public:
  /// Returns nullopt, after reporting through `diag`, when the width is not
  /// one of 8, 16, 32 or 64.
  static std::optional<AluModel> Create(AluVariant variant, uint32_t width,
                                        DiagEngine& diag);

  Prediction Evaluate(uint64_t a, uint64_t b, const AluControl& control) const;

  /// Routes operands for a shift. kFlat shifts A by B; kMips shifts B by the
  /// shamt field, or by A when variable_shift is set. The amount is reduced
  /// to log2(width) bits.
  ShiftOperands RouteShift(uint64_t a, uint64_t b,
                           const AluControl& control) const;

  AluVariant Variant() const { return variant_; }
  uint32_t Width() const { return width_; }

  /// Only the MIPS ALU exposes its overflow output.
  bool HasOverflowOutput() const { return variant_ == AluVariant::kMips; }

 private:
  AluModel(AluVariant variant, uint32_t width)
      : variant_(variant), width_(width) {}

  AluVariant variant_;
  uint32_t width_;
};

/// Execute a decoded operation. For shifts, `a` is the shifted value and `b`
/// the amount, taken modulo `width`; for kNot `b` is a don't-care.
Prediction ExecuteOp(AluOp op, uint64_t a, uint64_t b, uint32_t width);

bool AddOverflows(uint64_t a, uint64_t b, uint64_t sum, uint32_t width);
bool SubOverflows(uint64_t a, uint64_t b, uint64_t diff, uint32_t width);

}  // namespace alucheck
