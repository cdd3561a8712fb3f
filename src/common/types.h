#pragma once

#include <cstdint>
#include <string>

namespace alucheck {

// --- Four-value logic ---
// Dual-rail aval/bval encoding per VPI convention:
//   0: aval=0, bval=0
//   1: aval=1, bval=0
//   x: aval=0, bval=1
//   z: aval=1, bval=1

struct Logic4Word {
  uint64_t aval = 0;
  uint64_t bval = 0;

  bool IsKnown() const { return bval == 0; }
  bool IsZero() const { return aval == 0 && bval == 0; }
  bool IsOne() const { return aval == 1 && bval == 0; }
};

Logic4Word Logic4And(Logic4Word a, Logic4Word b);
Logic4Word Logic4Or(Logic4Word a, Logic4Word b);
Logic4Word Logic4Xor(Logic4Word a, Logic4Word b);
Logic4Word Logic4Not(Logic4Word a);

// A single-word 4-state value of up to 64 bits.
struct Logic4Value {
  uint32_t width = 0;
  Logic4Word word;

  bool IsKnown() const;
  uint64_t ToUint64() const;
  std::string ToString() const;
};

Logic4Value MakeLogic4Value(uint32_t width, uint64_t val);
Logic4Value MakeLogic4X(uint32_t width);

/// Case equality (===): widths, aval and bval must all match.
bool CaseEqual(const Logic4Value& lhs, const Logic4Value& rhs);

// --- Width helpers ---

inline uint64_t WidthMask(uint32_t width) {
  return (width >= 64) ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
}

inline bool SignBit(uint64_t val, uint32_t width) {
  return ((val >> (width - 1)) & 1) != 0;
}

/// Reinterpret the low `width` bits of val as a signed integer.
int64_t SignExtend(uint64_t val, uint32_t width);

/// True for the operand widths the ALU model accepts (8, 16, 32, 64).
bool IsSupportedWidth(uint32_t width);

/// Number of bits needed to hold a shift amount at `width` (log2(width)).
uint32_t ShiftAmountBits(uint32_t width);

}  // namespace alucheck
