#include "common/types.h"

namespace alucheck {

// --- Logic4Word operations ---

Logic4Word Logic4And(Logic4Word a, Logic4Word b) {
  // Truth table: 0&x=0, 1&x=x, x&x=x
  uint64_t a_known_0 = ~a.aval & ~a.bval;
  uint64_t b_known_0 = ~b.aval & ~b.bval;
  uint64_t result_aval = a.aval & b.aval;
  uint64_t any_known_0 = a_known_0 | b_known_0;
  uint64_t result_bval = (a.bval | b.bval) & ~any_known_0;
  return {result_aval & ~result_bval, result_bval};
}

Logic4Word Logic4Or(Logic4Word a, Logic4Word b) {
  // Truth table: 1|x=1, 0|x=x, x|x=x
  uint64_t a_known_1 = a.aval & ~a.bval;
  uint64_t b_known_1 = b.aval & ~b.bval;
  uint64_t result_aval = a.aval | b.aval;
  uint64_t any_known_1 = a_known_1 | b_known_1;
  uint64_t result_bval = (a.bval | b.bval) & ~any_known_1;
  return {result_aval & ~result_bval, result_bval};
}

Logic4Word Logic4Xor(Logic4Word a, Logic4Word b) {
  uint64_t unknown = a.bval | b.bval;
  uint64_t result_aval = a.aval ^ b.aval;
  return {result_aval & ~unknown, unknown};
}

Logic4Word Logic4Not(Logic4Word a) { return {~a.aval & ~a.bval, a.bval}; }

// --- Logic4Value ---

bool Logic4Value::IsKnown() const {
  return (word.bval & WidthMask(width)) == 0;
}

uint64_t Logic4Value::ToUint64() const { return word.aval & WidthMask(width); }

std::string Logic4Value::ToString() const {
  std::string result;
  result.reserve(width);
  for (int32_t i = static_cast<int32_t>(width) - 1; i >= 0; --i) {
    uint64_t mask = uint64_t(1) << i;
    bool a = (word.aval & mask) != 0;
    bool b = (word.bval & mask) != 0;
    if (!b && !a) {
      result += '0';
    } else if (!b && a) {
      result += '1';
    } else if (b && !a) {
      result += 'x';
    } else {
      result += 'z';
    }
  }
  return result;
}

Logic4Value MakeLogic4Value(uint32_t width, uint64_t val) {
  // Mask to declared width to prevent stale upper bits.
  return {width, {val & WidthMask(width), 0}};
}

Logic4Value MakeLogic4X(uint32_t width) {
  return {width, {0, WidthMask(width)}};
}

bool CaseEqual(const Logic4Value& lhs, const Logic4Value& rhs) {
  if (lhs.width != rhs.width) return false;
  uint64_t mask = WidthMask(lhs.width);
  if ((lhs.word.aval & mask) != (rhs.word.aval & mask)) return false;
  if ((lhs.word.bval & mask) != (rhs.word.bval & mask)) return false;
  return true;
}

// --- Width helpers ---

int64_t SignExtend(uint64_t val, uint32_t width) {
  val &= WidthMask(width);
  if (width < 64 && SignBit(val, width)) {
    val |= ~uint64_t{0} << width;
  }
  return static_cast<int64_t>(val);
}

bool IsSupportedWidth(uint32_t width) {
  return width == 8 || width == 16 || width == 32 || width == 64;
}

uint32_t ShiftAmountBits(uint32_t width) {
  uint32_t bits = 0;
  while ((uint32_t{1} << bits) < width) ++bits;
  return bits;
}

}  // namespace alucheck
