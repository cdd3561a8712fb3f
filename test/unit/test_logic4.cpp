#include <gtest/gtest.h>

#include "common/types.h"

using namespace alucheck;

TEST(Types, Logic4WordBasicValues) {
  Logic4Word zero = {0, 0};
  Logic4Word one = {1, 0};
  Logic4Word x_val = {0, 1};
  Logic4Word z_val = {1, 1};

  EXPECT_TRUE(zero.IsKnown());
  EXPECT_TRUE(one.IsKnown());
  EXPECT_FALSE(x_val.IsKnown());
  EXPECT_FALSE(z_val.IsKnown());

  EXPECT_TRUE(zero.IsZero());
  EXPECT_TRUE(one.IsOne());
  EXPECT_FALSE(zero.IsOne());
  EXPECT_FALSE(one.IsZero());
}

TEST(Types, Logic4WordAnd) {
  Logic4Word zero = {0, 0};
  Logic4Word one = {1, 0};
  Logic4Word x_val = {0, 1};

  // 1 & 1 = 1
  auto r1 = Logic4And(one, one);
  EXPECT_EQ(r1.aval, 1u);
  EXPECT_EQ(r1.bval, 0u);

  // 0 & x = 0
  auto r2 = Logic4And(zero, x_val);
  EXPECT_EQ(r2.aval, 0u);
  EXPECT_EQ(r2.bval, 0u);

  // 1 & x = x
  auto r3 = Logic4And(one, x_val);
  EXPECT_NE(r3.bval, 0u);
}

TEST(Types, Logic4WordOr) {
  Logic4Word zero = {0, 0};
  Logic4Word one = {1, 0};
  Logic4Word x_val = {0, 1};

  // 1 | x = 1
  auto r1 = Logic4Or(one, x_val);
  EXPECT_EQ(r1.aval, 1u);
  EXPECT_EQ(r1.bval, 0u);

  // 0 | x = x
  auto r2 = Logic4Or(zero, x_val);
  EXPECT_EQ(r2.aval, 0u);
  EXPECT_EQ(r2.bval, 1u);
}

TEST(Types, Logic4WordXorAndNot) {
  Logic4Word one = {1, 0};
  Logic4Word x_val = {0, 1};

  auto r1 = Logic4Xor(one, one);
  EXPECT_TRUE(r1.IsZero());

  auto r2 = Logic4Xor(one, x_val);
  EXPECT_FALSE(r2.IsKnown());

  auto r3 = Logic4Not(one);
  EXPECT_EQ(r3.aval, ~uint64_t(1));  // bit 0: 1->0, bits 1-63: 0->1
  EXPECT_EQ(r3.bval, 0u);
}

TEST(Types, Logic4ValueToString) {
  auto v = MakeLogic4Value(8, 0xA5);
  EXPECT_EQ(v.width, 8u);
  EXPECT_TRUE(v.IsKnown());
  EXPECT_EQ(v.ToUint64(), 0xA5u);
  EXPECT_EQ(v.ToString(), "10100101");

  v.word.bval = 0x3;
  EXPECT_FALSE(v.IsKnown());
  EXPECT_EQ(v.ToString(), "101001xz");
}

TEST(Types, MakeLogic4ValueMasksToWidth) {
  auto v = MakeLogic4Value(8, 0x1FF);
  EXPECT_EQ(v.ToUint64(), 0xFFu);
}

TEST(Types, CaseEqualTreatsUnknownAsMismatch) {
  auto known = MakeLogic4Value(8, 0);
  auto x_all = MakeLogic4X(8);
  EXPECT_TRUE(CaseEqual(known, MakeLogic4Value(8, 0)));
  EXPECT_FALSE(CaseEqual(known, x_all));
  EXPECT_TRUE(CaseEqual(x_all, MakeLogic4X(8)));
  EXPECT_FALSE(CaseEqual(known, MakeLogic4Value(16, 0)));
}

TEST(Types, SignExtend) {
  EXPECT_EQ(SignExtend(0x80, 8), -128);
  EXPECT_EQ(SignExtend(0x7F, 8), 127);
  EXPECT_EQ(SignExtend(0xFFFFFFFF, 32), -1);
  EXPECT_EQ(SignExtend(0x1FF, 8), -1);
  EXPECT_EQ(SignExtend(~uint64_t{0}, 64), -1);
}

TEST(Types, WidthHelpers) {
  EXPECT_EQ(WidthMask(8), 0xFFu);
  EXPECT_EQ(WidthMask(64), ~uint64_t{0});
  EXPECT_TRUE(IsSupportedWidth(8));
  EXPECT_TRUE(IsSupportedWidth(64));
  EXPECT_FALSE(IsSupportedWidth(0));
  EXPECT_FALSE(IsSupportedWidth(12));
  EXPECT_EQ(ShiftAmountBits(8), 3u);
  EXPECT_EQ(ShiftAmountBits(32), 5u);
  EXPECT_EQ(ShiftAmountBits(64), 6u);
}
