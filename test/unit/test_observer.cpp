#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include "common/diagnostic.h"
#include "harness/observer.h"

using namespace alucheck;

namespace {

AluModel MakeModel(AluVariant variant, uint32_t width) {
  std::ostringstream out;
  DiagEngine diag(out);
  return *AluModel::Create(variant, width, diag);
}

Transaction MakeTxn(const AluModel& model, uint64_t a, uint64_t b,
                    const AluControl& ctl) {
  Transaction txn;
  txn.a = a;
  txn.b = b;
  txn.control = ctl;
  txn.width = model.Width();
  txn.prediction = model.Evaluate(a, b, ctl);
  return txn;
}

void ExpectMatches(const Observation& obs, const Prediction& p,
                   uint32_t width) {
  auto want = ObservationFromPrediction(p, width);
  EXPECT_TRUE(CaseEqual(obs.result, want.result))
      << obs.result.ToString() << " vs " << want.result.ToString();
  EXPECT_TRUE(CaseEqual(obs.zero, want.zero));
  EXPECT_TRUE(CaseEqual(obs.overflow, want.overflow));
}

}  // namespace

// =============================================================================
// BitSerialObserver
// =============================================================================

TEST(Observer, BitSerialAgreesWithModelExhaustive8) {
  BitSerialObserver serial;
  for (auto variant : {AluVariant::kFlat, AluVariant::kMips}) {
    auto model = MakeModel(variant, 8);
    for (auto op : ValidOps(variant)) {
      auto ctl = *EncodeOp(op, variant);
      for (uint64_t a = 0; a < 256; ++a) {
        for (uint64_t b = 0; b < 256; ++b) {
          auto txn = MakeTxn(model, a, b, ctl);
          auto obs = serial.Observe(txn);
          auto want = ObservationFromPrediction(txn.prediction, 8);
          ASSERT_TRUE(CaseEqual(obs.result, want.result) &&
                      CaseEqual(obs.zero, want.zero) &&
                      CaseEqual(obs.overflow, want.overflow))
              << OpName(op) << " a=" << a << " b=" << b;
        }
      }
    }
  }
}

TEST(Observer, BitSerialMipsShiftSources) {
  BitSerialObserver serial;
  auto model = MakeModel(AluVariant::kMips, 32);
  auto sra = *EncodeOp(AluOp::kSra, AluVariant::kMips);
  sra.mips.shamt = 1;
  ExpectMatches(serial.Observe(MakeTxn(model, 0, 0x80000000, sra)),
                {0xC0000000, false, false}, 32);

  sra.mips.variable_shift = true;
  auto txn = MakeTxn(model, 0xFFFFFFE3, 0x80000000, sra);
  EXPECT_EQ(txn.prediction.result, 0xF0000000u);
  ExpectMatches(serial.Observe(txn), txn.prediction, 32);
}

TEST(Observer, BitSerialMipsShamtIsFiveBits) {
  BitSerialObserver serial;
  auto model = MakeModel(AluVariant::kMips, 64);
  auto sll = *EncodeOp(AluOp::kSll, AluVariant::kMips);
  for (uint8_t shamt : {32, 33, 63, 255}) {
    sll.mips.shamt = shamt;
    auto txn = MakeTxn(model, 0, 1, sll);
    EXPECT_EQ(txn.prediction.result, uint64_t{1} << (shamt & 0x1F));
    ExpectMatches(serial.Observe(txn), txn.prediction, 64);
  }
}

TEST(Observer, BitSerialWidth64Overflow) {
  BitSerialObserver serial;
  auto model = MakeModel(AluVariant::kMips, 64);
  auto sub = *EncodeOp(AluOp::kSub, AluVariant::kMips);
  auto txn = MakeTxn(model, 0x8000000000000000ull, 1, sub);
  EXPECT_TRUE(txn.prediction.overflow);
  ExpectMatches(serial.Observe(txn), txn.prediction, 64);
}

TEST(Observer, ModelObserverEchoesPrediction) {
  auto model = MakeModel(AluVariant::kFlat, 8);
  ModelObserver observer(model);
  auto txn = MakeTxn(model, 0x7F, 0x01, *EncodeOp(AluOp::kAdd,
                                                  AluVariant::kFlat));
  ExpectMatches(observer.Observe(txn), txn.prediction, 8);
}

// =============================================================================
// FaultInjectingObserver
// =============================================================================

TEST(Observer, FlipFaultOnTargetOpOnly) {
  auto model = MakeModel(AluVariant::kFlat, 8);
  FaultInjectingObserver faulty(std::make_unique<ModelObserver>(model),
                                AluOp::kAdd, FaultKind::kFlip, 0);
  auto add = MakeTxn(model, 5, 3, *EncodeOp(AluOp::kAdd, AluVariant::kFlat));
  auto obs = faulty.Observe(add);
  EXPECT_EQ(obs.result.ToUint64(), 9u);

  auto sub = MakeTxn(model, 5, 3, *EncodeOp(AluOp::kSub, AluVariant::kFlat));
  EXPECT_EQ(faulty.Observe(sub).result.ToUint64(), 2u);
  EXPECT_EQ(faulty.InjectedCount(), 1u);
}

TEST(Observer, StuckAtRederivesZeroFlag) {
  auto model = MakeModel(AluVariant::kFlat, 8);
  FaultInjectingObserver faulty(std::make_unique<ModelObserver>(model),
                                AluOp::kNone, FaultKind::kStuckAt1, 7);
  auto txn = MakeTxn(model, 3, 3, *EncodeOp(AluOp::kSub, AluVariant::kFlat));
  auto obs = faulty.Observe(txn);
  EXPECT_EQ(obs.result.ToUint64(), 0x80u);
  EXPECT_TRUE(CaseEqual(obs.zero, MakeLogic4Value(1, 0)));
}

TEST(Observer, UnknownFaultPropagatesToZeroFlag) {
  auto model = MakeModel(AluVariant::kFlat, 8);
  FaultInjectingObserver faulty(std::make_unique<ModelObserver>(model),
                                AluOp::kNone, FaultKind::kUnknown, 2);
  auto txn = MakeTxn(model, 3, 3, *EncodeOp(AluOp::kSub, AluVariant::kFlat));
  auto obs = faulty.Observe(txn);
  EXPECT_FALSE(obs.result.IsKnown());
  EXPECT_EQ(obs.result.ToString(), "00000x00");
  EXPECT_FALSE(obs.zero.IsKnown());
}

TEST(Observer, ZeroFlagReduction) {
  EXPECT_TRUE(CaseEqual(ZeroFlag(MakeLogic4Value(32, 0)),
                        MakeLogic4Value(1, 1)));
  EXPECT_TRUE(CaseEqual(ZeroFlag(MakeLogic4Value(32, 0x10000)),
                        MakeLogic4Value(1, 0)));
  // A known 1 decides the flag even next to unknown bits.
  Logic4Value mixed = MakeLogic4Value(8, 0x01);
  mixed.word.bval = 0x80;
  EXPECT_TRUE(CaseEqual(ZeroFlag(mixed), MakeLogic4Value(1, 0)));
}

TEST(Observer, CallbackObserverForwards) {
  CallbackObserver cb([](const Transaction& txn) {
    return ObservationFromPrediction({txn.a + 1, false, false}, txn.width);
  });
  Transaction txn;
  txn.a = 41;
  txn.width = 8;
  EXPECT_EQ(cb.Observe(txn).result.ToUint64(), 42u);
}
