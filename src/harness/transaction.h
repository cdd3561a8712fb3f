#pragma once

#include <cstdint>

#include "common/types.h"
#include "model/alu_model.h"
#include "model/alu_op.h"

namespace alucheck {

// One unit of stimulus. `prediction` is filled in by the generator before the
// transaction leaves it and is not changed afterwards.
struct Transaction {
  uint64_t seq = 0;  // Issue order, starting at 0.
  uint64_t a = 0;
  uint64_t b = 0;
  AluControl control;
  uint32_t width = 0;
  Prediction prediction;
};

// What the system under evaluation produced. Values are 4-state so that
// unknown or floating bits can be carried to the scoreboard.
struct Observation {
  Logic4Value result;
  Logic4Value zero;      // 1 bit.
  Logic4Value overflow;  // 1 bit.
};

Observation ObservationFromPrediction(const Prediction& p, uint32_t width);

struct VerdictRecord {
  Transaction transaction;
  Prediction expected;
  Observation observed;
  bool pass = false;
};

}  // namespace alucheck
