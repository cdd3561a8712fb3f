#include "harness/transaction.h"

namespace alucheck {

Observation ObservationFromPrediction(const Prediction& p, uint32_t width) {
  return {MakeLogic4Value(width, p.result), MakeLogic4Value(1, p.zero ? 1 : 0),
          MakeLogic4Value(1, p.overflow ? 1 : 0)};
}

}  // namespace alucheck
