#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace alucheck {

// --- ALU variants ---
// kFlat: 3-bit opcode ALU (the 8-bit teaching ALU).
// kMips: class/shift-function/logic-function control fields (32-bit MIPS
//        datapath ALU).

enum class AluVariant : uint8_t {
  kFlat,
  kMips,
};

// --- Decoded operation ---
// Both control encodings decode into this one set so the two variants share
// a single execution path.

enum class AluOp : uint8_t {
  kNone,
  kAdd,
  kSub,
  kAnd,
  kOr,
  kXor,
  kNor,
  kNot,
  kSll,
  kSrl,
  kSra,
  kSlt,
};

// --- Flat encoding ---

enum class FlatOpcode : uint8_t {
  kAdd = 0,
  kSub = 1,
  kAnd = 2,
  kOr = 3,
  kXor = 4,
  kNot = 5,
  kShl = 6,
  kShr = 7,
};

// --- MIPS encoding ---

enum class MipsClass : uint8_t {
  kArith = 0,  // ADD, or SUB when the sub bit is set.
  kLogic = 1,
  kShift = 2,
  kSlt = 3,
};

// Encoding 2 is unassigned and decodes to kNone.
enum class MipsShiftFunc : uint8_t {
  kSll = 0,
  kSrl = 1,
  kSra = 3,
};

enum class MipsLogicFunc : uint8_t {
  kAnd = 0,
  kOr = 1,
  kXor = 2,
  kNor = 3,
};

// Raw field values; anything outside the enumerations above is representable
// and decodes to kNone.
struct MipsFields {
  uint8_t alu_class = 0;
  uint8_t shift_func = 0;
  uint8_t logic_func = 0;
  bool sub = false;
  bool variable_shift = false;  // Shift amount from operand A, not shamt.
  uint8_t shamt = 0;            // 5-bit constant shift amount.
};

struct AluControl {
  AluVariant variant = AluVariant::kFlat;
  uint8_t opcode = 0;  // kFlat only.
  MipsFields mips;     // kMips only.
};

AluOp DecodeOp(const AluControl& control);

/// Build the control word selecting `op` in `variant`. Returns nullopt when
/// the variant has no encoding for the operation.
std::optional<AluControl> EncodeOp(AluOp op, AluVariant variant);

/// Operations a variant can select, in encoding order.
const std::vector<AluOp>& ValidOps(AluVariant variant);

/// Control word as one integer for report lines. kFlat: the opcode.
/// kMips: class[1:0] shift_func[3:2] logic_func[5:4] sub[6] variable[7]
/// shamt[12:8].
uint32_t PackControl(const AluControl& control);

std::string_view OpName(AluOp op);
std::string_view VariantName(AluVariant variant);
bool ParseVariant(std::string_view str, AluVariant& out);
bool ParseOpName(std::string_view str, AluOp& out);

}  // namespace alucheck
