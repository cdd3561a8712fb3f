#include "model/alu_op.h"

#include <cctype>
#include <string>

namespace alucheck {

static AluOp DecodeFlat(uint8_t opcode) {
  switch (static_cast<FlatOpcode>(opcode)) {
    case FlatOpcode::kAdd:
      return AluOp::kAdd;
    case FlatOpcode::kSub:
      return AluOp::kSub;
    case FlatOpcode::kAnd:
      return AluOp::kAnd;
    case FlatOpcode::kOr:
      return AluOp::kOr;
    case FlatOpcode::kXor:
      return AluOp::kXor;
    case FlatOpcode::kNot:
      return AluOp::kNot;
    case FlatOpcode::kShl:
      return AluOp::kSll;
    case FlatOpcode::kShr:
      return AluOp::kSrl;
  }
  return AluOp::kNone;
}

static AluOp DecodeMipsShift(uint8_t func) {
  switch (static_cast<MipsShiftFunc>(func)) {
    case MipsShiftFunc::kSll:
      return AluOp::kSll;
    case MipsShiftFunc::kSrl:
      return AluOp::kSrl;
    case MipsShiftFunc::kSra:
      return AluOp::kSra;
  }
  return AluOp::kNone;
}

static AluOp DecodeMipsLogic(uint8_t func) {
  switch (static_cast<MipsLogicFunc>(func)) {
    case MipsLogicFunc::kAnd:
      return AluOp::kAnd;
    case MipsLogicFunc::kOr:
      return AluOp::kOr;
    case MipsLogicFunc::kXor:
      return AluOp::kXor;
    case MipsLogicFunc::kNor:
      return AluOp::kNor;
  }
  return AluOp::kNone;
}

static AluOp DecodeMips(const MipsFields& f) {
  switch (static_cast<MipsClass>(f.alu_class)) {
    case MipsClass::kArith:
      return f.sub ? AluOp::kSub : AluOp::kAdd;
    case MipsClass::kLogic:
      return DecodeMipsLogic(f.logic_func);
    case MipsClass::kShift:
      return DecodeMipsShift(f.shift_func);
    case MipsClass::kSlt:
      return AluOp::kSlt;
  }
  return AluOp::kNone;
}

AluOp DecodeOp(const AluControl& control) {
  switch (control.variant) {
    case AluVariant::kFlat:
      return DecodeFlat(control.opcode);
    case AluVariant::kMips:
      return DecodeMips(control.mips);
  }
  return AluOp::kNone;
}

// --- Encoding ---

static std::optional<AluControl> EncodeFlat(AluOp op) {
  AluControl ctl;
  ctl.variant = AluVariant::kFlat;
  FlatOpcode opc;
  switch (op) {
    case AluOp::kAdd:
      opc = FlatOpcode::kAdd;
      break;
    case AluOp::kSub:
      opc = FlatOpcode::kSub;
      break;
    case AluOp::kAnd:
      opc = FlatOpcode::kAnd;
      break;
    case AluOp::kOr:
      opc = FlatOpcode::kOr;
      break;
    case AluOp::kXor:
      opc = FlatOpcode::kXor;
      break;
    case AluOp::kNot:
      opc = FlatOpcode::kNot;
      break;
    case AluOp::kSll:
      opc = FlatOpcode::kShl;
      break;
    case AluOp::kSrl:
      opc = FlatOpcode::kShr;
      break;
    default:
      return std::nullopt;
  }
  ctl.opcode = static_cast<uint8_t>(opc);
  return ctl;
}

static MipsFields LogicFields(MipsLogicFunc func) {
  MipsFields f;
  f.alu_class = static_cast<uint8_t>(MipsClass::kLogic);
  f.logic_func = static_cast<uint8_t>(func);
  return f;
}

static MipsFields ShiftFields(MipsShiftFunc func) {
  MipsFields f;
  f.alu_class = static_cast<uint8_t>(MipsClass::kShift);
  f.shift_func = static_cast<uint8_t>(func);
  return f;
}

static std::optional<MipsFields> EncodeMipsFields(AluOp op) {
  MipsFields f;
  switch (op) {
    case AluOp::kAdd:
      f.alu_class = static_cast<uint8_t>(MipsClass::kArith);
      return f;
    case AluOp::kSub:
      f.alu_class = static_cast<uint8_t>(MipsClass::kArith);
      f.sub = true;
      return f;
    case AluOp::kAnd:
      return LogicFields(MipsLogicFunc::kAnd);
    case AluOp::kOr:
      return LogicFields(MipsLogicFunc::kOr);
    case AluOp::kXor:
      return LogicFields(MipsLogicFunc::kXor);
    case AluOp::kNor:
      return LogicFields(MipsLogicFunc::kNor);
    case AluOp::kSll:
      return ShiftFields(MipsShiftFunc::kSll);
    case AluOp::kSrl:
      return ShiftFields(MipsShiftFunc::kSrl);
    case AluOp::kSra:
      return ShiftFields(MipsShiftFunc::kSra);
    case AluOp::kSlt:
      f.alu_class = static_cast<uint8_t>(MipsClass::kSlt);
      return f;
    default:
      return std::nullopt;
  }
}

std::optional<AluControl> EncodeOp(AluOp op, AluVariant variant) {
  if (variant == AluVariant::kFlat) return EncodeFlat(op);
  auto fields = EncodeMipsFields(op);
  if (!fields) return std::nullopt;
  AluControl ctl;
  ctl.variant = AluVariant::kMips;
  ctl.mips = *fields;
  return ctl;
}

const std::vector<AluOp>& ValidOps(AluVariant variant) {
  static const std::vector<AluOp> kFlatOps = {
      AluOp::kAdd, AluOp::kSub, AluOp::kAnd, AluOp::kOr,
      AluOp::kXor, AluOp::kNot, AluOp::kSll, AluOp::kSrl,
  };
  static const std::vector<AluOp> kMipsOps = {
      AluOp::kSll, AluOp::kSrl, AluOp::kSra, AluOp::kAnd, AluOp::kOr,
      AluOp::kXor, AluOp::kNor, AluOp::kSlt, AluOp::kAdd, AluOp::kSub,
  };
  return variant == AluVariant::kFlat ? kFlatOps : kMipsOps;
}

uint32_t PackControl(const AluControl& control) {
  if (control.variant == AluVariant::kFlat) return control.opcode;
  const auto& f = control.mips;
  uint32_t packed = f.alu_class & 0x3u;
  packed |= (f.shift_func & 0x3u) << 2;
  packed |= (f.logic_func & 0x3u) << 4;
  packed |= (f.sub ? 1u : 0u) << 6;
  packed |= (f.variable_shift ? 1u : 0u) << 7;
  packed |= (f.shamt & 0x1Fu) << 8;
  return packed;
}

// --- Names ---

std::string_view OpName(AluOp op) {
  switch (op) {
    case AluOp::kNone:
      return "NONE";
    case AluOp::kAdd:
      return "ADD";
    case AluOp::kSub:
      return "SUB";
    case AluOp::kAnd:
      return "AND";
    case AluOp::kOr:
      return "OR";
    case AluOp::kXor:
      return "XOR";
    case AluOp::kNor:
      return "NOR";
    case AluOp::kNot:
      return "NOT";
    case AluOp::kSll:
      return "SLL";
    case AluOp::kSrl:
      return "SRL";
    case AluOp::kSra:
      return "SRA";
    case AluOp::kSlt:
      return "SLT";
  }
  return "UNKNOWN";
}

std::string_view VariantName(AluVariant variant) {
  switch (variant) {
    case AluVariant::kFlat:
      return "flat";
    case AluVariant::kMips:
      return "mips";
  }
  return "unknown";
}

bool ParseVariant(std::string_view str, AluVariant& out) {
  if (str == "flat") {
    out = AluVariant::kFlat;
  } else if (str == "mips") {
    out = AluVariant::kMips;
  } else {
    return false;
  }
  return true;
}

bool ParseOpName(std::string_view str, AluOp& out) {
  std::string upper;
  upper.reserve(str.size());
  for (char c : str) {
    upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  // SHL/SHR are the flat ALU's names for the logical shifts.
  if (upper == "SHL") upper = "SLL";
  if (upper == "SHR") upper = "SRL";
  for (auto op : {AluOp::kAdd, AluOp::kSub, AluOp::kAnd, AluOp::kOr,
                  AluOp::kXor, AluOp::kNor, AluOp::kNot, AluOp::kSll,
                  AluOp::kSrl, AluOp::kSra, AluOp::kSlt}) {
    if (OpName(op) == upper) {
      out = op;
      return true;
    }
  }
  return false;
}

}  // namespace alucheck
