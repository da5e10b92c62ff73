#include "progs/progs_types.h"

#include <array>

namespace {
constexpr std::array<const char*, kProgsOpCount> kOpNames = {
  "DONE",     "MUL_F",     "MUL_V",      "MUL_FV",     "MUL_VF",    "DIV_F",     "ADD_F",    "ADD_V",
  "SUB_F",    "SUB_V",     "EQ_F",       "EQ_V",       "EQ_S",      "EQ_E",      "EQ_FNC",   "NE_F",
  "NE_V",     "NE_S",      "NE_E",       "NE_FNC",     "LE",        "GE",        "LT",       "GT",
  "LOAD_F",   "LOAD_V",    "LOAD_S",     "LOAD_ENT",   "LOAD_FLD",  "LOAD_FNC",  "ADDRESS",  "STORE_F",
  "STORE_V",  "STORE_S",   "STORE_ENT",  "STORE_FLD",  "STORE_FNC", "STOREP_F",  "STOREP_V", "STOREP_S",
  "STOREP_ENT", "STOREP_FLD", "STOREP_FNC", "RETURN",  "NOT_F",     "NOT_V",     "NOT_S",    "NOT_ENT",
  "NOT_FNC",  "IF",        "IFNOT",      "CALL0",      "CALL1",     "CALL2",     "CALL3",    "CALL4",
  "CALL5",    "CALL6",     "CALL7",      "CALL8",      "STATE",     "GOTO",      "AND",      "OR",
  "BITAND",   "BITOR",
};

constexpr std::array<const char*, kProgsTypeCount> kTypeNames = {
  "void", "string", "float", "vector", "entity", "field", "function", "pointer",
};

struct BinaryOpRow {
  ProgsOp op;
  ProgsBinaryOp info;
};

constexpr ProgsType F = ProgsType::Float;
constexpr ProgsType V = ProgsType::Vector;
constexpr ProgsType S = ProgsType::String;
constexpr ProgsType E = ProgsType::Entity;
constexpr ProgsType FN = ProgsType::Function;

constexpr BinaryOpRow kBinaryOpRows[] = {
  {ProgsOp::AddF, {"+", F, F, F}},
  {ProgsOp::SubF, {"-", F, F, F}},
  {ProgsOp::MulF, {"*", F, F, F}},
  {ProgsOp::DivF, {"/", F, F, F}},
  {ProgsOp::AddV, {"+", V, V, V}},
  {ProgsOp::SubV, {"-", V, V, V}},
  {ProgsOp::MulV, {"*", V, V, V}},
  {ProgsOp::MulVF, {"*vf", V, F, V}},
  {ProgsOp::MulFV, {"*fv", V, V, F}},
  {ProgsOp::BitAnd, {"&", F, F, F}},
  {ProgsOp::BitOr, {"|", F, F, F}},
  {ProgsOp::Ge, {">=", F, F, F}},
  {ProgsOp::Le, {"<=", F, F, F}},
  {ProgsOp::Gt, {">", F, F, F}},
  {ProgsOp::Lt, {"<", F, F, F}},
  {ProgsOp::And, {"&&", F, F, F}},
  {ProgsOp::Or, {"||", F, F, F}},
  {ProgsOp::EqF, {"==", F, F, F}},
  {ProgsOp::EqV, {"==", F, V, V}},
  {ProgsOp::EqS, {"==", F, S, S}},
  {ProgsOp::EqE, {"==", F, E, E}},
  {ProgsOp::EqFnc, {"==", F, FN, FN}},
  {ProgsOp::NeF, {"!=", F, F, F}},
  {ProgsOp::NeV, {"!=", F, V, V}},
  {ProgsOp::NeS, {"!=", F, S, S}},
  {ProgsOp::NeE, {"!=", F, E, E}},
  {ProgsOp::NeFnc, {"!=", F, FN, FN}},
};

// Indexed by opcode; symbol == nullptr marks opcodes without a row.
std::array<ProgsBinaryOp, kProgsOpCount> build_binary_op_table() {
  std::array<ProgsBinaryOp, kProgsOpCount> table{};
  for (const BinaryOpRow& row : kBinaryOpRows) {
    table[static_cast<int>(row.op)] = row.info;
  }
  return table;
}

const std::array<ProgsBinaryOp, kProgsOpCount>& binary_op_table() {
  static const std::array<ProgsBinaryOp, kProgsOpCount> table = build_binary_op_table();
  return table;
}
}  // namespace

bool progs_op_from_raw(quint32 raw, ProgsOp* out) {
  if (raw >= static_cast<quint32>(kProgsOpCount)) {
    return false;
  }
  if (out) {
    *out = static_cast<ProgsOp>(raw);
  }
  return true;
}

bool progs_type_from_raw(quint32 raw, ProgsType* out) {
  if (raw >= static_cast<quint32>(kProgsTypeCount)) {
    return false;
  }
  if (out) {
    *out = static_cast<ProgsType>(raw);
  }
  return true;
}

QString progs_op_name(ProgsOp op) {
  const int idx = static_cast<int>(op);
  if (idx < 0 || idx >= kProgsOpCount) {
    return QString("OP_%1").arg(idx);
  }
  return QString::fromLatin1(kOpNames[idx]);
}

QString progs_type_name(ProgsType type) {
  if (type == ProgsType::Bad) {
    return "bad";
  }
  const int idx = static_cast<int>(type);
  if (idx < 0 || idx >= kProgsTypeCount) {
    return QString("type%1").arg(idx);
  }
  return QString::fromLatin1(kTypeNames[idx]);
}

const ProgsBinaryOp* find_progs_binary_op(ProgsOp op) {
  const int idx = static_cast<int>(op);
  if (idx < 0 || idx >= kProgsOpCount) {
    return nullptr;
  }
  const ProgsBinaryOp& entry = binary_op_table()[idx];
  if (!entry.symbol) {
    return nullptr;
  }
  return &entry;
}
