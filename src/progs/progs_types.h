#pragma once

#include <QString>
#include <QtGlobal>

// VM opcodes. The numeric values are the on-disk encoding.
enum class ProgsOp : quint16 {
  Done = 0,
  MulF,
  MulV,
  MulFV,
  MulVF,
  DivF,
  AddF,
  AddV,
  SubF,
  SubV,
  EqF,
  EqV,
  EqS,
  EqE,
  EqFnc,
  NeF,
  NeV,
  NeS,
  NeE,
  NeFnc,
  Le,
  Ge,
  Lt,
  Gt,
  LoadF,
  LoadV,
  LoadS,
  LoadEnt,
  LoadFld,
  LoadFnc,
  Address,
  StoreF,
  StoreV,
  StoreS,
  StoreEnt,
  StoreFld,
  StoreFnc,
  StorePF,
  StorePV,
  StorePS,
  StorePEnt,
  StorePFld,
  StorePFnc,
  Return,
  NotF,
  NotV,
  NotS,
  NotEnt,
  NotFnc,
  If,
  IfNot,
  Call0,
  Call1,
  Call2,
  Call3,
  Call4,
  Call5,
  Call6,
  Call7,
  Call8,
  State,
  Goto,
  And,
  Or,
  BitAnd,
  BitOr,
};

constexpr int kProgsOpCount = 66;

// Value types of definitions and globals. Bad never comes off the wire.
enum class ProgsType : qint16 {
  Bad = -1,
  Void = 0,
  String,
  Float,
  Vector,
  Entity,
  Field,
  Function,
  Pointer,
};

constexpr int kProgsTypeCount = 8;

struct ProgsBinaryOp {
  const char* symbol = nullptr;
  ProgsType result = ProgsType::Bad;
  ProgsType left = ProgsType::Bad;
  ProgsType right = ProgsType::Bad;
};

[[nodiscard]] bool progs_op_from_raw(quint32 raw, ProgsOp* out);
[[nodiscard]] bool progs_type_from_raw(quint32 raw, ProgsType* out);

// Upper-case mnemonic, e.g. "ADD_F" or "CALL3".
[[nodiscard]] QString progs_op_name(ProgsOp op);
// Lower-case type name, e.g. "float".
[[nodiscard]] QString progs_type_name(ProgsType type);

// Returns nullptr for opcodes without a binary-expression rendering.
[[nodiscard]] const ProgsBinaryOp* find_progs_binary_op(ProgsOp op);
