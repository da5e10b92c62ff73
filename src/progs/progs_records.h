#pragma once

#include <QVector>
#include <QtGlobal>

#include "progs/progs_error.h"
#include "progs/progs_types.h"

class ProgsReader;

constexpr int kProgsMaxParms = 8;
constexpr int kProgsFunctionRecordSize = 7 * 4 + kProgsMaxParms;
constexpr int kProgsStatementRecordSize = 8;
constexpr int kProgsDefinitionRecordSize = 8;
constexpr quint16 kProgsDefSaveGlobal = 0x8000;

struct ProgsFunction {
  qint32 first_statement = 0;  // <= 0 marks a builtin.
  quint32 parm_start = 0;
  quint32 locals = 0;
  quint32 profile = 0;
  quint32 s_name = 0;
  quint32 s_file = 0;
  QVector<quint8> parm_size;  // One entry per declared parameter.

  [[nodiscard]] bool is_builtin() const { return first_statement <= 0; }
  [[nodiscard]] int num_parms() const { return parm_size.size(); }
};

struct ProgsStatement {
  ProgsOp op = ProgsOp::Done;
  qint16 a = 0;
  qint16 b = 0;
  qint16 c = 0;
};

struct ProgsDefinition {
  ProgsType type = ProgsType::Bad;
  bool save_global = false;
  quint16 ofs = 0;
  qint32 s_name = 0;
};

// Splits a packed definition type into its type and save-global flag.
[[nodiscard]] bool unpack_progs_definition_type(quint16 packed,
                                                ProgsType* type,
                                                bool* save_global,
                                                ProgsError* error = nullptr);

[[nodiscard]] bool read_progs_function(ProgsReader& reader, ProgsFunction* out, ProgsError* error);
[[nodiscard]] bool read_progs_statement(ProgsReader& reader, ProgsStatement* out, ProgsError* error);
[[nodiscard]] bool read_progs_definition(ProgsReader& reader, ProgsDefinition* out, ProgsError* error);
