#include "progs/progs_records.h"

#include <QDebug>

#include "progs/progs_reader.h"

bool unpack_progs_definition_type(quint16 packed, ProgsType* type, bool* save_global, ProgsError* error) {
  const quint16 raw_type = static_cast<quint16>(packed & ~kProgsDefSaveGlobal);
  ProgsType decoded = ProgsType::Bad;
  if (!progs_type_from_raw(raw_type, &decoded)) {
    return fail_progs(error,
                      ProgsErrorKind::InvalidEnumValue,
                      QString("Invalid definition type %1 (packed 0x%2).")
                        .arg(raw_type)
                        .arg(packed, 4, 16, QLatin1Char('0')));
  }
  if (type) {
    *type = decoded;
  }
  if (save_global) {
    *save_global = (packed & kProgsDefSaveGlobal) != 0;
  }
  return true;
}

bool read_progs_function(ProgsReader& reader, ProgsFunction* out, ProgsError* error) {
  if (!out) {
    return false;
  }

  ProgsFunction fn;
  quint32 num_parms = 0;
  if (!reader.read_i32(&fn.first_statement, error) ||
      !reader.read_u32(&fn.parm_start, error) ||
      !reader.read_u32(&fn.locals, error) ||
      !reader.read_u32(&fn.profile, error) ||
      !reader.read_u32(&fn.s_name, error) ||
      !reader.read_u32(&fn.s_file, error) ||
      !reader.read_u32(&num_parms, error)) {
    return false;
  }

  quint8 sizes[kProgsMaxParms]{};
  for (quint8& size : sizes) {
    if (!reader.read_u8(&size, error)) {
      return false;
    }
  }

  if (num_parms > static_cast<quint32>(kProgsMaxParms)) {
    qWarning().noquote() << QString("ProgsLoader: function declares %1 parameters, keeping the first %2")
                              .arg(num_parms)
                              .arg(kProgsMaxParms);
    num_parms = kProgsMaxParms;
  }

  fn.parm_size.reserve(static_cast<int>(num_parms));
  for (quint32 i = 0; i < num_parms; ++i) {
    fn.parm_size.push_back(sizes[i]);
  }

  *out = std::move(fn);
  return true;
}

bool read_progs_statement(ProgsReader& reader, ProgsStatement* out, ProgsError* error) {
  if (!out) {
    return false;
  }

  const qint64 at = reader.pos();
  quint16 raw_op = 0;
  ProgsStatement st;
  if (!reader.read_u16(&raw_op, error) ||
      !reader.read_i16(&st.a, error) ||
      !reader.read_i16(&st.b, error) ||
      !reader.read_i16(&st.c, error)) {
    return false;
  }

  if (!progs_op_from_raw(raw_op, &st.op)) {
    return fail_progs(error,
                      ProgsErrorKind::InvalidEnumValue,
                      QString("Invalid opcode %1 at offset %2.").arg(raw_op).arg(at));
  }

  *out = st;
  return true;
}

bool read_progs_definition(ProgsReader& reader, ProgsDefinition* out, ProgsError* error) {
  if (!out) {
    return false;
  }

  const qint64 at = reader.pos();
  quint16 packed = 0;
  ProgsDefinition def;
  if (!reader.read_u16(&packed, error) ||
      !reader.read_u16(&def.ofs, error) ||
      !reader.read_i32(&def.s_name, error)) {
    return false;
  }

  if (!unpack_progs_definition_type(packed, &def.type, &def.save_global, error)) {
    prefix_progs_error(error, QString("Definition at offset %1").arg(at));
    return false;
  }

  *out = def;
  return true;
}
