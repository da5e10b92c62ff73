#include "progs/progs_header.h"

#include "progs/progs_reader.h"

QString progs_lump_name(ProgsLumpId id) {
  switch (id) {
    case ProgsLumpId::Statements:
      return "statements";
    case ProgsLumpId::GlobalDefs:
      return "global_defs";
    case ProgsLumpId::FieldDefs:
      return "field_defs";
    case ProgsLumpId::Functions:
      return "functions";
    case ProgsLumpId::Strings:
      return "strings";
    case ProgsLumpId::Globals:
      return "globals";
  }
  return "unknown";
}

bool parse_progs_header(ProgsReader& reader, ProgsHeader* out, ProgsError* error) {
  if (!out) {
    return false;
  }

  ProgsHeader header;
  if (!reader.read_u32(&header.version, error) || !reader.read_u32(&header.crc, error)) {
    prefix_progs_error(error, "Unable to read progs header");
    return false;
  }

  for (int i = 0; i < kProgsLumpCount; ++i) {
    ProgsLump& lump = header.lumps[i];
    if (!reader.read_u32(&lump.offset, error) || !reader.read_u32(&lump.count, error)) {
      prefix_progs_error(error,
                         QString("Unable to read %1 lump entry").arg(progs_lump_name(static_cast<ProgsLumpId>(i))));
      return false;
    }
  }

  *out = header;
  return true;
}
