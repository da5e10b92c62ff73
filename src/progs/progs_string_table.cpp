#include "progs/progs_string_table.h"

std::optional<QString> ProgsStringTable::resolve(qint64 offset, ProgsError* error) const {
  if (offset < 0 || offset >= bytes_.size()) {
    fail_progs(error,
               ProgsErrorKind::BadOffset,
               QString("String offset %1 is outside the string table (%2 bytes).").arg(offset).arg(bytes_.size()));
    return std::nullopt;
  }
  const qint64 nul = bytes_.indexOf('\0', offset);
  const qint64 end = nul >= 0 ? nul : bytes_.size();
  return QString::fromLatin1(bytes_.constData() + offset, end - offset);
}
