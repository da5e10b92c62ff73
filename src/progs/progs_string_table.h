#pragma once

#include <QByteArray>
#include <QString>

#include <optional>

#include "progs/progs_error.h"

// The strings lump: NUL-separated ASCII text addressed by byte offset.
class ProgsStringTable {
public:
  ProgsStringTable() = default;
  explicit ProgsStringTable(QByteArray bytes) : bytes_(std::move(bytes)) {}

  [[nodiscard]] qint64 size() const { return bytes_.size(); }
  [[nodiscard]] const QByteArray& bytes() const { return bytes_; }

  // Text from offset up to the next NUL, or to the end of the table when
  // there is none. Offsets outside the table fail with BadOffset.
  [[nodiscard]] std::optional<QString> resolve(qint64 offset, ProgsError* error = nullptr) const;

private:
  QByteArray bytes_;
};
