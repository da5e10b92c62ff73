#pragma once

#include <QByteArray>
#include <QVector>

#include <optional>

#include "progs/progs_error.h"
#include "progs/progs_records.h"
#include "progs/progs_string_table.h"
#include "progs/progs_types.h"
#include "progs/progs_value.h"

// The globals lump, interpreted on demand by declared type.
class ProgsGlobalBlob {
public:
  ProgsGlobalBlob() = default;
  explicit ProgsGlobalBlob(QByteArray bytes) : bytes_(std::move(bytes)) {}

  [[nodiscard]] qint64 size() const { return bytes_.size(); }
  [[nodiscard]] const QByteArray& bytes() const { return bytes_; }

  [[nodiscard]] bool read_u32(qint64 offset, quint32* out, ProgsError* error = nullptr) const;
  [[nodiscard]] bool read_f32(qint64 offset, float* out, ProgsError* error = nullptr) const;

  // Interprets the bytes at a byte offset as a value of the declared type.
  // Strings resolve through `strings`, function indices through `functions`.
  // Types without a value form, and function indices past the table, give
  // ProgsUnrepresentable rather than an error.
  [[nodiscard]] std::optional<ProgsValue> read(qint64 offset,
                                               ProgsType type,
                                               const ProgsStringTable& strings,
                                               const QVector<ProgsFunction>& functions,
                                               ProgsError* error = nullptr) const;

private:
  QByteArray bytes_;
};
