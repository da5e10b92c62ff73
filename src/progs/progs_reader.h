#pragma once

#include <QByteArray>
#include <QtGlobal>

#include "progs/progs_error.h"

class QIODevice;

// Sequential little-endian reader over a seekable device.
// Every read either consumes exactly the requested bytes or fails with
// TruncatedInput.
class ProgsReader {
public:
  explicit ProgsReader(QIODevice* device);

  [[nodiscard]] qint64 pos() const;
  [[nodiscard]] qint64 size() const;

  [[nodiscard]] bool seek(qint64 pos, ProgsError* error);
  [[nodiscard]] bool read_bytes(qint64 count, QByteArray* out, ProgsError* error);

  [[nodiscard]] bool read_u8(quint8* out, ProgsError* error);
  [[nodiscard]] bool read_u16(quint16* out, ProgsError* error);
  [[nodiscard]] bool read_i16(qint16* out, ProgsError* error);
  [[nodiscard]] bool read_u32(quint32* out, ProgsError* error);
  [[nodiscard]] bool read_i32(qint32* out, ProgsError* error);
  [[nodiscard]] bool read_f32(float* out, ProgsError* error);

private:
  bool read_exact(char* dst, int count, ProgsError* error);

  QIODevice* device_ = nullptr;
};

// Explicit-position reads from an in-memory buffer. They return false when
// the requested bytes do not lie entirely inside the buffer.
[[nodiscard]] bool read_u16_le(const QByteArray& bytes, qint64 offset, quint16* out);
[[nodiscard]] bool read_u32_le(const QByteArray& bytes, qint64 offset, quint32* out);
[[nodiscard]] bool read_i32_le(const QByteArray& bytes, qint64 offset, qint32* out);
[[nodiscard]] bool read_f32_le(const QByteArray& bytes, qint64 offset, float* out);
